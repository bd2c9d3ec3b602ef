#include "DerivationTable.h"
#include "TypeOneConstructions.h"
#include "../geometry/Figure.h"
#include "../theorems/Theorems.h"

#include <algorithm>

namespace geodeduce::core::driver {

using geometry::Figure;

namespace {

bool sharesPoint(const geometry::Segment& a, const geometry::Segment& b) {
    return b.hasEndpoint(a.endpoints()[0]) || b.hasEndpoint(a.endpoints()[1]);
}

void segmentAreaEquivalence(Figure& figure, EntityID segment) {
    for (EntityID triangle : figure.entities(EntityType::Triangle)) {
        const auto altitudes = figure.altitudes(triangle);
        if (std::find(altitudes.begin(), altitudes.end(), figure.resolve(segment)) == altitudes.end()) {
            continue;
        }
        theorems::heronsFormula(figure, triangle);
        theorems::triangleAreaUsingAltitude(figure, triangle, segment);
    }
}

void segmentAngleBisector(Figure& figure, EntityID segment) {
    const EntityID target = figure.resolve(segment);
    const EntityID targetLine = figure.lineThrough(target);

    std::vector<EntityID> triangles;
    for (EntityID triangle : figure.entities(EntityType::Triangle)) {
        for (EntityID bisector : figure.angleBisectors(triangle)) {
            const auto* a = figure.getEntityAs<geometry::Segment>(target);
            const auto* b = figure.getEntityAs<geometry::Segment>(bisector);
            if (sharesPoint(*a, *b) && figure.lineThrough(bisector) != targetLine) {
                triangles.push_back(triangle);
                break;
            }
        }
    }
    for (EntityID triangle : triangles) {
        for (EntityID bisector : figure.angleBisectors(triangle)) {
            theorems::angleBisectorTheorem(figure, triangle, bisector);
        }
    }
}

void segmentPythagorean(Figure& figure, EntityID segment) {
    for (EntityID triangle : figure.trianglesWithSide(segment)) {
        if (figure.rightAngleVertex(triangle)) {
            theorems::pythagoreanTheorem(figure, triangle);
        }
    }
}

void angleStraightLines(Figure& figure, EntityID angle) {
    const auto* target = figure.getEntityAs<geometry::Angle>(angle);
    const EntityID ray1 = target->ray1();
    const EntityID ray2 = target->ray2();
    for (EntityID ray : {ray1, ray2}) {
        const auto* r = figure.getEntityAs<geometry::Ray>(ray);
        theorems::straightAngleTheorem(figure, figure.lineThrough(r->vertex(), r->pointingTo()));
    }
}

void angleTriangleSum(Figure& figure, EntityID angle) {
    for (EntityID triangle : figure.trianglesWithAngle(angle)) {
        theorems::triangleAngleSumTheorem(figure, triangle);
    }
}

void triangleAltitudeAreas(Figure& figure, EntityID triangle) {
    for (EntityID altitude : figure.altitudes(triangle)) {
        theorems::triangleAreaUsingAltitude(figure, triangle, altitude);
    }
}

} // namespace

void DerivationTable::addRule(EntityType type, DerivationRule rule) {
    rules_[type].push_back(std::move(rule));
}

void DerivationTable::addTypeOneRule(TypeOneRule rule) {
    typeOne_.push_back(std::move(rule));
}

const std::vector<DerivationRule>& DerivationTable::rulesFor(EntityType type) const {
    static const std::vector<DerivationRule> kNone;
    auto it = rules_.find(type);
    return it == rules_.end() ? kNone : it->second;
}

DerivationTable DerivationTable::standard() {
    DerivationTable table;

    table.addTypeOneRule({"sub and super triangles", enumerateSubAndSuperTriangles});

    table.addRule(EntityType::Segment, {"subsegment sum", [](Figure& figure, EntityID segment) {
                      theorems::subsegmentSumTheorem(figure, figure.lineThrough(segment));
                  }});
    table.addRule(EntityType::Segment, {"area equivalence", segmentAreaEquivalence});
    table.addRule(EntityType::Segment, {"angle bisector", segmentAngleBisector});
    table.addRule(EntityType::Segment, {"Pythagorean theorem", segmentPythagorean});

    table.addRule(EntityType::Angle, {"explementary pairing", [](Figure& figure, EntityID angle) {
                      figure.pairExplementary(angle);
                  }});
    table.addRule(EntityType::Angle, {"straight angle", angleStraightLines});
    table.addRule(EntityType::Angle, {"triangle angle sum", angleTriangleSum});
    table.addRule(EntityType::Angle, {"angle addition", [](Figure& figure, EntityID) {
                      theorems::angleAdditionPostulate(figure);
                  }});

    table.addRule(EntityType::Triangle, {"Heron's formula", [](Figure& figure, EntityID triangle) {
                      theorems::heronsFormula(figure, triangle);
                  }});
    table.addRule(EntityType::Triangle, {"area using altitude", triangleAltitudeAreas});

    return table;
}

} // namespace geodeduce::core::driver
