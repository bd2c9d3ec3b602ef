#include "Theorems.h"
#include "../geometry/Figure.h"
#include "../registry/GeometryErrors.h"

#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(logTheorems, "geodeduce.core.theorems")

namespace geodeduce::core::theorems {

using algebra::Polynomial;
using geometry::Angle;
using geometry::Figure;
using geometry::Segment;
using geometry::Triangle;

namespace {

bool contains(const std::vector<EntityID>& ids, EntityID id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

const Triangle& requireTriangle(Figure& figure, EntityID triangle, const char* theorem) {
    const Triangle* result = figure.getEntityAs<Triangle>(triangle);
    if (!result) {
        throw ConstructionError(std::string(theorem) + " requires a triangle");
    }
    return *result;
}

} // namespace

bool definitionSupplementaryAngles(Figure& figure, const std::vector<EntityID>& angles) {
    Polynomial sum;
    for (EntityID angle : angles) {
        sum += figure.measureSymbol(angle);
    }
    return figure.assertRelation(sum - 180.0, "supplementary angles");
}

std::size_t straightAngleTheorem(Figure& figure, EntityID line) {
    std::size_t asserted = 0;
    for (EntityID other : figure.entities(EntityType::Line)) {
        const EntityID self = figure.resolve(line);
        other = figure.resolve(other);
        if (other == self || figure.intersectionPoint(self, other) == kInvalidEntityID) {
            continue;
        }
        const auto angles = figure.nonreflexAnglesFormedByIntersection(self, other);
        const std::size_t n = angles.size();
        if (n < 2) {
            continue;
        }
        // Two angles form a single pair; four close the full turn
        const std::size_t pairs = n == 2 ? 1 : n;
        for (std::size_t i = 0; i < pairs; ++i) {
            if (definitionSupplementaryAngles(figure, {angles[i], angles[(i + 1) % n]})) {
                ++asserted;
            }
        }
    }
    qCDebug(logTheorems) << "Straight angle theorem asserted" << asserted << "relations";
    return asserted;
}

std::size_t subsegmentSumTheorem(Figure& figure, EntityID line) {
    std::size_t asserted = 0;
    for (EntityID segment : figure.segmentsWithSubsegments(line)) {
        Polynomial residual = figure.measureSymbol(segment);
        for (EntityID part : figure.atomicSubsegments(segment)) {
            residual -= figure.measureSymbol(part);
        }
        if (figure.assertRelation(residual, "subsegment sum")) {
            ++asserted;
        }
    }
    return asserted;
}

std::size_t angleAdditionPostulate(Figure& figure) {
    std::size_t asserted = 0;
    const auto angles = figure.entities(EntityType::Angle);
    for (EntityID first : angles) {
        for (EntityID second : angles) {
            const Angle* a1 = figure.getEntityAs<Angle>(first);
            const Angle* a2 = figure.getEntityAs<Angle>(second);
            if (!a1 || !a2 || a1 == a2) {
                continue;
            }
            const EntityID from = figure.resolve(a1->ray1());
            const EntityID shared = figure.resolve(a1->ray2());
            const EntityID to = figure.resolve(a2->ray2());
            if (shared != figure.resolve(a2->ray1()) || from == to) {
                continue;
            }
            if (a1->reflex() != std::optional<bool>(false) || a2->reflex() != std::optional<bool>(false)) {
                continue;
            }
            const EntityID spanning = figure.angleFromRays(from, to);
            if (figure.assertRelation(figure.measureSymbol(first) + figure.measureSymbol(second) -
                                          figure.measureSymbol(spanning),
                                      "angle addition")) {
                ++asserted;
            }
        }
    }
    return asserted;
}

bool triangleAngleSumTheorem(Figure& figure, EntityID triangle) {
    requireTriangle(figure, triangle, "triangle angle sum theorem");
    angleAdditionPostulate(figure);
    Polynomial residual(180.0);
    for (EntityID angle : figure.triangleAngles(triangle)) {
        residual -= figure.measureSymbol(angle);
    }
    return figure.assertRelation(residual, "triangle angle sum");
}

bool heronsFormula(Figure& figure, EntityID triangle) {
    requireTriangle(figure, triangle, "Heron's formula");
    const auto sides = figure.triangleSides(triangle);
    const auto unknownSides = std::count_if(sides.begin(), sides.end(), [&figure](EntityID side) {
        return !figure.numericMeasure(side).has_value();
    });
    if (unknownSides > 1) {
        return false;
    }

    const Polynomial a = figure.measureSymbol(sides[0]);
    const Polynomial b = figure.measureSymbol(sides[1]);
    const Polynomial c = figure.measureSymbol(sides[2]);
    const Polynomial s = (a + b + c) / 2.0;
    const Polynomial area = figure.measureSymbol(triangle);
    return figure.assertRelation(area.pow(2) - s * (s - a) * (s - b) * (s - c), "Heron's formula");
}

bool triangleAreaUsingAltitude(Figure& figure, EntityID triangle, EntityID altitude) {
    const Triangle& shape = requireTriangle(figure, triangle, "triangle area using altitude");
    const EntityID height = figure.resolve(altitude);
    if (!contains(figure.altitudes(triangle), height)) {
        throw ConstructionError(figure.describe(altitude) + " is not an altitude of " + shape.toString());
    }
    const Polynomial area = figure.measureSymbol(triangle);

    if (const auto right = figure.rightAngleVertex(triangle)) {
        const auto sides = figure.triangleSides(triangle);
        const Polynomial leg1 = figure.measureSymbol(sides[*right]);
        const Polynomial leg2 = figure.measureSymbol(sides[(*right + 2) % 3]);
        return figure.assertRelation(area - leg1 * leg2 / 2.0, "right triangle area");
    }

    const Segment* segment = figure.getEntityAs<Segment>(height);
    std::vector<EntityID> base;
    for (EntityID vertex : shape.points()) {
        if (!segment->hasEndpoint(vertex)) {
            base.push_back(vertex);
        }
    }
    if (base.size() == 1) {
        // The altitude is a leg; its foot is the endpoint where it meets the base line at 90
        const auto& ends = segment->endpoints();
        const auto isFoot = [&](EntityID corner, EntityID apex) {
            const EntityID line = figure.findLine(corner, base[0]);
            if (line == kInvalidEntityID) {
                return false;
            }
            const auto* onLine = figure.getEntityAs<geometry::Line>(line);
            for (EntityID end : {onLine->first(), onLine->last()}) {
                if (end == corner) {
                    continue;
                }
                for (EntityID angle : {figure.findAngle(apex, corner, end), figure.findAngle(end, corner, apex)}) {
                    const auto value = angle != kInvalidEntityID ? figure.numericMeasure(angle) : std::nullopt;
                    if (value && approximatelyEqual(*value, 90.0, figure.config().solver.tolerance)) {
                        return true;
                    }
                }
            }
            return false;
        };
        base.insert(base.begin(), isFoot(ends[1], ends[0]) ? ends[1] : ends[0]);
    }
    const EntityID baseSegment = figure.segment(base[0], base[1]);
    return figure.assertRelation(area - figure.measureSymbol(baseSegment) * figure.measureSymbol(height) / 2.0,
                                 "triangle area using altitude");
}

bool angleBisectorTheorem(Figure& figure, EntityID triangle, EntityID bisector) {
    const Triangle& shape = requireTriangle(figure, triangle, "angle bisector theorem");
    const EntityID split = figure.resolve(bisector);
    if (!contains(figure.angleBisectors(triangle), split)) {
        throw ConstructionError(figure.describe(bisector) + " is not an angle bisector of " + shape.toString());
    }

    const auto& ends = figure.getEntityAs<Segment>(split)->endpoints();
    const EntityID apex = shape.hasVertex(ends[0]) ? ends[0] : ends[1];
    const EntityID foot = ends[0] == apex ? ends[1] : ends[0];
    std::vector<EntityID> others;
    for (EntityID vertex : shape.points()) {
        if (vertex != apex) {
            others.push_back(vertex);
        }
    }

    const Polynomial apexToX = figure.measureSymbol(figure.segment(apex, others[0]));
    const Polynomial apexToY = figure.measureSymbol(figure.segment(apex, others[1]));
    const Polynomial footToX = figure.measureSymbol(figure.segment(foot, others[0]));
    const Polynomial footToY = figure.measureSymbol(figure.segment(foot, others[1]));
    return figure.assertRelation(apexToX * footToY - apexToY * footToX, "angle bisector theorem");
}

bool pythagoreanTheorem(Figure& figure, EntityID triangle) {
    const Triangle& shape = requireTriangle(figure, triangle, "Pythagorean theorem");
    const auto right = figure.rightAngleVertex(triangle);
    if (!right) {
        throw ConstructionError("Pythagorean theorem requires a right angle in " + shape.toString());
    }
    const auto sides = figure.triangleSides(triangle);
    const Polynomial leg1 = figure.measureSymbol(sides[*right]);
    const Polynomial leg2 = figure.measureSymbol(sides[(*right + 2) % 3]);
    const Polynomial hypotenuse = figure.measureSymbol(sides[(*right + 1) % 3]);
    return figure.assertRelation(leg1.pow(2) + leg2.pow(2) - hypotenuse.pow(2), "Pythagorean theorem");
}

} // namespace geodeduce::core::theorems
