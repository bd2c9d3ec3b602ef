#include "Figure.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cctype>
#include <sstream>

Q_DECLARE_LOGGING_CATEGORY(logFigure)

namespace geodeduce::core::geometry {

namespace {

std::vector<std::string> splitLabels(const std::string& names) {
    std::istringstream in(names);
    std::vector<std::string> tokens;
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool isValidLabel(const std::string& label) {
    return !label.empty() && std::none_of(label.begin(), label.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

std::string joined(const std::vector<std::string>& parts) {
    std::string result;
    for (const auto& part : parts) {
        if (!result.empty()) {
            result += ' ';
        }
        result += part;
    }
    return result;
}

std::size_t commonCount(const std::vector<EntityID>& a, const std::vector<EntityID>& b) {
    return static_cast<std::size_t>(std::count_if(a.begin(), a.end(), [&b](EntityID point) {
        return std::find(b.begin(), b.end(), point) != b.end();
    }));
}

std::vector<EntityID> commonInOrder(const std::vector<EntityID>& of, const std::vector<EntityID>& other) {
    std::vector<EntityID> result;
    for (EntityID point : of) {
        if (std::find(other.begin(), other.end(), point) != other.end()) {
            result.push_back(point);
        }
    }
    return result;
}

} // namespace

//--------------------------------------------------------------------------
// Points
//--------------------------------------------------------------------------

EntityID Figure::ensurePoint(const std::string& label) {
    if (!isValidLabel(label)) {
        throw ConstructionError("invalid point label '" + label + "'");
    }
    if (Entity* existing = registry_.get(EntityType::Point, label)) {
        return existing->id();
    }
    return registry_.create<Point>(label)->id();
}

EntityID Figure::point(const std::string& label) {
    return ensurePoint(label);
}

std::vector<EntityID> Figure::points(const std::string& names) {
    const auto tokens = splitLabels(names);
    if (tokens.empty()) {
        throw ConstructionError("empty point specification");
    }
    std::vector<EntityID> result;
    for (const auto& token : tokens) {
        result.push_back(ensurePoint(token));
    }
    return points(result);
}

std::vector<EntityID> Figure::points(const std::vector<EntityID>& handles) {
    std::vector<EntityID> result;
    result.reserve(handles.size());
    for (EntityID handle : handles) {
        const EntityID point = require<Point>(handle, "point").id();
        if (std::find(result.begin(), result.end(), point) != result.end()) {
            throw ConstructionError("point " + label(point) + " appears more than once");
        }
        result.push_back(point);
    }
    return result;
}

std::vector<std::string> Figure::labels(const std::vector<EntityID>& points) const {
    std::vector<std::string> result;
    result.reserve(points.size());
    for (EntityID point : points) {
        result.push_back(registry_.raw(point)->key());
    }
    return result;
}

//--------------------------------------------------------------------------
// Lines
//--------------------------------------------------------------------------

std::vector<EntityID> Figure::canonicalLineOrder(std::vector<EntityID> points) const {
    if (registry_.raw(points.front())->key() > registry_.raw(points.back())->key()) {
        std::reverse(points.begin(), points.end());
    }
    return points;
}

std::string Figure::lineKey(const std::vector<EntityID>& points) const {
    return joined(labels(canonicalLineOrder(points)));
}

std::vector<EntityID> Figure::orderPreservingMerge(const std::vector<EntityID>& a,
                                                   const std::vector<EntityID>& b) const {
    const auto inA = [&a](EntityID point) { return std::find(a.begin(), a.end(), point) != a.end(); };
    const auto inB = [&b](EntityID point) { return std::find(b.begin(), b.end(), point) != b.end(); };

    std::vector<EntityID> result;
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() || j < b.size()) {
        const bool aOpen = i < a.size();
        const bool bOpen = j < b.size();
        const bool aCommon = aOpen && inB(a[i]);
        const bool bCommon = bOpen && inA(b[j]);

        if (aOpen && !aCommon && bOpen && !bCommon) {
            throw CollinearSequenceError("cannot order " + registry_.raw(a[i])->key() + " and " +
                                             registry_.raw(b[j])->key() + " along the merged line",
                                         labels(a), labels(b));
        }
        if (aOpen && !aCommon) {
            result.push_back(a[i++]);
        } else if (bOpen && !bCommon) {
            result.push_back(b[j++]);
        } else if (aOpen && bOpen) {
            // Both heads are the same common point
            result.push_back(a[i++]);
            ++j;
        } else if (aOpen) {
            result.push_back(a[i++]);
        } else {
            result.push_back(b[j++]);
        }
    }
    return result;
}

std::vector<EntityID> Figure::bidirectionalMerge(const std::vector<EntityID>& a,
                                                 const std::vector<EntityID>& b) const {
    const auto commonA = commonInOrder(a, b);
    auto commonB = commonInOrder(b, a);
    if (commonA == commonB) {
        return orderPreservingMerge(a, b);
    }
    std::reverse(commonB.begin(), commonB.end());
    if (commonA == commonB) {
        return orderPreservingMerge(a, std::vector<EntityID>(b.rbegin(), b.rend()));
    }
    throw CollinearSequenceError("point orders " + joined(labels(a)) + " and " + joined(labels(b)) + " disagree",
                                 labels(a), labels(b));
}

EntityID Figure::ensureLine(const std::vector<EntityID>& input) {
    if (input.size() < 2) {
        throw ConstructionError("a line needs at least two points");
    }
    if (input.size() == 2) {
        if (const EntityID existing = findLine(input[0], input[1])) {
            return existing;
        }
    }
    if (Entity* existing = registry_.get(EntityType::Line, lineKey(input))) {
        return existing->id();
    }

    std::vector<EntityID> merged = input;
    std::vector<EntityID> involved;
    for (bool grew = true; grew;) {
        grew = false;
        for (Entity* entity : registry_.elements(EntityType::Line)) {
            if (std::find(involved.begin(), involved.end(), entity->id()) != involved.end()) {
                continue;
            }
            const auto& known = static_cast<Line*>(entity)->points();
            if (commonCount(merged, known) >= 2) {
                merged = bidirectionalMerge(merged, known);
                involved.push_back(entity->id());
                grew = true;
            }
        }
    }
    merged = canonicalLineOrder(merged);
    const std::string key = joined(labels(merged));

    EntityID survivor = kInvalidEntityID;
    {
        Registry::NotificationBatch batch(registry_);
        if (involved.empty()) {
            survivor = registry_.create<Line>(key, merged)->id();
        } else {
            for (EntityID id : involved) {
                auto* line = registry_.getAs<Line>(id);
                if (!line || line->key() == key) {
                    survivor = line ? line->id() : survivor;
                    continue;
                }
                line->setPoints(merged);
                survivor = registry_.updateKey(line->id(), key);
            }
            if (involved.size() > 1) {
                registry_.removeDuplicates(EntityType::Line);
            }
        }
    }
    registry_.processNotifications();
    survivor = registry_.resolve(survivor);
    qCDebug(logFigure) << "Line" << QString::fromStdString(key) << "merged" << involved.size() << "known lines";

    for (std::size_t i = 0; i + 1 < merged.size(); ++i) {
        for (std::size_t j = i + 1; j < merged.size(); ++j) {
            ensureSegment(merged[i], merged[j]);
        }
    }
    return survivor;
}

EntityID Figure::line(const std::string& names) {
    return line(points(names));
}

EntityID Figure::line(const std::vector<EntityID>& handles) {
    const EntityID id = ensureLine(points(handles));
    commit();
    return registry_.resolve(id);
}

//--------------------------------------------------------------------------
// Segments
//--------------------------------------------------------------------------

EntityID Figure::ensureSegment(EntityID a, EntityID b) {
    if (a == b) {
        throw ConstructionError("a segment needs two distinct points");
    }
    std::vector<EntityID> ends{a, b};
    if (registry_.raw(a)->key() > registry_.raw(b)->key()) {
        std::swap(ends[0], ends[1]);
    }
    const std::string key = joined(labels(ends));
    if (Entity* existing = registry_.get(EntityType::Segment, key)) {
        return existing->id();
    }
    return registry_.create<Segment>(key, ends[0], ends[1])->id();
}

EntityID Figure::segment(const std::string& names) {
    const auto ends = points(names);
    if (ends.size() != 2) {
        throw ConstructionError("a segment needs exactly two points, got '" + names + "'");
    }
    return segment(ends[0], ends[1]);
}

EntityID Figure::segment(EntityID a, EntityID b) {
    const auto ends = points(std::vector<EntityID>{a, b});
    const EntityID id = ensureSegment(ends[0], ends[1]);
    commit();
    return id;
}

EntityID Figure::lineThrough(EntityID segment) {
    const auto& ends = require<Segment>(segment, "segment").endpoints();
    return lineThrough(ends[0], ends[1]);
}

EntityID Figure::lineThrough(EntityID a, EntityID b) {
    const auto ends = points(std::vector<EntityID>{a, b});
    const EntityID id = ensureLine(ends);
    commit();
    return registry_.resolve(id);
}

//--------------------------------------------------------------------------
// Rays
//--------------------------------------------------------------------------

EntityID Figure::farthestInDirection(EntityID vertex, EntityID through) {
    ensureLine({vertex, through});
    return farthestKnown(vertex, through);
}

EntityID Figure::lineOfRay(EntityID ray) {
    const Ray& r = require<Ray>(ray, "ray");
    return ensureLine({r.vertex(), r.pointingTo()});
}

EntityID Figure::ensureRay(EntityID vertex, EntityID through) {
    if (vertex == through) {
        throw ConstructionError("a ray needs two distinct points");
    }
    const EntityID far = farthestInDirection(vertex, through);
    const std::string key = registry_.raw(vertex)->key() + " " + registry_.raw(far)->key();
    EntityID id = kInvalidEntityID;
    if (Entity* existing = registry_.get(EntityType::Ray, key)) {
        id = existing->id();
    } else {
        id = registry_.create<Ray>(key, vertex, far)->id();
    }
    registry_.subscribe(findLine(vertex, far), id);
    return id;
}

void Figure::onLineChanged(EntityID ray) {
    Ray& r = require<Ray>(ray, "ray");
    const EntityID far = farthestKnown(r.vertex(), r.pointingTo());
    if (far == kInvalidEntityID || far == r.pointingTo()) {
        return;
    }
    r.setPointingTo(far);
    registry_.updateKey(r.id(), registry_.raw(r.vertex())->key() + " " + registry_.raw(far)->key());
}

EntityID Figure::ray(const std::string& names) {
    const auto ends = points(names);
    if (ends.size() != 2) {
        throw ConstructionError("a ray needs exactly two points, got '" + names + "'");
    }
    return ray(ends[0], ends[1]);
}

EntityID Figure::ray(EntityID vertex, EntityID through) {
    const auto ends = points(std::vector<EntityID>{vertex, through});
    const EntityID id = ensureRay(ends[0], ends[1]);
    commit();
    return registry_.resolve(id);
}

//--------------------------------------------------------------------------
// Angles
//--------------------------------------------------------------------------

std::string Figure::angleKey(EntityID ray1, EntityID ray2) {
    const Ray& first = require<Ray>(ray1, "ray");
    const Ray& second = require<Ray>(ray2, "ray");
    return registry_.raw(first.pointingTo())->key() + " " + registry_.raw(first.vertex())->key() + " " +
           registry_.raw(second.pointingTo())->key();
}

EntityID Figure::ensureAngle(EntityID ray1, EntityID ray2) {
    const Ray& first = require<Ray>(ray1, "ray");
    const Ray& second = require<Ray>(ray2, "ray");
    if (first.id() == second.id()) {
        throw ConstructionError("an angle needs two distinct rays, got " + first.toString() + " twice");
    }
    if (first.vertex() != second.vertex()) {
        throw ConstructionError(first.toString() + " and " + second.toString() + " do not share a vertex");
    }

    const std::string key = angleKey(first.id(), second.id());
    if (Entity* existing = registry_.get(EntityType::Angle, key)) {
        return existing->id();
    }
    auto* angle = registry_.create<Angle>(key, first.id(), second.id());
    registry_.subscribe(first.id(), angle->id());
    registry_.subscribe(second.id(), angle->id());

    // A new angle inherits the negated flag of its known explementary
    if (auto* explementary = static_cast<Angle*>(registry_.get(EntityType::Angle, angleKey(second.id(), first.id())));
        explementary && explementary->reflex()) {
        angle->setReflex(!*explementary->reflex());
    }
    return angle->id();
}

void Figure::onRayChanged(EntityID angle, EntityID oldRay, EntityID newRay) {
    Angle& target = require<Angle>(angle, "angle");
    EntityID ray1 = target.ray1() == oldRay ? newRay : target.ray1();
    EntityID ray2 = target.ray2() == oldRay ? newRay : target.ray2();
    ray1 = registry_.resolve(ray1);
    ray2 = registry_.resolve(ray2);
    if (ray1 == ray2) {
        throw ConstructionError(target.toString() + " collapsed: both of its rays are the same ray");
    }
    target.setRays(ray1, ray2);
    if (oldRay != newRay) {
        registry_.subscribe(newRay, target.id());
    }
    registry_.updateKey(target.id(), angleKey(ray1, ray2));
    registry_.removeDuplicates(EntityType::Angle);
}

EntityID Figure::angle(const std::string& names, std::optional<bool> reflex) {
    const auto corners = points(names);
    if (corners.size() != 3) {
        throw ConstructionError("an angle needs exactly three points, got '" + names + "'");
    }
    return angle(corners[0], corners[1], corners[2], reflex);
}

EntityID Figure::angle(EntityID p, EntityID vertex, EntityID q, std::optional<bool> reflex) {
    const auto corners = points(std::vector<EntityID>{p, vertex, q});
    const EntityID ray1 = ensureRay(corners[1], corners[0]);
    const EntityID ray2 = ensureRay(corners[1], corners[2]);
    return angleFromRays(ray1, ray2, reflex);
}

EntityID Figure::angleFromRays(EntityID ray1, EntityID ray2, std::optional<bool> reflex) {
    const EntityID id = ensureAngle(registry_.resolve(ray1), registry_.resolve(ray2));
    if (reflex) {
        applyReflex(id, *reflex);
    }
    commit();
    return registry_.resolve(id);
}

EntityID Figure::explementary(EntityID angle) {
    const Angle& source = require<Angle>(angle, "angle");
    const EntityID id = ensureAngle(source.ray2(), source.ray1());
    commit();
    return registry_.resolve(id);
}

std::vector<EntityID> Figure::computeNonreflexAngles(EntityID line1, EntityID line2) {
    const EntityID intersection = intersectionPoint(line1, line2);
    if (intersection == kInvalidEntityID) {
        return {};
    }
    const Line& first = require<Line>(line1, "line");
    const Line& second = require<Line>(line2, "line");

    // Ends in rotational order around the intersection
    const std::vector<EntityID> ends{first.first(), second.first(), first.last(), second.last()};
    std::vector<EntityID> rays(ends.size(), kInvalidEntityID);
    for (std::size_t i = 0; i < ends.size(); ++i) {
        if (ends[i] != intersection) {
            rays[i] = ensureRay(intersection, ends[i]);
        }
    }

    std::vector<EntityID> angles;
    for (std::size_t i = 0; i < rays.size(); ++i) {
        const EntityID from = rays[i];
        const EntityID to = rays[(i + 1) % rays.size()];
        if (from != kInvalidEntityID && to != kInvalidEntityID) {
            angles.push_back(ensureAngle(from, to));
        }
    }

    std::optional<bool> orientation;
    for (EntityID id : angles) {
        const auto& flag = require<Angle>(id, "angle").reflex();
        if (flag) {
            orientation = orientation.value_or(false) || *flag;
        }
    }
    if (!orientation) {
        return {};
    }

    std::vector<EntityID> result;
    for (EntityID id : angles) {
        const Angle& angle = require<Angle>(id, "angle");
        const EntityID chosen = *orientation ? ensureAngle(angle.ray2(), angle.ray1()) : angle.id();
        applyReflex(chosen, false);
        result.push_back(registry_.resolve(chosen));
    }
    return result;
}

//--------------------------------------------------------------------------
// Polygons
//--------------------------------------------------------------------------

EntityID Figure::ensurePolygon(const std::vector<EntityID>& input, bool asTriangle) {
    if (input.size() < 3) {
        throw ConstructionError("a polygon needs at least three points");
    }
    if (asTriangle && input.size() != 3) {
        throw ConstructionError("a triangle needs exactly three points");
    }

    // Rotate so the smallest label leads; direction is kept
    std::vector<EntityID> vertices = input;
    const auto names = labels(vertices);
    const auto smallest = std::min_element(names.begin(), names.end()) - names.begin();
    std::rotate(vertices.begin(), vertices.begin() + smallest, vertices.end());

    const EntityType type = vertices.size() == 3 ? EntityType::Triangle : EntityType::Polygon;
    const std::string key = joined(labels(vertices));
    if (Entity* existing = registry_.get(type, key)) {
        return existing->id();
    }
    if (const EntityID other = findPolygon(vertices)) {
        throw ConstructionError(registry_.raw(other)->toString() + " already has these vertices in the opposite "
                                "orientation; cannot construct " + key);
    }

    const std::size_t n = vertices.size();
    for (std::size_t i = 0; i < n; ++i) {
        const EntityID through = findLine(vertices[i], vertices[(i + 1) % n]);
        if (through && require<Line>(through, "line").contains(vertices[(i + 2) % n])) {
            throw ConstructionError("consecutive vertices of " + key + " are collinear");
        }
    }

    Polygon* polygon = nullptr;
    if (type == EntityType::Triangle) {
        polygon = registry_.create<Triangle>(key, vertices);
    } else {
        polygon = registry_.create<Polygon>(key, vertices);
    }

    std::vector<EntityID> sides;
    std::vector<EntityID> corners;
    for (std::size_t i = 0; i < n; ++i) {
        sides.push_back(ensureSegment(vertices[i], vertices[(i + 1) % n]));
    }
    for (std::size_t i = 0; i < n; ++i) {
        const EntityID vertex = vertices[(i + 1) % n];
        const EntityID ray1 = ensureRay(vertex, vertices[i]);
        const EntityID ray2 = ensureRay(vertex, vertices[(i + 2) % n]);
        corners.push_back(ensureAngle(ray1, ray2));
    }
    polygon->setBoundary(std::move(sides), std::move(corners));
    qCDebug(logFigure) << "Constructed" << QString::fromStdString(polygon->toString());
    return polygon->id();
}

EntityID Figure::polygon(const std::string& names) {
    return polygon(points(names));
}

EntityID Figure::polygon(const std::vector<EntityID>& handles) {
    const EntityID id = ensurePolygon(points(handles), false);
    commit();
    return id;
}

EntityID Figure::triangle(const std::string& names) {
    return triangle(points(names));
}

EntityID Figure::triangle(const std::vector<EntityID>& handles) {
    const EntityID id = ensurePolygon(points(handles), true);
    commit();
    return id;
}

} // namespace geodeduce::core::geometry
