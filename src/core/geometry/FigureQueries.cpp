#include "Figure.h"

#include <algorithm>
#include <set>

namespace geodeduce::core::geometry {

namespace {

constexpr double kRightAngle = 90.0;

void appendUnique(std::vector<EntityID>& into, EntityID id) {
    if (id != kInvalidEntityID && std::find(into.begin(), into.end(), id) == into.end()) {
        into.push_back(id);
    }
}

} // namespace

EntityID Figure::findLine(EntityID a, EntityID b) const {
    for (const Entity* entity : registry_.elements(EntityType::Line)) {
        const auto* line = static_cast<const Line*>(entity);
        if (line->contains(a) && line->contains(b)) {
            return line->id();
        }
    }
    return kInvalidEntityID;
}

EntityID Figure::findSegment(EntityID a, EntityID b) {
    if (a == b) {
        return kInvalidEntityID;
    }
    std::string first = label(a);
    std::string second = label(b);
    if (first > second) {
        std::swap(first, second);
    }
    const Entity* segment = registry_.get(EntityType::Segment, first + " " + second);
    return segment ? segment->id() : kInvalidEntityID;
}

EntityID Figure::farthestKnown(EntityID vertex, EntityID through) const {
    const EntityID id = findLine(vertex, through);
    if (id == kInvalidEntityID) {
        return kInvalidEntityID;
    }
    const auto* line = static_cast<const Line*>(registry_.raw(id));
    return line->indexOf(through) > line->indexOf(vertex) ? line->last() : line->first();
}

EntityID Figure::findAngle(EntityID p, EntityID vertex, EntityID q) {
    if (p == vertex || q == vertex || p == q) {
        return kInvalidEntityID;
    }
    const EntityID far1 = farthestKnown(vertex, p);
    const EntityID far2 = farthestKnown(vertex, q);
    if (far1 == kInvalidEntityID || far2 == kInvalidEntityID) {
        return kInvalidEntityID;
    }
    const std::string vertexLabel = label(vertex);
    const Entity* ray1 = registry_.get(EntityType::Ray, vertexLabel + " " + label(far1));
    const Entity* ray2 = registry_.get(EntityType::Ray, vertexLabel + " " + label(far2));
    if (!ray1 || !ray2) {
        return kInvalidEntityID;
    }
    const Entity* angle = registry_.get(EntityType::Angle, angleKey(ray1->id(), ray2->id()));
    return angle ? angle->id() : kInvalidEntityID;
}

std::vector<EntityID> Figure::knownPointsOnLine(EntityID a, EntityID b) const {
    const EntityID id = findLine(a, b);
    if (id == kInvalidEntityID) {
        return {a, b};
    }
    return static_cast<const Line*>(registry_.raw(id))->points();
}

EntityID Figure::intersectionPoint(EntityID line1, EntityID line2) {
    const Line& first = require<Line>(line1, "line");
    const Line& second = require<Line>(line2, "line");
    if (first.id() == second.id()) {
        return kInvalidEntityID;
    }
    EntityID common = kInvalidEntityID;
    for (EntityID point : first.points()) {
        if (second.contains(point)) {
            if (common != kInvalidEntityID) {
                return kInvalidEntityID;
            }
            common = point;
        }
    }
    return common;
}

bool Figure::isInteriorOfKnownPoints(EntityID line, EntityID point) {
    const Line& target = require<Line>(line, "line");
    const int index = target.indexOf(point);
    return index > 0 && index + 1 < static_cast<int>(target.points().size());
}

std::vector<EntityID> Figure::pointsInRayDirection(EntityID ray) {
    const Ray& target = require<Ray>(ray, "ray");
    const Line& line = require<Line>(lineOfRay(target.id()), "line");
    const auto& onLine = line.points();
    const int vertex = line.indexOf(target.vertex());

    std::vector<EntityID> result;
    if (line.indexOf(target.pointingTo()) > vertex) {
        result.assign(onLine.begin() + vertex + 1, onLine.end());
    } else {
        result.assign(onLine.rend() - vertex, onLine.rend());
    }
    return result;
}

std::vector<EntityID> Figure::containedPoints(EntityID segment) {
    const auto& ends = require<Segment>(segment, "segment").endpoints();
    const EntityID id = findLine(ends[0], ends[1]);
    if (id == kInvalidEntityID) {
        return {ends[0], ends[1]};
    }
    const Line& line = require<Line>(id, "line");
    int from = line.indexOf(ends[0]);
    int to = line.indexOf(ends[1]);
    if (from > to) {
        std::swap(from, to);
    }
    return {line.points().begin() + from, line.points().begin() + to + 1};
}

//--------------------------------------------------------------------------
// Triangles
//--------------------------------------------------------------------------

std::vector<EntityID> Figure::triangleSides(EntityID triangle) {
    std::vector<EntityID> result;
    for (EntityID side : require<Triangle>(triangle, "triangle").segments()) {
        result.push_back(registry_.resolve(side));
    }
    return result;
}

std::vector<EntityID> Figure::triangleAngles(EntityID triangle) {
    std::vector<EntityID> result;
    for (EntityID corner : require<Triangle>(triangle, "triangle").angles()) {
        result.push_back(registry_.resolve(corner));
    }
    return result;
}

std::optional<std::size_t> Figure::rightAngleVertex(EntityID triangle) {
    const auto corners = triangleAngles(triangle);
    for (std::size_t i = 0; i < corners.size(); ++i) {
        const auto value = measures_.numeric(corners[i]);
        if (value && approximatelyEqual(*value, kRightAngle, config_.solver.tolerance)) {
            return (i + 1) % corners.size();
        }
    }
    return std::nullopt;
}

EntityID Figure::findPolygon(const std::vector<EntityID>& points) const {
    const std::set<EntityID> wanted(points.begin(), points.end());
    for (const Entity* entity : registry_.elementsRecursive(EntityType::Polygon)) {
        const auto& vertices = static_cast<const Polygon*>(entity)->points();
        if (vertices.size() == points.size() && std::set<EntityID>(vertices.begin(), vertices.end()) == wanted) {
            return entity->id();
        }
    }
    return kInvalidEntityID;
}

std::vector<EntityID> Figure::trianglesWithSide(EntityID segment) {
    const EntityID side = registry_.resolve(segment);
    std::vector<EntityID> result;
    for (EntityID triangle : entities(EntityType::Triangle)) {
        const auto sides = triangleSides(triangle);
        if (std::find(sides.begin(), sides.end(), side) != sides.end()) {
            result.push_back(triangle);
        }
    }
    return result;
}

std::vector<EntityID> Figure::trianglesWithAngle(EntityID angle) {
    const EntityID corner = registry_.resolve(angle);
    std::vector<EntityID> result;
    for (EntityID triangle : entities(EntityType::Triangle)) {
        const auto corners = triangleAngles(triangle);
        if (std::find(corners.begin(), corners.end(), corner) != corners.end()) {
            result.push_back(triangle);
        }
    }
    return result;
}

std::vector<EntityID> Figure::altitudes(EntityID triangle) {
    const auto vertices = require<Triangle>(triangle, "triangle").points();
    std::vector<EntityID> result;
    for (std::size_t i = 0; i < vertices.size(); ++i) {
        const EntityID apex = vertices[i];
        const EntityID base = findLine(vertices[(i + 1) % 3], vertices[(i + 2) % 3]);
        if (base == kInvalidEntityID) {
            continue;
        }
        const Line& line = require<Line>(base, "line");
        for (EntityID foot : line.points()) {
            const EntityID candidate = findSegment(apex, foot);
            if (foot == apex || candidate == kInvalidEntityID) {
                continue;
            }
            for (EntityID end : {line.first(), line.last()}) {
                if (end == foot) {
                    continue;
                }
                for (EntityID corner : {findAngle(apex, foot, end), findAngle(end, foot, apex)}) {
                    if (corner == kInvalidEntityID) {
                        continue;
                    }
                    const auto value = measures_.numeric(corner);
                    if (value && approximatelyEqual(*value, kRightAngle, config_.solver.tolerance)) {
                        appendUnique(result, candidate);
                    }
                }
            }
        }
    }
    return result;
}

std::vector<EntityID> Figure::angleBisectors(EntityID triangle) {
    const auto vertices = require<Triangle>(triangle, "triangle").points();
    std::vector<EntityID> result;
    for (std::size_t i = 0; i < vertices.size(); ++i) {
        const EntityID previous = vertices[i];
        const EntityID apex = vertices[(i + 1) % 3];
        const EntityID next = vertices[(i + 2) % 3];
        const EntityID opposite = findLine(previous, next);
        if (opposite == kInvalidEntityID) {
            continue;
        }
        const Line& line = require<Line>(opposite, "line");
        int from = line.indexOf(previous);
        int to = line.indexOf(next);
        if (from > to) {
            std::swap(from, to);
        }
        for (int k = from + 1; k < to; ++k) {
            const EntityID split = line.points()[static_cast<std::size_t>(k)];
            const EntityID candidate = findSegment(apex, split);
            const EntityID left = findAngle(previous, apex, split);
            const EntityID right = findAngle(split, apex, next);
            if (candidate == kInvalidEntityID || left == kInvalidEntityID || right == kInvalidEntityID) {
                continue;
            }
            const auto leftValue = measures_.peek(left);
            const auto rightValue = measures_.peek(right);
            if (!leftValue || !rightValue) {
                continue;
            }
            const bool equal = leftValue->isNumber() && rightValue->isNumber()
                                   ? approximatelyEqual(leftValue->numberValue(), rightValue->numberValue(),
                                                        config_.solver.tolerance)
                                   : *leftValue == *rightValue;
            if (equal) {
                appendUnique(result, candidate);
            }
        }
    }
    return result;
}

//--------------------------------------------------------------------------
// Queries that may construct
//--------------------------------------------------------------------------

std::vector<EntityID> Figure::nonreflexAnglesFormedByIntersection(EntityID line1, EntityID line2) {
    const auto angles = computeNonreflexAngles(registry_.resolve(line1), registry_.resolve(line2));
    commit();
    std::vector<EntityID> result;
    for (EntityID angle : angles) {
        result.push_back(registry_.resolve(angle));
    }
    return result;
}

std::vector<EntityID> Figure::segmentsWithSubsegments(EntityID line) {
    const auto onLine = require<Line>(line, "line").points();
    std::vector<EntityID> result;
    for (std::size_t i = 0; i < onLine.size(); ++i) {
        for (std::size_t j = i + 2; j < onLine.size(); ++j) {
            result.push_back(ensureSegment(onLine[i], onLine[j]));
        }
    }
    return result;
}

std::vector<EntityID> Figure::subsegments(EntityID segment) {
    const EntityID self = registry_.resolve(segment);
    const auto inside = containedPoints(self);
    std::vector<EntityID> result;
    for (std::size_t i = 0; i < inside.size(); ++i) {
        for (std::size_t j = i + 1; j < inside.size(); ++j) {
            const EntityID part = ensureSegment(inside[i], inside[j]);
            if (part != self) {
                result.push_back(part);
            }
        }
    }
    return result;
}

std::vector<EntityID> Figure::atomicSubsegments(EntityID segment) {
    const auto inside = containedPoints(segment);
    std::vector<EntityID> result;
    for (std::size_t i = 0; i + 1 < inside.size(); ++i) {
        result.push_back(ensureSegment(inside[i], inside[i + 1]));
    }
    return result;
}

std::vector<EntityID> Figure::componentsOf(EntityID segment) {
    const EntityID self = registry_.resolve(segment);
    const auto& ends = require<Segment>(self, "segment").endpoints();
    std::vector<EntityID> result;

    if (const EntityID id = findLine(ends[0], ends[1])) {
        const auto onLine = require<Line>(id, "line").points();
        const Line& line = require<Line>(id, "line");
        const int low = std::min(line.indexOf(ends[0]), line.indexOf(ends[1]));
        const int high = std::max(line.indexOf(ends[0]), line.indexOf(ends[1]));
        for (int i = 0; i <= low; ++i) {
            for (int j = high; j < static_cast<int>(onLine.size()); ++j) {
                const EntityID super = ensureSegment(onLine[static_cast<std::size_t>(i)],
                                                     onLine[static_cast<std::size_t>(j)]);
                if (super != self) {
                    result.push_back(super);
                }
            }
        }
    }
    for (EntityID triangle : trianglesWithSide(self)) {
        result.push_back(triangle);
    }
    return result;
}

} // namespace geodeduce::core::geometry
