/**
 * @file Polygon.h
 * @brief Closed cyclic point sequences; measure is the area
 */
#ifndef GEODEDUCE_CORE_GEOMETRY_POLYGON_H
#define GEODEDUCE_CORE_GEOMETRY_POLYGON_H

#include "../registry/Entity.h"

#include <algorithm>
#include <vector>

namespace geodeduce::core::geometry {

class Polygon : public MeasurableEntity {
public:
    Polygon(std::string key, std::vector<EntityID> points)
        : MeasurableEntity(std::move(key))
        , m_points(std::move(points)) {}

    EntityType type() const override { return EntityType::Polygon; }

    /// Vertices in canonical rotation
    const std::vector<EntityID>& points() const { return m_points; }

    /// Boundary segments; segments()[i] joins points()[i] and points()[i + 1]
    const std::vector<EntityID>& segments() const { return m_segments; }

    /// Vertex angles; angles()[i] is Angle(p[i], p[i + 1], p[i + 2])
    const std::vector<EntityID>& angles() const { return m_angles; }

    void setBoundary(std::vector<EntityID> segments, std::vector<EntityID> angles) {
        m_segments = std::move(segments);
        m_angles = std::move(angles);
    }

    bool hasVertex(EntityID point) const {
        return std::find(m_points.begin(), m_points.end(), point) != m_points.end();
    }

private:
    std::vector<EntityID> m_points;
    std::vector<EntityID> m_segments;
    std::vector<EntityID> m_angles;
};

class Triangle : public Polygon {
public:
    using Polygon::Polygon;

    EntityType type() const override { return EntityType::Triangle; }
};

} // namespace geodeduce::core::geometry

#endif // GEODEDUCE_CORE_GEOMETRY_POLYGON_H
