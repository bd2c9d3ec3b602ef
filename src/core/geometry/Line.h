/**
 * @file Line.h
 * @brief Ordered sequence of collinear points
 *
 * The order reflects the relative position of the points along the line.
 * The key is the label sequence, reversed if needed so the first label is
 * not greater than the last.
 */
#ifndef GEODEDUCE_CORE_GEOMETRY_LINE_H
#define GEODEDUCE_CORE_GEOMETRY_LINE_H

#include "../registry/Entity.h"

#include <algorithm>
#include <vector>

namespace geodeduce::core::geometry {

class Line : public Entity {
public:
    Line(std::string key, std::vector<EntityID> points)
        : Entity(std::move(key))
        , m_points(std::move(points)) {}

    EntityType type() const override { return EntityType::Line; }

    const std::vector<EntityID>& points() const { return m_points; }
    void setPoints(std::vector<EntityID> points) { m_points = std::move(points); }

    EntityID first() const { return m_points.front(); }
    EntityID last() const { return m_points.back(); }

    bool contains(EntityID point) const {
        return std::find(m_points.begin(), m_points.end(), point) != m_points.end();
    }

    /// Position along the line, or -1
    int indexOf(EntityID point) const {
        auto it = std::find(m_points.begin(), m_points.end(), point);
        return it == m_points.end() ? -1 : static_cast<int>(it - m_points.begin());
    }

private:
    std::vector<EntityID> m_points;
};

} // namespace geodeduce::core::geometry

#endif // GEODEDUCE_CORE_GEOMETRY_LINE_H
