/**
 * @file Ray.h
 * @brief Half-line from a vertex through a direction point
 *
 * The direction point is always the farthest known point of the line in
 * that direction, so rays that coincide share a key. A ray subscribes to
 * its line and re-canonicalizes when the line gains points or is merged.
 */
#ifndef GEODEDUCE_CORE_GEOMETRY_RAY_H
#define GEODEDUCE_CORE_GEOMETRY_RAY_H

#include "../registry/Entity.h"

namespace geodeduce::core::geometry {

class Ray : public Entity {
public:
    Ray(std::string key, EntityID vertex, EntityID pointingTo)
        : Entity(std::move(key))
        , m_vertex(vertex)
        , m_pointingTo(pointingTo) {}

    EntityType type() const override { return EntityType::Ray; }

    EntityID vertex() const { return m_vertex; }
    EntityID pointingTo() const { return m_pointingTo; }
    void setPointingTo(EntityID point) { m_pointingTo = point; }

private:
    EntityID m_vertex;
    EntityID m_pointingTo;
};

} // namespace geodeduce::core::geometry

#endif // GEODEDUCE_CORE_GEOMETRY_RAY_H
