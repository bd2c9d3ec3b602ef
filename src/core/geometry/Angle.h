/**
 * @file Angle.h
 * @brief Angle swept from one ray to another around their common vertex
 *
 * Angle(r1, r2) and Angle(r2, r1) are explementary: their measures add up to
 * 360 degrees and their reflex flags are negations of each other once either
 * is known. Both sides of a straight angle measure 180 and still differ.
 */
#ifndef GEODEDUCE_CORE_GEOMETRY_ANGLE_H
#define GEODEDUCE_CORE_GEOMETRY_ANGLE_H

#include "../registry/Entity.h"

#include <optional>

namespace geodeduce::core::geometry {

class Angle : public MeasurableEntity {
public:
    Angle(std::string key, EntityID ray1, EntityID ray2)
        : MeasurableEntity(std::move(key))
        , m_ray1(ray1)
        , m_ray2(ray2) {}

    EntityType type() const override { return EntityType::Angle; }

    EntityID ray1() const { return m_ray1; }
    EntityID ray2() const { return m_ray2; }
    void setRays(EntityID ray1, EntityID ray2) {
        m_ray1 = ray1;
        m_ray2 = ray2;
    }

    /// Unset until known; immutable once set
    const std::optional<bool>& reflex() const { return m_reflex; }
    void setReflex(bool reflex) { m_reflex = reflex; }

    /// Explementary pairing relation already asserted
    bool explementaryPaired() const { return m_explementaryPaired; }
    void markExplementaryPaired() { m_explementaryPaired = true; }

private:
    EntityID m_ray1;
    EntityID m_ray2;
    std::optional<bool> m_reflex;
    bool m_explementaryPaired = false;
};

} // namespace geodeduce::core::geometry

#endif // GEODEDUCE_CORE_GEOMETRY_ANGLE_H
