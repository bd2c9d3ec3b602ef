#ifndef GEODEDUCE_CORE_GEOMETRY_SEGMENT_H
#define GEODEDUCE_CORE_GEOMETRY_SEGMENT_H

#include "../registry/Entity.h"

#include <array>

namespace geodeduce::core::geometry {

/**
 * @brief Unordered pair of points; measure is its length
 *
 * Endpoints are stored in key order.
 */
class Segment : public MeasurableEntity {
public:
    Segment(std::string key, EntityID first, EntityID second)
        : MeasurableEntity(std::move(key))
        , m_endpoints{first, second} {}

    EntityType type() const override { return EntityType::Segment; }

    const std::array<EntityID, 2>& endpoints() const { return m_endpoints; }
    bool hasEndpoint(EntityID point) const { return m_endpoints[0] == point || m_endpoints[1] == point; }

    EntityID otherEndpoint(EntityID point) const {
        return m_endpoints[0] == point ? m_endpoints[1] : m_endpoints[0];
    }

private:
    std::array<EntityID, 2> m_endpoints;
};

} // namespace geodeduce::core::geometry

#endif // GEODEDUCE_CORE_GEOMETRY_SEGMENT_H
