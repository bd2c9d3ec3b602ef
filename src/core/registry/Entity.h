/**
 * @file Entity.h
 * @brief Base class of every object owned by a Registry
 *
 * An entity has a canonical key that is unique within its concrete kind.
 * When two entities are discovered to be the same object, one is merged into
 * the other and receives a successor; handles to it keep working because the
 * registry forwards them to the survivor.
 */
#ifndef GEODEDUCE_CORE_REGISTRY_ENTITY_H
#define GEODEDUCE_CORE_REGISTRY_ENTITY_H

#include "../measure/MeasureValue.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace geodeduce::core {

using EntityID = std::uint64_t;
constexpr EntityID kInvalidEntityID = 0;

enum class EntityType {
    Point,
    Line,
    Segment,
    Ray,
    Angle,
    Polygon,
    Triangle,
    Expression
};

const char* entityTypeName(EntityType type);

class Registry;

namespace measure {
class MeasureTable;
}

class Entity {
public:
    virtual ~Entity() = default;

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    //--------------------------------------------------------------------------
    // Identity
    //--------------------------------------------------------------------------

    EntityID id() const { return m_id; }
    const std::string& key() const { return m_key; }

    virtual EntityType type() const = 0;
    std::string typeName() const { return entityTypeName(type()); }

    /**
     * @brief Human readable form, e.g. "Segment(A B)"
     */
    std::string toString() const { return typeName() + "(" + m_key + ")"; }

    //--------------------------------------------------------------------------
    // Merge bookkeeping
    //--------------------------------------------------------------------------

    /**
     * @brief Entity this one was merged into, or kInvalidEntityID while live
     */
    EntityID successor() const { return m_successor; }
    bool isSuperseded() const { return m_successor != kInvalidEntityID; }

    /**
     * @brief Entities notified when this one changes or is replaced
     */
    const std::vector<EntityID>& subscribers() const { return m_subscribers; }

protected:
    explicit Entity(std::string key) : m_key(std::move(key)) {}

private:
    friend class Registry;

    EntityID m_id = kInvalidEntityID;
    std::string m_key;
    EntityID m_successor = kInvalidEntityID;
    std::vector<EntityID> m_subscribers;
};

/**
 * @brief Entity that carries a measure (length, angle degrees or area)
 */
class MeasurableEntity : public Entity {
public:
    const std::optional<measure::MeasureValue>& measure() const { return m_measure; }
    bool hasMeasure() const { return m_measure.has_value(); }

protected:
    using Entity::Entity;

private:
    friend class measure::MeasureTable;

    std::optional<measure::MeasureValue> m_measure;
};

} // namespace geodeduce::core

#endif // GEODEDUCE_CORE_REGISTRY_ENTITY_H
