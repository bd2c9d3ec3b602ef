/**
 * @file Registry.h
 * @brief Keyed, typed storage of entities with merge forwarding
 *
 * The registry owns every entity of a Figure for its whole lifetime. Live
 * entities are indexed by (kind, key). Merging an entity into another leaves
 * the merged one in storage with a successor so stale handles resolve to the
 * survivor.
 *
 * Change notifications are queued and drained to a fixed point. A
 * NotificationBatch defers the drain until a compound mutation completes.
 */
#ifndef GEODEDUCE_CORE_REGISTRY_REGISTRY_H
#define GEODEDUCE_CORE_REGISTRY_REGISTRY_H

#include "Entity.h"

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace geodeduce::core {

/**
 * @brief Receives the callbacks a registry cannot handle on its own
 */
class RegistryObserver {
public:
    virtual ~RegistryObserver() = default;

    /**
     * @brief Called before @p old is replaced so its state can move to @p survivor.
     */
    virtual void entityReplaced(Entity& old, Entity& survivor) = 0;

    /**
     * @brief A source @p subscriber depends on changed or was replaced.
     *
     * @p oldSource equals @p newSource for in-place changes.
     */
    virtual void dependencyChanged(EntityID subscriber, EntityID oldSource, EntityID newSource) = 0;

    /**
     * @brief Structural identity used by removeDuplicates; defaults to the key.
     */
    virtual std::string identity(const Entity& entity) { return entity.key(); }
};

class Registry {
public:
    explicit Registry(std::size_t maxCascadeSteps = 100000);
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    void setObserver(RegistryObserver* observer) { observer_ = observer; }

    //--------------------------------------------------------------------------
    // Storage
    //--------------------------------------------------------------------------

    /**
     * @brief Takes ownership, issues an id and indexes the key.
     * @throws ConstructionError if a live entity of the kind has the key
     */
    EntityID registerEntity(std::unique_ptr<Entity> entity);

    template <typename T, typename... Args>
    T* create(Args&&... args) {
        static_assert(std::is_base_of_v<Entity, T>, "T must derive from Entity");
        auto owned = std::make_unique<T>(std::forward<Args>(args)...);
        T* raw = owned.get();
        registerEntity(std::move(owned));
        return raw;
    }

    /**
     * @brief Live entity of @p type with @p key, or nullptr
     */
    Entity* get(EntityType type, const std::string& key) const;

    /**
     * @brief Entity stored under @p id without following successors
     */
    Entity* raw(EntityID id) const;

    /**
     * @brief Final survivor of @p id. Compresses the successor chain.
     */
    EntityID resolve(EntityID id);
    Entity* resolveEntity(EntityID id);

    template <typename T>
    T* getAs(EntityID id) {
        return dynamic_cast<T*>(resolveEntity(id));
    }

    /**
     * @brief Live entities of exactly @p type in key order
     */
    std::vector<Entity*> elements(EntityType type) const;

    /**
     * @brief Live entities of @p type and its subordinate kinds
     *
     * Polygon includes Triangle.
     */
    std::vector<Entity*> elementsRecursive(EntityType type) const;

    std::size_t liveCount(EntityType type) const;

    //--------------------------------------------------------------------------
    // Merging
    //--------------------------------------------------------------------------

    /**
     * @brief Re-keys a live entity; merges into the owner of @p newKey if there is one.
     * @return The surviving entity id
     */
    EntityID updateKey(EntityID id, const std::string& newKey);

    /**
     * @brief Merges @p oldId into @p newId
     * @throws StaleReferenceUse if either is superseded
     * @throws ConstructionError for different kinds
     */
    void replace(EntityID oldId, EntityID newId);

    /**
     * @brief Merges live entities of @p type sharing a structural identity, oldest survives.
     * @return Number of entities merged away
     */
    std::size_t removeDuplicates(EntityType type);

    //--------------------------------------------------------------------------
    // Change notification
    //--------------------------------------------------------------------------

    void subscribe(EntityID source, EntityID subscriber);
    void broadcastChange(EntityID source);
    void processNotifications();
    bool hasPendingNotifications() const { return !pending_.empty(); }

    /**
     * @brief Defers notification draining for its lifetime
     *
     * The destructor does not drain; call processNotifications() once the
     * outermost batch has ended.
     */
    class NotificationBatch {
    public:
        explicit NotificationBatch(Registry& registry);
        ~NotificationBatch();

        NotificationBatch(const NotificationBatch&) = delete;
        NotificationBatch& operator=(const NotificationBatch&) = delete;

    private:
        Registry& registry_;
    };

private:
    struct Notification {
        EntityID subscriber;
        EntityID oldSource;
        EntityID newSource;
    };

    Entity& requireLive(EntityID id, const char* operation) const;
    void enqueueSubscribers(const Entity& source, EntityID newSource);

    std::vector<std::unique_ptr<Entity>> objects_;
    std::map<EntityType, std::map<std::string, EntityID>> keyIndex_;
    std::deque<Notification> pending_;
    RegistryObserver* observer_ = nullptr;
    std::size_t maxCascadeSteps_;
    int batchDepth_ = 0;
    bool draining_ = false;
};

} // namespace geodeduce::core

#endif // GEODEDUCE_CORE_REGISTRY_REGISTRY_H
