#include "Registry.h"
#include "GeometryErrors.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>

Q_LOGGING_CATEGORY(logRegistry, "geodeduce.core.registry")

namespace geodeduce::core {

const char* entityTypeName(EntityType type) {
    switch (type) {
        case EntityType::Point:      return "Point";
        case EntityType::Line:       return "Line";
        case EntityType::Segment:    return "Segment";
        case EntityType::Ray:        return "Ray";
        case EntityType::Angle:      return "Angle";
        case EntityType::Polygon:    return "Polygon";
        case EntityType::Triangle:   return "Triangle";
        case EntityType::Expression: return "Expression";
    }
    return "Unknown";
}

Registry::Registry(std::size_t maxCascadeSteps)
    : maxCascadeSteps_(maxCascadeSteps) {}

Registry::~Registry() = default;

EntityID Registry::registerEntity(std::unique_ptr<Entity> entity) {
    auto& index = keyIndex_[entity->type()];
    if (index.count(entity->key()) != 0) {
        throw ConstructionError("duplicate key registered: " + entity->toString());
    }
    objects_.push_back(std::move(entity));
    Entity& stored = *objects_.back();
    stored.m_id = static_cast<EntityID>(objects_.size());
    index.emplace(stored.key(), stored.m_id);
    qCDebug(logRegistry) << "Registered" << QString::fromStdString(stored.toString()) << "id=" << stored.m_id;
    return stored.m_id;
}

Entity* Registry::get(EntityType type, const std::string& key) const {
    auto typeIt = keyIndex_.find(type);
    if (typeIt == keyIndex_.end()) {
        return nullptr;
    }
    auto it = typeIt->second.find(key);
    return it == typeIt->second.end() ? nullptr : raw(it->second);
}

Entity* Registry::raw(EntityID id) const {
    if (id == kInvalidEntityID || id > objects_.size()) {
        return nullptr;
    }
    return objects_[id - 1].get();
}

EntityID Registry::resolve(EntityID id) {
    Entity* entity = raw(id);
    if (!entity) {
        return kInvalidEntityID;
    }
    EntityID survivor = id;
    while (Entity* current = raw(survivor)) {
        if (!current->isSuperseded()) {
            break;
        }
        survivor = current->m_successor;
    }
    // Point every visited link straight at the survivor
    EntityID cursor = id;
    while (cursor != survivor) {
        Entity* current = raw(cursor);
        const EntityID next = current->m_successor;
        current->m_successor = survivor;
        cursor = next;
    }
    return survivor;
}

Entity* Registry::resolveEntity(EntityID id) {
    return raw(resolve(id));
}

std::vector<Entity*> Registry::elements(EntityType type) const {
    std::vector<Entity*> result;
    auto typeIt = keyIndex_.find(type);
    if (typeIt == keyIndex_.end()) {
        return result;
    }
    result.reserve(typeIt->second.size());
    for (const auto& [key, id] : typeIt->second) {
        result.push_back(raw(id));
    }
    return result;
}

std::vector<Entity*> Registry::elementsRecursive(EntityType type) const {
    std::vector<Entity*> result = elements(type);
    if (type == EntityType::Polygon) {
        const auto triangles = elements(EntityType::Triangle);
        result.insert(result.end(), triangles.begin(), triangles.end());
    }
    return result;
}

std::size_t Registry::liveCount(EntityType type) const {
    auto typeIt = keyIndex_.find(type);
    return typeIt == keyIndex_.end() ? 0 : typeIt->second.size();
}

Entity& Registry::requireLive(EntityID id, const char* operation) const {
    Entity* entity = raw(id);
    if (!entity) {
        throw ConstructionError(std::string(operation) + ": unknown entity id " + std::to_string(id));
    }
    if (entity->isSuperseded()) {
        throw StaleReferenceUse(std::string(operation) + " on superseded " + entity->toString());
    }
    return *entity;
}

EntityID Registry::updateKey(EntityID id, const std::string& newKey) {
    Entity& entity = requireLive(id, "updateKey");
    if (entity.key() == newKey) {
        return id;
    }

    auto& index = keyIndex_[entity.type()];
    auto existing = index.find(newKey);
    if (existing != index.end() && existing->second != id) {
        const EntityID survivor = existing->second;
        replace(id, survivor);
        return survivor;
    }

    qCDebug(logRegistry) << "Re-keyed" << QString::fromStdString(entity.toString())
                         << "->" << QString::fromStdString(newKey);
    index.erase(entity.key());
    entity.m_key = newKey;
    index.emplace(newKey, id);
    broadcastChange(id);
    return id;
}

void Registry::replace(EntityID oldId, EntityID newId) {
    Entity& old = requireLive(oldId, "replace");
    Entity& survivor = requireLive(newId, "replace");
    if (oldId == newId) {
        return;
    }
    if (old.type() != survivor.type()) {
        throw ConstructionError("cannot replace " + old.toString() + " with " + survivor.toString());
    }

    qCDebug(logRegistry) << "Replacing" << QString::fromStdString(old.toString())
                         << "with" << QString::fromStdString(survivor.toString());

    if (observer_) {
        observer_->entityReplaced(old, survivor);
    }

    auto& index = keyIndex_[old.type()];
    auto it = index.find(old.key());
    if (it != index.end() && it->second == oldId) {
        index.erase(it);
    }
    old.m_successor = newId;

    for (EntityID subscriber : old.m_subscribers) {
        if (subscriber != newId &&
            std::find(survivor.m_subscribers.begin(), survivor.m_subscribers.end(), subscriber) ==
                survivor.m_subscribers.end()) {
            survivor.m_subscribers.push_back(subscriber);
        }
    }
    enqueueSubscribers(old, newId);
    processNotifications();
}

std::size_t Registry::removeDuplicates(EntityType type) {
    if (!observer_) {
        return 0;
    }

    std::size_t merged = 0;
    for (;;) {
        std::map<std::string, std::vector<EntityID>> groups;
        for (Entity* entity : elements(type)) {
            groups[observer_->identity(*entity)].push_back(entity->id());
        }

        bool changed = false;
        for (auto& [identity, ids] : groups) {
            if (ids.size() < 2) {
                continue;
            }
            std::sort(ids.begin(), ids.end());
            const EntityID keep = ids.front();
            for (std::size_t i = 1; i < ids.size(); ++i) {
                const EntityID duplicate = resolve(ids[i]);
                const EntityID survivor = resolve(keep);
                if (duplicate != survivor) {
                    replace(duplicate, survivor);
                    ++merged;
                }
            }
            changed = true;
            // Replacements may cascade into other groups; regroup from scratch
            break;
        }
        if (!changed) {
            break;
        }
    }
    return merged;
}

void Registry::subscribe(EntityID source, EntityID subscriber) {
    Entity* entity = resolveEntity(source);
    if (!entity) {
        return;
    }
    auto& subscribers = entity->m_subscribers;
    if (std::find(subscribers.begin(), subscribers.end(), subscriber) == subscribers.end()) {
        subscribers.push_back(subscriber);
    }
}

void Registry::broadcastChange(EntityID source) {
    Entity& entity = requireLive(source, "broadcastChange");
    enqueueSubscribers(entity, source);
    processNotifications();
}

void Registry::enqueueSubscribers(const Entity& source, EntityID newSource) {
    for (EntityID subscriber : source.m_subscribers) {
        pending_.push_back({subscriber, source.m_id, newSource});
    }
}

void Registry::processNotifications() {
    if (draining_ || batchDepth_ > 0) {
        return;
    }
    draining_ = true;
    std::size_t steps = 0;
    try {
        while (!pending_.empty()) {
            if (++steps > maxCascadeSteps_) {
                throw ConstructionError("change notification cascade did not converge");
            }
            const Notification note = pending_.front();
            pending_.pop_front();

            Entity* subscriber = raw(note.subscriber);
            if (!subscriber || subscriber->isSuperseded() || !observer_) {
                continue;
            }
            observer_->dependencyChanged(note.subscriber, note.oldSource, resolve(note.newSource));
        }
    } catch (...) {
        // Notifications queued behind a failure must not fire on the next mutation
        pending_.clear();
        draining_ = false;
        throw;
    }
    draining_ = false;
}

Registry::NotificationBatch::NotificationBatch(Registry& registry)
    : registry_(registry) {
    ++registry_.batchDepth_;
}

Registry::NotificationBatch::~NotificationBatch() {
    --registry_.batchDepth_;
}

} // namespace geodeduce::core
