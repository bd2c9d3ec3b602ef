#include "MeasureTable.h"
#include "ConstraintStore.h"
#include "../algebra/UnknownTable.h"
#include "../registry/GeometryErrors.h"
#include "../registry/Registry.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <sstream>

Q_LOGGING_CATEGORY(logMeasure, "geodeduce.core.measure")

namespace geodeduce::core::measure {

namespace {

std::string formatNumber(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // namespace

MeasureTable::MeasureTable(Registry& registry, algebra::UnknownTable& unknowns, ConstraintStore& constraints,
                           const SolverConfig& config)
    : registry_(registry)
    , unknowns_(unknowns)
    , constraints_(constraints)
    , config_(config) {}

bool MeasureTable::isMeasurable(EntityType type) {
    return type == EntityType::Segment || type == EntityType::Angle || type == EntityType::Polygon ||
           type == EntityType::Triangle;
}

MeasurableEntity& MeasureTable::measurable(EntityID id) {
    Entity* entity = registry_.resolveEntity(id);
    if (!entity) {
        throw ConstructionError("unknown entity id " + std::to_string(id));
    }
    auto* result = dynamic_cast<MeasurableEntity*>(entity);
    if (!result) {
        throw ConstructionError(entity->toString() + " has no measure");
    }
    return *result;
}

MeasureValue MeasureTable::read(EntityID id) {
    MeasurableEntity& entity = measurable(id);
    if (!entity.m_measure) {
        const auto unknown = unknowns_.allocate(entity.typeName());
        bind(entity, MeasureValue::unknown(unknown), false);
        qCDebug(logMeasure) << "Allocated" << QString::fromStdString(unknowns_.name(unknown)) << "for"
                            << QString::fromStdString(entity.toString());
    }
    return *entity.m_measure;
}

std::optional<MeasureValue> MeasureTable::peek(EntityID id) {
    return measurable(id).m_measure;
}

std::optional<double> MeasureTable::numeric(EntityID id) {
    const auto& value = measurable(id).m_measure;
    if (value && value->isNumber()) {
        return value->numberValue();
    }
    return std::nullopt;
}

void MeasureTable::validateNumber(const MeasurableEntity& entity, double value) const {
    if (!(value > config_.tolerance)) {
        throw SystemInconsistency(entity.toString() + " cannot measure " + formatNumber(value));
    }
    if (entity.type() == EntityType::Angle && !(value < 360.0 - config_.tolerance)) {
        throw SystemInconsistency(entity.toString() + " cannot measure " + formatNumber(value) +
                                  " degrees; angles lie strictly between 0 and 360");
    }
}

void MeasureTable::bind(MeasurableEntity& entity, const MeasureValue& value, bool notify) {
    entity.m_measure = value;
    if (value.isUnknown()) {
        auto& holders = byUnknown_[value.unknownId()];
        if (std::find(holders.begin(), holders.end(), entity.id()) == holders.end()) {
            holders.push_back(entity.id());
        }
    }
    if (notify && listener_) {
        listener_->measureAssigned(entity.id());
    }
}

bool MeasureTable::assign(EntityID id, const MeasureValue& value) {
    MeasurableEntity& entity = measurable(id);
    if (value.isNumber()) {
        validateNumber(entity, value.numberValue());
    }

    if (!entity.m_measure) {
        bind(entity, value, true);
        return false;
    }

    const MeasureValue current = *entity.m_measure;
    if (current.isNumber() && value.isNumber()) {
        if (!approximatelyEqual(current.numberValue(), value.numberValue(), config_.tolerance)) {
            throw MeasureConflict(entity.toString() + " already measures " + formatNumber(current.numberValue()) +
                                  ", cannot set " + formatNumber(value.numberValue()));
        }
        return false;
    }
    if (current == value) {
        return false;
    }

    const EntityID asserted =
        constraints_.assertZero(current.toPolynomial() - value.toPolynomial(), "measure of " + entity.toString());
    if (listener_) {
        listener_->measureAssigned(entity.id());
    }
    return asserted != kInvalidEntityID;
}

void MeasureTable::substituteUnknown(algebra::UnknownID unknown, double value) {
    auto it = byUnknown_.find(unknown);
    if (it == byUnknown_.end()) {
        return;
    }

    // Every holder must accept the value before any of them is rebound
    std::vector<MeasurableEntity*> measured;
    for (EntityID holder : it->second) {
        auto* entity = dynamic_cast<MeasurableEntity*>(registry_.resolveEntity(holder));
        if (!entity || !entity->m_measure || !entity->m_measure->isUnknown() ||
            entity->m_measure->unknownId() != unknown ||
            std::find(measured.begin(), measured.end(), entity) != measured.end()) {
            continue;
        }
        validateNumber(*entity, value);
        measured.push_back(entity);
    }

    byUnknown_.erase(it);
    for (MeasurableEntity* entity : measured) {
        qCDebug(logMeasure) << QString::fromStdString(entity->toString()) << "resolved to" << value;
        bind(*entity, MeasureValue::number(value), true);
    }
}

std::vector<EntityID> MeasureTable::entitiesMeasuredBy(algebra::UnknownID unknown) {
    std::vector<EntityID> result;
    auto it = byUnknown_.find(unknown);
    if (it == byUnknown_.end()) {
        return result;
    }
    for (EntityID holder : it->second) {
        const EntityID live = registry_.resolve(holder);
        auto* measured = dynamic_cast<MeasurableEntity*>(registry_.raw(live));
        if (!measured || !measured->m_measure || *measured->m_measure != MeasureValue::unknown(unknown)) {
            continue;
        }
        if (std::find(result.begin(), result.end(), live) == result.end()) {
            result.push_back(live);
        }
    }
    return result;
}

bool MeasureTable::reconcile(Entity& old, Entity& survivor) {
    auto* from = dynamic_cast<MeasurableEntity*>(&old);
    auto* to = dynamic_cast<MeasurableEntity*>(&survivor);
    if (!from || !to || !from->m_measure) {
        return false;
    }
    if (!to->m_measure) {
        bind(*to, *from->m_measure, false);
        return false;
    }
    return assign(to->id(), *from->m_measure);
}

} // namespace geodeduce::core::measure
