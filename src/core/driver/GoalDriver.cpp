#include "GoalDriver.h"
#include "../geometry/Figure.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <set>

Q_LOGGING_CATEGORY(logDriver, "geodeduce.core.driver")

namespace geodeduce::core::driver {

GoalDriver::GoalDriver(geometry::Figure& figure, DerivationTable table)
    : figure_(figure)
    , table_(std::move(table)) {}

bool GoalDriver::addTarget(EntityID entity) {
    const EntityID id = figure_.resolve(entity);
    const Entity* target = figure_.registry().raw(id);
    if (!target) {
        throw ConstructionError("unknown entity id " + std::to_string(entity));
    }
    if (!measure::MeasureTable::isMeasurable(target->type())) {
        throw ConstructionError(target->toString() + " has no measure to solve for");
    }
    for (EntityID& known : targets_) {
        known = figure_.resolve(known);
        if (known == id) {
            return false;
        }
    }
    targets_.push_back(id);
    queue_.push_back(id);
    qCDebug(logDriver) << "Target" << QString::fromStdString(target->toString());
    return true;
}

bool GoalDriver::isNumeric(EntityID entity) {
    return figure_.numericMeasure(entity).has_value();
}

void GoalDriver::run() {
    if (running_ || queue_.empty()) {
        return;
    }
    running_ = true;
    try {
        runTypeOneConstructions();
        while (!queue_.empty()) {
            const EntityID target = figure_.resolve(queue_.front());
            queue_.pop_front();
            if (!isNumeric(target)) {
                derive(target);
            }
        }
    } catch (...) {
        running_ = false;
        queue_.clear();
        throw;
    }
    running_ = false;
}

void GoalDriver::runTypeOneConstructions() {
    if (typeOneDone_) {
        return;
    }
    typeOneDone_ = true;
    for (const auto& rule : table_.typeOneRules()) {
        qCDebug(logDriver) << "Type-one rule" << QString::fromStdString(rule.name);
        rule.apply(figure_);
    }
    figure_.solve();
}

void GoalDriver::derive(EntityID target) {
    const EntityType type = figure_.registry().raw(target)->type();
    for (const auto& rule : table_.rulesFor(type)) {
        target = figure_.resolve(target);
        if (isNumeric(target)) {
            break;
        }
        qCDebug(logDriver) << "Applying" << QString::fromStdString(rule.name) << "to"
                           << QString::fromStdString(figure_.describe(target));
        rule.apply(figure_, target);
        figure_.solve();
    }
    if (isNumeric(target)) {
        qCInfo(logDriver) << "Derived" << QString::fromStdString(figure_.describe(target));
    }
}

std::size_t GoalDriver::expandTargets() {
    std::size_t added = 0;
    for (bool grew = true; grew;) {
        grew = false;

        std::set<algebra::UnknownID> targetUnknowns;
        for (EntityID target : targets_) {
            const auto value = figure_.measures().peek(target);
            if (value && value->isUnknown()) {
                targetUnknowns.insert(value->unknownId());
            }
        }

        for (const auto* expression : figure_.constraints().liveExpressions()) {
            const auto unknowns = expression->residual().unknowns();
            const bool related = std::any_of(unknowns.begin(), unknowns.end(), [&](algebra::UnknownID unknown) {
                return targetUnknowns.count(unknown) != 0;
            });
            if (!related) {
                continue;
            }
            for (algebra::UnknownID unknown : unknowns) {
                if (targetUnknowns.count(unknown) != 0) {
                    continue;
                }
                for (EntityID entity : figure_.measures().entitiesMeasuredBy(unknown)) {
                    if (addTarget(entity)) {
                        ++added;
                        grew = true;
                    }
                }
            }
        }
    }
    return added;
}

} // namespace geodeduce::core::driver
