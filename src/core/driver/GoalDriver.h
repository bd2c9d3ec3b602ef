/**
 * @file GoalDriver.h
 * @brief Drives derivation rules towards requested measures
 *
 * A target is a measurable entity whose measure the caller wants. Running
 * the driver applies the derivation rules for each queued target's kind in
 * order, solving after every rule, until the target is numeric or the rules
 * are exhausted. Whenever the solver commits bindings, unknowns that share a
 * live relation with a target become targets themselves.
 */
#ifndef GEODEDUCE_CORE_DRIVER_GOALDRIVER_H
#define GEODEDUCE_CORE_DRIVER_GOALDRIVER_H

#include "DerivationTable.h"

#include <deque>
#include <vector>

namespace geodeduce::core::driver {

class GoalDriver {
public:
    explicit GoalDriver(geometry::Figure& figure, DerivationTable table = DerivationTable::standard());

    /**
     * @brief Queues @p entity once
     * @return false if it already was a target
     * @throws ConstructionError if the entity has no measure
     */
    bool addTarget(EntityID entity);

    /**
     * @brief Processes queued targets to a fixed point; no-op when re-entered
     */
    void run();

    /**
     * @brief Adds the entities measured by unknowns co-occurring with target unknowns
     * @return Number of targets added
     */
    std::size_t expandTargets();

    void addRule(EntityType type, DerivationRule rule) { table_.addRule(type, std::move(rule)); }

    const std::vector<EntityID>& targets() const { return targets_; }
    bool isRunning() const { return running_; }

private:
    void runTypeOneConstructions();
    void derive(EntityID target);
    bool isNumeric(EntityID entity);

    geometry::Figure& figure_;
    DerivationTable table_;
    std::vector<EntityID> targets_;
    std::deque<EntityID> queue_;
    bool running_ = false;
    bool typeOneDone_ = false;
};

} // namespace geodeduce::core::driver

#endif // GEODEDUCE_CORE_DRIVER_GOALDRIVER_H
