/**
 * @file MeasureTable.h
 * @brief Measures of entities and the unknown -> entity index
 *
 * Write policy for assign(entity, v):
 *  - unset: bind v
 *  - both numbers: must agree within tolerance, else MeasureConflict
 *  - otherwise: assert (current - v) == 0 and leave resolution to the solver
 */
#ifndef GEODEDUCE_CORE_MEASURE_MEASURETABLE_H
#define GEODEDUCE_CORE_MEASURE_MEASURETABLE_H

#include "MeasureValue.h"
#include "../EngineConfig.h"
#include "../registry/Entity.h"

#include <map>
#include <optional>
#include <vector>

namespace geodeduce::core {
class Registry;
}

namespace geodeduce::core::algebra {
class UnknownTable;
}

namespace geodeduce::core::measure {

class ConstraintStore;

class MeasureListener {
public:
    virtual ~MeasureListener() = default;

    /**
     * @brief A measure was assigned or rebound to a number (not on lazy reads).
     */
    virtual void measureAssigned(EntityID entity) = 0;
};

class MeasureTable {
public:
    MeasureTable(Registry& registry, algebra::UnknownTable& unknowns, ConstraintStore& constraints,
                 const SolverConfig& config);

    void setListener(MeasureListener* listener) { listener_ = listener; }

    /**
     * @brief Current measure, allocating a fresh unknown if unset
     * @throws ConstructionError if the entity has no measure
     */
    MeasureValue read(EntityID id);

    /// Current measure without allocating
    std::optional<MeasureValue> peek(EntityID id);

    /// Numeric value if the measure is a number
    std::optional<double> numeric(EntityID id);

    /**
     * @brief Applies the write policy
     * @return true if a residual was asserted
     * @throws MeasureConflict, SystemInconsistency
     */
    bool assign(EntityID id, const MeasureValue& value);

    /**
     * @brief Rebinds every measure holding @p unknown to @p value
     * @throws SystemInconsistency if any holder cannot take the value; nothing is rebound then
     */
    void substituteUnknown(algebra::UnknownID unknown, double value);

    /**
     * @brief Live entities whose measure is @p unknown
     */
    std::vector<EntityID> entitiesMeasuredBy(algebra::UnknownID unknown);

    /**
     * @brief Moves the measure of a merged entity onto the survivor
     * @return true if a residual was asserted
     */
    bool reconcile(Entity& old, Entity& survivor);

    static bool isMeasurable(EntityType type);

private:
    MeasurableEntity& measurable(EntityID id);
    void validateNumber(const MeasurableEntity& entity, double value) const;
    void bind(MeasurableEntity& entity, const MeasureValue& value, bool notify);

    Registry& registry_;
    algebra::UnknownTable& unknowns_;
    ConstraintStore& constraints_;
    const SolverConfig& config_;
    MeasureListener* listener_ = nullptr;
    std::map<algebra::UnknownID, std::vector<EntityID>> byUnknown_;
};

} // namespace geodeduce::core::measure

#endif // GEODEDUCE_CORE_MEASURE_MEASURETABLE_H
