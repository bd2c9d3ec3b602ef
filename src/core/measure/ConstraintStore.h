/**
 * @file ConstraintStore.h
 * @brief Registry-backed set of asserted zero-valued expressions
 */
#ifndef GEODEDUCE_CORE_MEASURE_CONSTRAINTSTORE_H
#define GEODEDUCE_CORE_MEASURE_CONSTRAINTSTORE_H

#include "Expression.h"
#include "../EngineConfig.h"
#include "../algebra/UnknownTable.h"

#include <map>
#include <string>
#include <vector>

namespace geodeduce::core {
class Registry;
}

namespace geodeduce::core::measure {

class ConstraintStore {
public:
    ConstraintStore(Registry& registry, const algebra::UnknownTable& unknowns, const SolverConfig& config);

    /**
     * @brief Asserts residual == 0
     *
     * A residual that is already zero asserts nothing and returns
     * kInvalidEntityID. A live expression with a structurally equal residual
     * (up to scaling) is returned instead of a new one.
     *
     * @throws SystemInconsistency if the residual is a nonzero constant
     */
    EntityID assertZero(const algebra::Polynomial& residual, const std::string& origin);

    /**
     * @brief Substitutes into one expression
     * @return The same id when nothing changed, otherwise the successor's id
     * @throws StaleReferenceUse if @p id is superseded
     * @throws SystemInconsistency if the result is a nonzero constant
     */
    EntityID substitute(EntityID id, const std::map<algebra::UnknownID, algebra::Polynomial>& bindings);

    void substituteAll(const std::map<algebra::UnknownID, algebra::Polynomial>& bindings);

    std::vector<Expression*> liveExpressions() const;

    /// Follows successors from @p id
    Expression* expression(EntityID id);

    std::string describe(const Expression& expression) const;

private:
    EntityID registerExpression(algebra::Polynomial residual, Expression::State state,
                                const std::string& origin, EntityID predecessor);

    Registry& registry_;
    const algebra::UnknownTable& unknowns_;
    const SolverConfig& config_;
    std::size_t nextOrdinal_ = 1;
};

} // namespace geodeduce::core::measure

#endif // GEODEDUCE_CORE_MEASURE_CONSTRAINTSTORE_H
