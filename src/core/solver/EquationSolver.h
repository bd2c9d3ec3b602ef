/**
 * @file EquationSolver.h
 * @brief Decides which algebraic solutions become measures
 *
 * The algebra capability may return several solution branches. Each
 * unknown is judged on its own:
 *  - a number shared by every branch is committed; a non-positive one makes
 *    the system inconsistent,
 *  - a number that differs between branches is committed only if exactly one
 *    strictly positive candidate remains, otherwise the system is
 *    inconsistent,
 *  - an unknown left unbound or parametric in some branch waits for more
 *    facts.
 */
#ifndef GEODEDUCE_CORE_SOLVER_EQUATIONSOLVER_H
#define GEODEDUCE_CORE_SOLVER_EQUATIONSOLVER_H

#include "AlgebraSolver.h"
#include "../EngineConfig.h"

#include <functional>
#include <map>
#include <string>

namespace geodeduce::core::algebra {
class UnknownTable;
}

namespace geodeduce::core::measure {
class ConstraintStore;
class MeasureTable;
}

namespace geodeduce::core::solver {

struct SolveReport {
    enum class Outcome {
        NothingToSolve,  ///< No live relations
        Deferred,        ///< Nothing could be committed yet
        Applied          ///< At least one unknown was resolved
    };
    Outcome outcome = Outcome::NothingToSolve;

    std::map<UnknownID, double> applied;
    std::string message;
};

class EquationSolver {
public:
    EquationSolver(measure::ConstraintStore& constraints, measure::MeasureTable& measures, AlgebraSolver& algebra,
                   const algebra::UnknownTable& unknowns, const SolverConfig& config);

    /**
     * @brief Solves the live relations once and commits admissible bindings
     * @throws SystemInconsistency when no admissible solution exists
     */
    SolveReport solveSystem();

    /**
     * @brief Called after bindings were committed
     */
    void setAfterApply(std::function<void()> callback) { afterApply_ = std::move(callback); }

private:
    std::map<UnknownID, double> admissibleBindings(const std::vector<Binding>& branches) const;

    measure::ConstraintStore& constraints_;
    measure::MeasureTable& measures_;
    AlgebraSolver& algebra_;
    const algebra::UnknownTable& unknowns_;
    const SolverConfig& config_;
    std::function<void()> afterApply_;
};

} // namespace geodeduce::core::solver

#endif // GEODEDUCE_CORE_SOLVER_EQUATIONSOLVER_H
