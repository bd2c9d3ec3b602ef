/**
 * @file EliminationSolver.h
 * @brief Branching elimination solver for polynomial residual systems.
 *
 * Each branch repeatedly:
 *  1. reduces the linear residuals to reduced row echelon form (Eigen) and
 *     binds every pivot unknown,
 *  2. isolates an unknown that occurs linearly with a constant coefficient,
 *  3. solves a univariate residual for its real roots, opening one branch
 *     per root.
 * A branch that cannot continue is returned with its partial binding.
 * Contradictory branches are dropped.
 */
#ifndef GEODEDUCE_CORE_SOLVER_ELIMINATIONSOLVER_H
#define GEODEDUCE_CORE_SOLVER_ELIMINATIONSOLVER_H

#include "AlgebraSolver.h"
#include "../EngineConfig.h"

#include <optional>

namespace geodeduce::core::solver {

class EliminationSolver : public AlgebraSolver {
public:
    explicit EliminationSolver(SolverConfig config = {});

    AlgebraSolution solve(const std::vector<Polynomial>& residuals) override;

    /**
     * @brief Distinct real roots of sum(coefficients[k] * x^k), ascending.
     */
    static std::vector<double> realRoots(const std::vector<double>& coefficients, double tolerance);

    const SolverConfig& config() const { return config_; }

private:
    struct Branch {
        std::vector<Polynomial> residuals;
        Binding binding;
    };

    enum class StepResult { Progress, Contradiction, Stuck };

    StepResult simplify(Branch& branch) const;
    StepResult eliminateLinear(Branch& branch) const;
    StepResult isolateUnknown(Branch& branch) const;
    std::optional<std::vector<Branch>> splitOnUnivariate(const Branch& branch) const;

    void bind(Branch& branch, const Binding& additions) const;
    bool sameBinding(const Binding& a, const Binding& b) const;

    SolverConfig config_;
};

} // namespace geodeduce::core::solver

#endif // GEODEDUCE_CORE_SOLVER_ELIMINATIONSOLVER_H
