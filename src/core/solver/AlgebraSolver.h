/**
 * @file AlgebraSolver.h
 * @brief Interface to the capability that solves polynomial systems.
 *
 * The equation solver only decides which of the returned bindings may be
 * committed; finding them is delegated to an implementation of this
 * interface. EliminationSolver is the one shipped with the engine.
 */
#ifndef GEODEDUCE_CORE_SOLVER_ALGEBRASOLVER_H
#define GEODEDUCE_CORE_SOLVER_ALGEBRASOLVER_H

#include "../algebra/Polynomial.h"

#include <map>
#include <string>
#include <vector>

namespace geodeduce::core::solver {

using algebra::Polynomial;
using algebra::UnknownID;

/// Partial assignment of unknowns; values may still contain free unknowns
using Binding = std::map<UnknownID, Polynomial>;

/**
 * @brief Outcome of solving "each residual == 0"
 */
struct AlgebraSolution {
    enum class Status {
        Solved,      ///< One or more consistent branches (possibly partial)
        NoSolution,  ///< Every branch is contradictory
        Unsolvable   ///< No progress could be made; not an error
    };
    Status status = Status::Unsolvable;

    /// One binding per solution branch when Solved
    std::vector<Binding> branches;

    /// Diagnostic for NoSolution / Unsolvable
    std::string message;
};

class AlgebraSolver {
public:
    virtual ~AlgebraSolver() = default;

    virtual AlgebraSolution solve(const std::vector<Polynomial>& residuals) = 0;
};

} // namespace geodeduce::core::solver

#endif // GEODEDUCE_CORE_SOLVER_ALGEBRASOLVER_H
