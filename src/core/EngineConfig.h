/**
 * @file EngineConfig.h
 * @brief Tunables for a Figure session and its equation solver.
 */
#ifndef GEODEDUCE_CORE_ENGINECONFIG_H
#define GEODEDUCE_CORE_ENGINECONFIG_H

#include <cstddef>

namespace geodeduce::core {

/**
 * @brief Configuration for the algebra capability and the solve policy
 */
struct SolverConfig {
    /// Absolute/relative tolerance for numeric comparisons
    double tolerance = 1e-9;

    /// Solution branches the elimination solver may open before giving up
    std::size_t maxBranches = 64;

    /// Elimination steps across all branches of one solve
    std::size_t maxEliminationSteps = 512;
};

struct EngineConfig {
    SolverConfig solver;

    /// Upper bound on change notifications drained in one cascade
    std::size_t maxCascadeSteps = 100000;

    /// Run the equation solver after measure assignments and merges
    bool autoSolve = true;

    /**
     * @brief Defaults overridden by GEODEDUCE_* environment variables.
     *
     * GEODEDUCE_SOLVER_TOLERANCE, GEODEDUCE_SOLVER_MAX_BRANCHES,
     * GEODEDUCE_MAX_CASCADE_STEPS and GEODEDUCE_AUTO_SOLVE are recognised.
     * Malformed values are ignored with a warning.
     */
    static EngineConfig fromEnvironment();
};

/**
 * @brief True when |a - b| is within tolerance, absolute near zero and relative otherwise.
 */
bool approximatelyEqual(double a, double b, double tolerance);

} // namespace geodeduce::core

#endif // GEODEDUCE_CORE_ENGINECONFIG_H
