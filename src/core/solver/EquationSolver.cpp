#include "EquationSolver.h"
#include "../algebra/UnknownTable.h"
#include "../measure/ConstraintStore.h"
#include "../measure/MeasureTable.h"
#include "../registry/GeometryErrors.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <set>
#include <sstream>

Q_LOGGING_CATEGORY(logSolver, "geodeduce.core.solver")

namespace geodeduce::core::solver {

EquationSolver::EquationSolver(measure::ConstraintStore& constraints, measure::MeasureTable& measures,
                               AlgebraSolver& algebra, const algebra::UnknownTable& unknowns,
                               const SolverConfig& config)
    : constraints_(constraints)
    , measures_(measures)
    , algebra_(algebra)
    , unknowns_(unknowns)
    , config_(config) {}

SolveReport EquationSolver::solveSystem() {
    SolveReport report;

    const auto live = constraints_.liveExpressions();
    if (live.empty()) {
        return report;
    }

    std::vector<Polynomial> residuals;
    residuals.reserve(live.size());
    for (const auto* expression : live) {
        residuals.push_back(expression->residual());
    }

    const AlgebraSolution solution = algebra_.solve(residuals);
    switch (solution.status) {
        case AlgebraSolution::Status::NoSolution: {
            std::ostringstream message;
            message << "relations admit no solution (" << solution.message << "):";
            for (const auto* expression : live) {
                message << "\n  " << constraints_.describe(*expression);
            }
            throw SystemInconsistency(message.str());
        }
        case AlgebraSolution::Status::Unsolvable:
            qCDebug(logSolver) << "Deferred" << live.size() << "relations:"
                               << QString::fromStdString(solution.message);
            report.outcome = SolveReport::Outcome::Deferred;
            report.message = solution.message;
            return report;
        case AlgebraSolution::Status::Solved:
            break;
    }

    const std::map<UnknownID, double> bindings = admissibleBindings(solution.branches);
    if (bindings.empty()) {
        report.outcome = SolveReport::Outcome::Deferred;
        report.message = "no unknown is determined yet";
        return report;
    }

    Binding substitution;
    for (const auto& [unknown, value] : bindings) {
        substitution.emplace(unknown, Polynomial(value));
        qCDebug(logSolver) << "Resolved" << QString::fromStdString(unknowns_.name(unknown)) << "=" << value;
    }
    constraints_.substituteAll(substitution);
    for (const auto& [unknown, value] : bindings) {
        measures_.substituteUnknown(unknown, value);
    }

    report.outcome = SolveReport::Outcome::Applied;
    report.applied = bindings;

    if (afterApply_) {
        afterApply_();
    }
    return report;
}

std::map<UnknownID, double> EquationSolver::admissibleBindings(const std::vector<Binding>& branches) const {
    if (branches.empty()) {
        throw SystemInconsistency("relations admit no solution branch");
    }

    std::set<UnknownID> unknowns;
    for (const Binding& branch : branches) {
        for (const auto& [unknown, value] : branch) {
            unknowns.insert(unknown);
        }
    }

    const auto sameValue = [this](const Polynomial& a, const Polynomial& b) {
        if (a.isConstant() && b.isConstant()) {
            return approximatelyEqual(a.constantTerm(), b.constantTerm(), config_.tolerance);
        }
        return a == b;
    };

    std::map<UnknownID, double> result;
    for (UnknownID unknown : unknowns) {
        // Bound in every branch, and bound to a number in every branch
        bool everywhere = true;
        bool numeric = true;
        bool unique = true;
        const Polynomial* first = nullptr;
        for (const Binding& branch : branches) {
            auto it = branch.find(unknown);
            if (it == branch.end()) {
                everywhere = false;
                numeric = false;
                unique = false;
                break;
            }
            numeric = numeric && it->second.isConstant();
            if (!first) {
                first = &it->second;
            } else if (!sameValue(*first, it->second)) {
                unique = false;
            }
        }

        if (unique) {
            if (!first->isConstant()) {
                continue;
            }
            const double value = first->constantTerm();
            if (!(value > config_.tolerance)) {
                std::ostringstream message;
                message << unknowns_.name(unknown) << " has the non-positive solution " << value;
                throw SystemInconsistency(message.str());
            }
            result.emplace(unknown, value);
            continue;
        }
        if (!everywhere || !numeric) {
            continue;
        }

        std::vector<double> candidates;
        for (const Binding& branch : branches) {
            const double value = branch.at(unknown).constantTerm();
            if (!(value > config_.tolerance)) {
                continue;
            }
            const bool seen = std::any_of(candidates.begin(), candidates.end(), [&](double candidate) {
                return approximatelyEqual(candidate, value, config_.tolerance);
            });
            if (!seen) {
                candidates.push_back(value);
            }
        }
        if (candidates.size() != 1) {
            std::ostringstream message;
            message << unknowns_.name(unknown);
            if (candidates.empty()) {
                message << " has no positive solution";
            } else {
                message << " is ambiguous between";
                for (double candidate : candidates) {
                    message << " " << candidate;
                }
            }
            throw SystemInconsistency(message.str());
        }
        result.emplace(unknown, candidates.front());
    }
    return result;
}

} // namespace geodeduce::core::solver
