#include "EliminationSolver.h"

#include <Eigen/Dense>
#include <Eigen/Eigenvalues>

#include <QLoggingCategory>

#include <algorithm>
#include <cmath>
#include <numeric>

Q_LOGGING_CATEGORY(logElimination, "geodeduce.core.solver.elimination")

namespace geodeduce::core::solver {

namespace {

constexpr double kImaginaryTolerance = 1e-7;

double evaluate(const std::vector<double>& coefficients, double x) {
    double value = 0.0;
    for (auto it = coefficients.rbegin(); it != coefficients.rend(); ++it) {
        value = value * x + *it;
    }
    return value;
}

double derivativeAt(const std::vector<double>& coefficients, double x) {
    double value = 0.0;
    for (std::size_t k = coefficients.size(); k-- > 1;) {
        value = value * x + static_cast<double>(k) * coefficients[k];
    }
    return value;
}

double polish(const std::vector<double>& coefficients, double root) {
    for (int i = 0; i < 3; ++i) {
        const double slope = derivativeAt(coefficients, root);
        if (slope == 0.0) {
            break;
        }
        root -= evaluate(coefficients, root) / slope;
    }
    return root;
}

std::vector<double> solveReduced(const std::vector<double>& q, double tolerance) {
    const std::size_t degree = q.size() - 1;
    std::vector<double> roots;

    if (degree == 1) {
        roots.push_back(-q[0] / q[1]);
    } else if (degree == 2) {
        const double a = q[2];
        const double b = q[1];
        const double c = q[0];
        const double disc = b * b - 4.0 * a * c;
        const double scale = std::max({1.0, b * b, std::fabs(4.0 * a * c)});
        if (disc < -tolerance * scale) {
            return roots;
        }
        if (std::fabs(disc) <= tolerance * scale) {
            roots.push_back(-b / (2.0 * a));
            return roots;
        }
        const double root = std::sqrt(disc);
        const double qq = -0.5 * (b + (b >= 0.0 ? root : -root));
        roots.push_back(qq / a);
        if (qq != 0.0) {
            roots.push_back(c / qq);
        }
    } else {
        // Companion matrix of the monic polynomial
        const auto n = static_cast<Eigen::Index>(degree);
        Eigen::MatrixXd companion = Eigen::MatrixXd::Zero(n, n);
        for (Eigen::Index i = 1; i < n; ++i) {
            companion(i, i - 1) = 1.0;
        }
        for (Eigen::Index i = 0; i < n; ++i) {
            companion(i, n - 1) = -q[static_cast<std::size_t>(i)] / q[degree];
        }
        Eigen::EigenSolver<Eigen::MatrixXd> eigen(companion, false);
        const Eigen::VectorXcd values = eigen.eigenvalues();
        for (Eigen::Index i = 0; i < values.size(); ++i) {
            const double re = values[i].real();
            if (std::fabs(values[i].imag()) <= kImaginaryTolerance * std::max(1.0, std::fabs(re))) {
                roots.push_back(polish(q, re));
            }
        }
    }
    return roots;
}

} // namespace

EliminationSolver::EliminationSolver(SolverConfig config)
    : config_(config) {}

std::vector<double> EliminationSolver::realRoots(const std::vector<double>& coefficients, double tolerance) {
    std::vector<double> c = coefficients;
    double largest = 0.0;
    for (double value : c) {
        largest = std::max(largest, std::fabs(value));
    }
    const double threshold = tolerance * std::max(1.0, largest);
    for (double& value : c) {
        if (std::fabs(value) <= threshold) {
            value = 0.0;
        }
    }
    while (!c.empty() && c.back() == 0.0) {
        c.pop_back();
    }
    if (c.size() < 2) {
        return {};
    }

    std::vector<double> roots;

    // Factor out x^z
    std::size_t lowest = 0;
    while (c[lowest] == 0.0) {
        ++lowest;
    }
    if (lowest > 0) {
        roots.push_back(0.0);
        c.erase(c.begin(), c.begin() + static_cast<std::ptrdiff_t>(lowest));
    }

    if (c.size() >= 2) {
        // Substitute t = x^g when only multiples of g occur
        std::size_t g = 0;
        for (std::size_t k = 1; k < c.size(); ++k) {
            if (c[k] != 0.0) {
                g = std::gcd(g, k);
            }
        }
        std::vector<double> reduced;
        for (std::size_t k = 0; k < c.size(); k += g) {
            reduced.push_back(c[k]);
        }

        for (double t : solveReduced(reduced, tolerance)) {
            if (g == 1) {
                roots.push_back(t);
            } else if (g % 2 == 0) {
                if (std::fabs(t) <= tolerance) {
                    roots.push_back(0.0);
                } else if (t > 0.0) {
                    const double r = std::pow(t, 1.0 / static_cast<double>(g));
                    roots.push_back(r);
                    roots.push_back(-r);
                }
            } else {
                const double r = std::pow(std::fabs(t), 1.0 / static_cast<double>(g));
                roots.push_back(t < 0.0 ? -r : r);
            }
        }
    }

    std::sort(roots.begin(), roots.end());
    roots.erase(std::unique(roots.begin(), roots.end(),
                            [tolerance](double a, double b) { return approximatelyEqual(a, b, tolerance); }),
                roots.end());
    return roots;
}

AlgebraSolution EliminationSolver::solve(const std::vector<Polynomial>& residuals) {
    AlgebraSolution solution;

    std::vector<Branch> work;
    work.push_back({residuals, {}});

    std::vector<Binding> results;
    std::size_t steps = 0;
    std::size_t opened = 1;
    bool anyProgress = false;
    bool anyStuck = false;

    while (!work.empty()) {
        Branch branch = std::move(work.back());
        work.pop_back();

        for (;;) {
            if (++steps > config_.maxEliminationSteps) {
                solution.status = AlgebraSolution::Status::Unsolvable;
                solution.message = "elimination step budget exhausted";
                qCDebug(logElimination) << "Giving up after" << steps << "steps";
                return solution;
            }

            if (simplify(branch) == StepResult::Contradiction) {
                break;
            }
            if (branch.residuals.empty()) {
                results.push_back(branch.binding);
                break;
            }

            const StepResult linear = eliminateLinear(branch);
            if (linear == StepResult::Contradiction) {
                break;
            }
            if (linear == StepResult::Progress) {
                anyProgress = true;
                continue;
            }

            if (isolateUnknown(branch) == StepResult::Progress) {
                anyProgress = true;
                continue;
            }

            auto split = splitOnUnivariate(branch);
            if (split) {
                anyProgress = true;
                if (split->empty()) {
                    break;
                }
                opened += split->size() - 1;
                if (opened > config_.maxBranches) {
                    solution.status = AlgebraSolution::Status::Unsolvable;
                    solution.message = "branch budget exhausted";
                    qCDebug(logElimination) << "Branch budget exhausted at" << opened << "branches";
                    return solution;
                }
                branch = std::move(split->front());
                for (std::size_t i = 1; i < split->size(); ++i) {
                    work.push_back(std::move((*split)[i]));
                }
                continue;
            }

            anyStuck = true;
            results.push_back(branch.binding);
            break;
        }
    }

    if (results.empty()) {
        solution.status = AlgebraSolution::Status::NoSolution;
        solution.message = "every solution branch is contradictory";
        return solution;
    }
    if (!anyProgress && anyStuck) {
        solution.status = AlgebraSolution::Status::Unsolvable;
        solution.message = "no residual could be reduced";
        return solution;
    }

    for (const Binding& candidate : results) {
        const bool duplicate = std::any_of(solution.branches.begin(), solution.branches.end(),
                                           [&](const Binding& kept) { return sameBinding(kept, candidate); });
        if (!duplicate) {
            solution.branches.push_back(candidate);
        }
    }
    solution.status = AlgebraSolution::Status::Solved;
    qCDebug(logElimination) << "Solved" << residuals.size() << "residuals into"
                            << solution.branches.size() << "branches";
    return solution;
}

EliminationSolver::StepResult EliminationSolver::simplify(Branch& branch) const {
    std::vector<Polynomial> remaining;
    remaining.reserve(branch.residuals.size());
    for (const Polynomial& residual : branch.residuals) {
        const double scale = residual.substitutionScale(branch.binding);
        Polynomial reduced = residual.substitute(branch.binding).cleaned(config_.tolerance, scale);
        if (reduced.isZero()) {
            continue;
        }
        if (reduced.isConstant()) {
            return StepResult::Contradiction;
        }
        remaining.push_back(std::move(reduced));
    }
    branch.residuals = std::move(remaining);
    return StepResult::Progress;
}

EliminationSolver::StepResult EliminationSolver::eliminateLinear(Branch& branch) const {
    std::vector<const Polynomial*> linear;
    std::set<UnknownID> unknownSet;
    for (const Polynomial& residual : branch.residuals) {
        if (residual.degree() == 1) {
            linear.push_back(&residual);
            const auto unknowns = residual.unknowns();
            unknownSet.insert(unknowns.begin(), unknowns.end());
        }
    }
    if (linear.empty()) {
        return StepResult::Stuck;
    }

    const std::vector<UnknownID> unknowns(unknownSet.begin(), unknownSet.end());
    const auto rows = static_cast<Eigen::Index>(linear.size());
    const auto cols = static_cast<Eigen::Index>(unknowns.size());

    Eigen::MatrixXd m = Eigen::MatrixXd::Zero(rows, cols + 1);
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (const auto& [monomial, coefficient] : linear[static_cast<std::size_t>(r)]->terms()) {
            if (monomial.isUnit()) {
                m(r, cols) = coefficient;
                continue;
            }
            const UnknownID unknown = monomial.factors().front().first;
            const auto col = std::lower_bound(unknowns.begin(), unknowns.end(), unknown) - unknowns.begin();
            m(r, col) = coefficient;
        }
    }

    const double threshold = config_.tolerance * std::max(1.0, m.cwiseAbs().maxCoeff());
    std::vector<Eigen::Index> pivots;
    Eigen::Index row = 0;
    for (Eigen::Index col = 0; col < cols && row < rows; ++col) {
        Eigen::Index best = row;
        m.col(col).segment(row, rows - row).cwiseAbs().maxCoeff(&best);
        best += row;
        if (std::fabs(m(best, col)) <= threshold) {
            continue;
        }
        if (best != row) {
            m.row(row).swap(m.row(best));
        }
        const double pivot = m(row, col);
        m.row(row) /= pivot;
        for (Eigen::Index r = 0; r < rows; ++r) {
            const double factor = m(r, col);
            if (r != row && factor != 0.0) {
                m.row(r) -= factor * m.row(row);
            }
        }
        pivots.push_back(col);
        ++row;
    }

    for (Eigen::Index r = row; r < rows; ++r) {
        if (std::fabs(m(r, cols)) > threshold) {
            return StepResult::Contradiction;
        }
    }
    if (pivots.empty()) {
        return StepResult::Stuck;
    }

    Binding additions;
    for (std::size_t k = 0; k < pivots.size(); ++k) {
        const auto r = static_cast<Eigen::Index>(k);
        Polynomial value(-m(r, cols));
        for (Eigen::Index col = 0; col < cols; ++col) {
            if (col == pivots[k] || std::fabs(m(r, col)) <= threshold) {
                continue;
            }
            value -= m(r, col) * Polynomial::unknown(unknowns[static_cast<std::size_t>(col)]);
        }
        additions.emplace(unknowns[static_cast<std::size_t>(pivots[k])], value.cleaned(config_.tolerance));
    }
    bind(branch, additions);
    return StepResult::Progress;
}

EliminationSolver::StepResult EliminationSolver::isolateUnknown(Branch& branch) const {
    for (const Polynomial& residual : branch.residuals) {
        for (UnknownID unknown : residual.unknowns()) {
            if (residual.degreeIn(unknown) != 1) {
                continue;
            }
            const auto [coefficient, rest] = residual.splitLinear(unknown);
            if (!coefficient.isConstant() || std::fabs(coefficient.constantTerm()) <= config_.tolerance) {
                continue;
            }
            Binding addition;
            addition.emplace(unknown, (-rest / coefficient.constantTerm()).cleaned(config_.tolerance));
            bind(branch, addition);
            return StepResult::Progress;
        }
    }
    return StepResult::Stuck;
}

std::optional<std::vector<EliminationSolver::Branch>>
EliminationSolver::splitOnUnivariate(const Branch& branch) const {
    const Polynomial* chosen = nullptr;
    UnknownID unknown = algebra::kInvalidUnknownID;
    for (const Polynomial& residual : branch.residuals) {
        const auto unknowns = residual.unknowns();
        if (unknowns.size() != 1) {
            continue;
        }
        if (chosen == nullptr || residual.degree() < chosen->degree()) {
            chosen = &residual;
            unknown = *unknowns.begin();
        }
    }
    if (chosen == nullptr) {
        return std::nullopt;
    }

    std::vector<Branch> branches;
    for (double root : realRoots(chosen->univariateCoefficients(unknown), config_.tolerance)) {
        Branch next = branch;
        Binding addition;
        addition.emplace(unknown, Polynomial(root));
        bind(next, addition);
        branches.push_back(std::move(next));
    }
    return branches;
}

void EliminationSolver::bind(Branch& branch, const Binding& additions) const {
    for (auto& [unknown, value] : branch.binding) {
        value = value.substitute(additions).cleaned(config_.tolerance);
    }
    for (const auto& [unknown, value] : additions) {
        branch.binding[unknown] = value;
    }
}

bool EliminationSolver::sameBinding(const Binding& a, const Binding& b) const {
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [unknown, value] : a) {
        auto it = b.find(unknown);
        if (it == b.end() || !value.approxEquals(it->second, config_.tolerance)) {
            return false;
        }
    }
    return true;
}

} // namespace geodeduce::core::solver
