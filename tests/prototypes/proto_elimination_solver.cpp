#include "test_harness/TestHarness.h"
#include "solver/EliminationSolver.h"

using namespace geodeduce::core;
using namespace geodeduce::core::solver;

namespace {

const Polynomial x = Polynomial::unknown(1);
const Polynomial y = Polynomial::unknown(2);
const Polynomial z = Polynomial::unknown(3);

double valueOf(const Binding& binding, UnknownID unknown) {
    auto it = binding.find(unknown);
    if (it == binding.end() || !it->second.isConstant()) {
        return std::nan("");
    }
    return it->second.constantTerm();
}

} // namespace

TEST_CASE(Linear_System_Binds_Every_Unknown) {
    EliminationSolver solver;
    const auto result = solver.solve({x + y - 10.0, x - y - 2.0});

    EXPECT_TRUE(result.status == AlgebraSolution::Status::Solved);
    EXPECT_EQ(result.branches.size(), 1u);
    EXPECT_NEAR(valueOf(result.branches[0], 1), 6.0, 1e-9);
    EXPECT_NEAR(valueOf(result.branches[0], 2), 4.0, 1e-9);
}

TEST_CASE(Underdetermined_Linear_System_Is_Parametric) {
    EliminationSolver solver;
    const auto result = solver.solve({x - y - 1.0});

    EXPECT_TRUE(result.status == AlgebraSolution::Status::Solved);
    EXPECT_EQ(result.branches.size(), 1u);
    const Binding& binding = result.branches[0];
    EXPECT_EQ(binding.count(1), 1u);
    EXPECT_FALSE(binding.at(1).isConstant());
    EXPECT_TRUE(binding.at(1).approxEquals(y + 1.0, 1e-9));
}

TEST_CASE(Chained_Substitution_Reaches_Nonlinear_Residual) {
    // z = 2, x = z + 1, x * y = 12
    EliminationSolver solver;
    const auto result = solver.solve({z - 2.0, x - z - 1.0, x * y - 12.0});

    EXPECT_TRUE(result.status == AlgebraSolution::Status::Solved);
    EXPECT_EQ(result.branches.size(), 1u);
    EXPECT_NEAR(valueOf(result.branches[0], 1), 3.0, 1e-9);
    EXPECT_NEAR(valueOf(result.branches[0], 2), 4.0, 1e-9);
    EXPECT_NEAR(valueOf(result.branches[0], 3), 2.0, 1e-9);
}

TEST_CASE(Quadratic_Opens_One_Branch_Per_Root) {
    EliminationSolver solver;
    const auto result = solver.solve({x.pow(2) - 25.0});

    EXPECT_TRUE(result.status == AlgebraSolution::Status::Solved);
    EXPECT_EQ(result.branches.size(), 2u);
    std::vector<double> roots;
    for (const auto& branch : result.branches) {
        roots.push_back(valueOf(branch, 1));
    }
    std::sort(roots.begin(), roots.end());
    EXPECT_NEAR(roots[0], -5.0, 1e-9);
    EXPECT_NEAR(roots[1], 5.0, 1e-9);
}

TEST_CASE(Contradiction_Reports_No_Solution) {
    EliminationSolver solver;
    EXPECT_TRUE(solver.solve({x - 1.0, x - 2.0}).status == AlgebraSolution::Status::NoSolution);
    EXPECT_TRUE(solver.solve({x.pow(2) + 1.0}).status == AlgebraSolution::Status::NoSolution);
}

TEST_CASE(Irreducible_System_Is_Unsolvable) {
    EliminationSolver solver;
    const auto result = solver.solve({x * y - 6.0});
    EXPECT_TRUE(result.status == AlgebraSolution::Status::Unsolvable);
    EXPECT_FALSE(result.message.empty());
}

TEST_CASE(Branch_Budget_Gives_Up) {
    SolverConfig config;
    config.maxBranches = 1;
    EliminationSolver solver(config);
    EXPECT_TRUE(solver.solve({x.pow(2) - 4.0}).status == AlgebraSolution::Status::Unsolvable);
}

TEST_CASE(Real_Roots_Of_Cubic_And_Even_Powers) {
    const auto cubic = EliminationSolver::realRoots({-6.0, 11.0, -6.0, 1.0}, 1e-9);
    EXPECT_EQ(cubic.size(), 3u);
    if (cubic.size() == 3) {
        EXPECT_NEAR(cubic[0], 1.0, 1e-7);
        EXPECT_NEAR(cubic[1], 2.0, 1e-7);
        EXPECT_NEAR(cubic[2], 3.0, 1e-7);
    }

    const auto quartic = EliminationSolver::realRoots({-16.0, 0.0, 0.0, 0.0, 1.0}, 1e-9);
    EXPECT_EQ(quartic.size(), 2u);
    if (quartic.size() == 2) {
        EXPECT_NEAR(quartic[0], -2.0, 1e-7);
        EXPECT_NEAR(quartic[1], 2.0, 1e-7);
    }

    EXPECT_TRUE(EliminationSolver::realRoots({1.0, 0.0, 1.0}, 1e-9).empty());
    EXPECT_TRUE(EliminationSolver::realRoots({5.0}, 1e-9).empty());
}

int main() {
    return geodeduce::test::runAllTests();
}
