#include "test_harness/TestHarness.h"
#include "driver/GoalDriver.h"
#include "driver/TypeOneConstructions.h"
#include "geometry/Figure.h"
#include "solver/AlgebraSolver.h"
#include "solver/EquationSolver.h"
#include "theorems/Theorems.h"

#include <memory>

using namespace geodeduce::core;
using geometry::Figure;

namespace {

// Returns a fixed answer instead of solving
class ScriptedAlgebra : public solver::AlgebraSolver {
public:
    explicit ScriptedAlgebra(solver::AlgebraSolution answer) : answer_(std::move(answer)) {}

    solver::AlgebraSolution solve(const std::vector<algebra::Polynomial>&) override {
        ++calls;
        return answer_;
    }

    int calls = 0;

private:
    solver::AlgebraSolution answer_;
};

} // namespace

//------------------------------------------------------------------------------
// Theorems applied directly
//------------------------------------------------------------------------------

TEST_CASE(Straight_Angles_At_Crossing_Lines) {
    Figure figure;
    const EntityID first = figure.line("A B C");
    figure.line("D B E");
    figure.setMeasure(figure.angle("A B D"), 70.0);

    EXPECT_EQ(theorems::straightAngleTheorem(figure, first), 4u);
    figure.solve();

    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(figure.angle("D B C")), 110.0, 1e-9);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(figure.angle("C B E")), 70.0, 1e-9);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(figure.angle("E B A")), 110.0, 1e-9);
    EXPECT_EQ(theorems::straightAngleTheorem(figure, first), 0u);
}

TEST_CASE(Straight_Angle_At_Line_End_Gives_One_Pair) {
    Figure figure;
    const EntityID base = figure.line("F G H");
    figure.line("G L");
    figure.setMeasure(figure.angle("L G F"), 90.0);

    EXPECT_EQ(theorems::straightAngleTheorem(figure, base), 1u);
    figure.solve();
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(figure.angle("H G L")), 90.0, 1e-9);
}

TEST_CASE(Subsegments_Conserve_Length) {
    Figure figure;
    const EntityID line = figure.line("A B C D E");
    EXPECT_EQ(theorems::subsegmentSumTheorem(figure, line), 6u);

    figure.setMeasure(figure.segment("A C"), 5.0);
    figure.setMeasure(figure.segment("C E"), 12.0);
    figure.setMeasure(figure.segment("B E"), 15.0);

    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(figure.segment("B C")), 3.0, 1e-9);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(figure.segment("A B")), 2.0, 1e-9);
    EXPECT_FALSE(figure.numericMeasure(figure.segment("D E")).has_value());
}

TEST_CASE(Adjacent_Angles_Add_Up) {
    Figure figure;
    figure.setMeasure(figure.angle("A O B"), 30.0);
    figure.setMeasure(figure.angle("B O C"), 40.0);

    EXPECT_EQ(theorems::angleAdditionPostulate(figure), 1u);
    figure.solve();
    const EntityID spanning = figure.angle("A O C");
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(spanning), 70.0, 1e-9);
    EXPECT_TRUE(figure.reflex(spanning) == std::optional<bool>(false));
}

TEST_CASE(Supplementary_Definition) {
    Figure figure;
    const EntityID first = figure.angle("A B C");
    const EntityID second = figure.angle("X Y Z");
    EXPECT_TRUE(theorems::definitionSupplementaryAngles(figure, {first, second}));
    figure.setMeasure(first, 125.0);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(second), 55.0, 1e-9);
}

TEST_CASE(Heron_Needs_Two_Known_Sides) {
    Figure figure;
    const EntityID abc = figure.triangle("A B C");
    figure.setMeasure(figure.segment("A B"), 3.0);
    EXPECT_FALSE(theorems::heronsFormula(figure, abc));

    figure.setMeasure(figure.segment("B C"), 4.0);
    EXPECT_TRUE(theorems::heronsFormula(figure, abc));
    figure.setMeasure(figure.segment("A C"), 5.0);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(abc), 6.0, 1e-9);
}

TEST_CASE(Theorems_Reject_Wrong_Figures) {
    Figure figure;
    const EntityID abc = figure.triangle("A B C");
    const EntityID ab = figure.segment("A B");

    EXPECT_THROWS_AS(theorems::pythagoreanTheorem(figure, abc), ConstructionError);
    EXPECT_THROWS_AS(theorems::triangleAreaUsingAltitude(figure, abc, ab), ConstructionError);
    EXPECT_THROWS_AS(theorems::angleBisectorTheorem(figure, abc, ab), ConstructionError);
    EXPECT_THROWS_AS(theorems::heronsFormula(figure, ab), ConstructionError);
}

//------------------------------------------------------------------------------
// Type-one constructions
//------------------------------------------------------------------------------

TEST_CASE(Cevian_Splits_Triangle) {
    Figure figure;
    figure.triangle("A B C");
    figure.line("B D C");
    figure.segment("A D");

    EXPECT_EQ(driver::enumerateSubAndSuperTriangles(figure), 2u);
    const auto a = figure.point("A");
    const auto b = figure.point("B");
    const auto c = figure.point("C");
    const auto d = figure.point("D");
    EXPECT_NE(figure.findPolygon({a, b, d}), kInvalidEntityID);
    EXPECT_NE(figure.findPolygon({a, d, c}), kInvalidEntityID);
    EXPECT_EQ(figure.registry().raw(figure.findPolygon({a, d, c}))->key(), std::string("A D C"));
    EXPECT_EQ(driver::enumerateSubAndSuperTriangles(figure), 0u);
}

TEST_CASE(Cevian_Builds_Enclosing_Triangle) {
    Figure figure;
    figure.triangle("A B D");
    figure.line("B D C");
    figure.segment("A C");

    EXPECT_EQ(driver::enumerateSubAndSuperTriangles(figure), 2u);
    EXPECT_NE(figure.findPolygon({figure.point("A"), figure.point("B"), figure.point("C")}), kInvalidEntityID);
    EXPECT_EQ(figure.entities(EntityType::Triangle).size(), 3u);
}

TEST_CASE(Two_Cevians_Give_Every_Triangle_On_The_Base) {
    Figure figure;
    figure.triangle("A B C");
    figure.line("B D E C");
    figure.segment("A D");
    figure.segment("A E");

    EXPECT_EQ(driver::enumerateSubAndSuperTriangles(figure), 5u);
    EXPECT_EQ(figure.entities(EntityType::Triangle).size(), 6u);
    const EntityID ade = figure.findPolygon({figure.point("A"), figure.point("D"), figure.point("E")});
    EXPECT_NE(ade, kInvalidEntityID);
    if (ade != kInvalidEntityID) {
        EXPECT_EQ(figure.registry().raw(ade)->key(), std::string("A D E"));
    }
    EXPECT_EQ(driver::enumerateSubAndSuperTriangles(figure), 0u);
}

//------------------------------------------------------------------------------
// Goal-directed derivation
//------------------------------------------------------------------------------

TEST_CASE(Solve_For_Angle_Across_Line) {
    Figure figure;
    figure.line("A B C");
    figure.line("D B E");
    figure.setMeasure(figure.angle("A B D"), 70.0);

    const auto value = figure.solveFor(figure.angle("C B E"));
    EXPECT_TRUE(value.isNumber());
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(figure.angle("C B E")), 70.0, 1e-9);
}

TEST_CASE(Solve_For_Third_Triangle_Angle) {
    Figure figure;
    figure.triangle("A B C");
    figure.setMeasure(figure.angle("A B C"), 60.0);
    figure.setMeasure(figure.angle("B C A"), 50.0);

    figure.solveFor(figure.angle("C A B"));
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(figure.angle("C A B")), 70.0, 1e-9);
}

TEST_CASE(Solve_For_Hypotenuse) {
    Figure figure;
    figure.triangle("A B C");
    figure.setMeasure(figure.angle("A B C"), 90.0);
    figure.setMeasure(figure.segment("A B"), 3.0);
    figure.setMeasure(figure.segment("B C"), 4.0);

    const auto value = figure.solveFor(figure.segment("A C"));
    EXPECT_TRUE(value.isNumber());
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(figure.segment("A C")), 5.0, 1e-9);
}

TEST_CASE(Solve_For_Area_With_Heron) {
    Figure figure;
    const EntityID abc = figure.triangle("A B C");
    figure.setMeasure(figure.segment("A B"), 3.0);
    figure.setMeasure(figure.segment("B C"), 4.0);
    figure.setMeasure(figure.segment("C A"), 5.0);

    figure.solveFor(abc);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(abc), 6.0, 1e-9);
}

TEST_CASE(Solve_For_Altitude_From_Area) {
    Figure figure;
    const EntityID abc = figure.triangle("A B C");
    figure.line("B D C");
    const EntityID ad = figure.segment("A D");
    figure.setMeasure(figure.angle("B D A"), 90.0);
    figure.setMeasure(figure.segment("B C"), 10.0);
    figure.setMeasure(abc, 30.0);

    const auto altitudes = figure.altitudes(abc);
    EXPECT_EQ(altitudes.size(), 1u);
    EXPECT_TRUE(!altitudes.empty() && altitudes[0] == ad);

    figure.solveFor(ad);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(ad), 6.0, 1e-9);
}

TEST_CASE(Solve_For_Segment_Split_By_Bisector) {
    Figure figure;
    const EntityID abc = figure.triangle("A B C");
    figure.line("A D C");
    const EntityID bd = figure.segment("B D");
    const EntityID abd = figure.angle("A B D");
    figure.setMeasure(figure.angle("D B C"), figure.measure(abd));
    figure.setMeasure(figure.segment("A B"), 6.0);
    figure.setMeasure(figure.segment("B C"), 9.0);
    figure.setMeasure(figure.segment("A D"), 4.0);

    const auto bisectors = figure.angleBisectors(abc);
    EXPECT_EQ(bisectors.size(), 1u);
    EXPECT_TRUE(!bisectors.empty() && bisectors[0] == bd);

    const EntityID dc = figure.segment("D C");
    figure.solveFor(dc);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(dc), 6.0, 1e-9);
}

TEST_CASE(Driver_Targets_Are_Measurable_And_Unique) {
    Figure figure;
    const EntityID ab = figure.segment("A B");
    auto& goals = figure.driver();

    EXPECT_THROWS_AS(goals.addTarget(figure.point("A")), ConstructionError);
    EXPECT_THROWS_AS(goals.addTarget(9999), ConstructionError);
    EXPECT_TRUE(goals.addTarget(ab));
    EXPECT_FALSE(goals.addTarget(ab));
    EXPECT_EQ(goals.targets().size(), 1u);
    EXPECT_FALSE(goals.isRunning());
}

TEST_CASE(Related_Unknowns_Become_Targets) {
    Figure figure;
    const EntityID ab = figure.segment("A B");
    const EntityID cd = figure.segment("C D");
    const EntityID ef = figure.segment("E F");
    figure.driver().addTarget(ab);

    figure.assertRelation(figure.measureSymbol(ab) + figure.measureSymbol(cd) - 10.0, "sum");
    figure.assertRelation(figure.measureSymbol(ef) - 3.0, "fixed");
    figure.solve();

    const auto& targets = figure.driver().targets();
    EXPECT_EQ(targets.size(), 2u);
    EXPECT_TRUE(std::find(targets.begin(), targets.end(), cd) != targets.end());
    EXPECT_TRUE(std::find(targets.begin(), targets.end(), ef) == targets.end());
}

TEST_CASE(Custom_Rule_Runs_After_Standard_Rules) {
    Figure figure;
    const EntityID xy = figure.segment("X Y");
    std::vector<std::string> seen;
    figure.driver().addRule(EntityType::Segment, {"fixed length", [&seen](Figure& target, EntityID segment) {
                                seen.push_back(target.describe(segment));
                                target.assertRelation(target.measureSymbol(segment) - 7.0, "fixed length");
                            }});

    const auto value = figure.solveFor(xy);
    EXPECT_TRUE(value.isNumber());
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(xy), 7.0, 1e-9);
    EXPECT_EQ(seen.size(), 1u);
}

//------------------------------------------------------------------------------
// Algebra capability seam
//------------------------------------------------------------------------------

TEST_CASE(Unsolvable_System_Is_Deferred) {
    solver::AlgebraSolution answer;
    answer.status = solver::AlgebraSolution::Status::Unsolvable;
    answer.message = "scripted";
    auto algebra = std::make_unique<ScriptedAlgebra>(answer);
    ScriptedAlgebra* scripted = algebra.get();
    Figure figure(EngineConfig{}, std::move(algebra));

    const EntityID ab = figure.segment("A B");
    figure.assertRelation(figure.measureSymbol(ab) - 2.0, "fixed");
    const auto report = figure.equationSolver().solveSystem();
    EXPECT_TRUE(report.outcome == solver::SolveReport::Outcome::Deferred);
    EXPECT_EQ(report.message, std::string("scripted"));
    EXPECT_EQ(scripted->calls, 1);
    EXPECT_FALSE(figure.numericMeasure(ab).has_value());
}

TEST_CASE(Near_Equal_Branches_Commit_Once) {
    solver::AlgebraSolution answer;
    answer.status = solver::AlgebraSolution::Status::Solved;
    const solver::Binding three{{1, algebra::Polynomial(3.0)}};
    const solver::Binding almostThree{{1, algebra::Polynomial(3.0 + 1e-12)}};
    const solver::Binding negative{{1, algebra::Polynomial(-3.0)}};
    answer.branches = {three, almostThree, negative};
    Figure figure(EngineConfig{}, std::make_unique<ScriptedAlgebra>(answer));

    const EntityID ab = figure.segment("A B");
    figure.assertRelation(figure.measureSymbol(ab).pow(2) - 9.0, "square");
    const auto report = figure.equationSolver().solveSystem();
    EXPECT_TRUE(report.outcome == solver::SolveReport::Outcome::Applied);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(ab), 3.0, 1e-9);
    EXPECT_TRUE(figure.constraints().liveExpressions().empty());
}

TEST_CASE(Distinct_Admissible_Branches_Are_Ambiguous) {
    solver::AlgebraSolution answer;
    answer.status = solver::AlgebraSolution::Status::Solved;
    const solver::Binding three{{1, algebra::Polynomial(3.0)}};
    const solver::Binding four{{1, algebra::Polynomial(4.0)}};
    answer.branches = {three, four};
    Figure figure(EngineConfig{}, std::make_unique<ScriptedAlgebra>(answer));

    const EntityID ab = figure.segment("A B");
    figure.assertRelation(figure.measureSymbol(ab).pow(2) - 7.0 * figure.measureSymbol(ab) + 12.0, "two roots");
    EXPECT_THROWS_AS(figure.equationSolver().solveSystem(), SystemInconsistency);
    EXPECT_FALSE(figure.numericMeasure(ab).has_value());
}

TEST_CASE(Negative_Partner_Does_Not_Hide_Ambiguity) {
    solver::AlgebraSolution answer;
    answer.status = solver::AlgebraSolution::Status::Solved;
    const solver::Binding first{{1, algebra::Polynomial(2.0)}, {2, algebra::Polynomial(-1.0)}};
    const solver::Binding second{{1, algebra::Polynomial(3.0)}, {2, algebra::Polynomial(4.0)}};
    answer.branches = {first, second};
    Figure figure(EngineConfig{}, std::make_unique<ScriptedAlgebra>(answer));

    const EntityID ab = figure.segment("A B");
    const EntityID cd = figure.segment("C D");
    const auto x = figure.measureSymbol(ab);
    const auto y = figure.measureSymbol(cd);
    figure.assertRelation(x * y - 12.0, "product");
    EXPECT_THROWS_AS(figure.equationSolver().solveSystem(), SystemInconsistency);
    EXPECT_FALSE(figure.numericMeasure(ab).has_value());
    EXPECT_FALSE(figure.numericMeasure(cd).has_value());
}

TEST_CASE(Each_Unknown_Filters_Its_Own_Candidates) {
    solver::AlgebraSolution answer;
    answer.status = solver::AlgebraSolution::Status::Solved;
    const solver::Binding first{{1, algebra::Polynomial(5.0)}, {2, algebra::Polynomial(-4.0)}};
    const solver::Binding second{{1, algebra::Polynomial(5.0)}, {2, algebra::Polynomial(4.0)}};
    answer.branches = {first, second};
    Figure figure(EngineConfig{}, std::make_unique<ScriptedAlgebra>(answer));

    const EntityID ab = figure.segment("A B");
    const EntityID cd = figure.segment("C D");
    figure.assertRelation(figure.measureSymbol(ab) - 5.0, "fixed");
    figure.assertRelation(figure.measureSymbol(cd).pow(2) - 16.0, "square");
    const auto report = figure.equationSolver().solveSystem();
    EXPECT_TRUE(report.outcome == solver::SolveReport::Outcome::Applied);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(ab), 5.0, 1e-9);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(cd), 4.0, 1e-9);
}

TEST_CASE(Shared_Non_Positive_Value_Is_Inconsistent) {
    solver::AlgebraSolution answer;
    answer.status = solver::AlgebraSolution::Status::Solved;
    const solver::Binding first{{1, algebra::Polynomial(-2.0)}, {2, algebra::Polynomial(3.0)}};
    const solver::Binding second{{1, algebra::Polynomial(-2.0)}, {2, algebra::Polynomial(-3.0)}};
    answer.branches = {first, second};
    Figure figure(EngineConfig{}, std::make_unique<ScriptedAlgebra>(answer));

    const EntityID ab = figure.segment("A B");
    const EntityID cd = figure.segment("C D");
    figure.assertRelation(figure.measureSymbol(ab) + 2.0, "fixed");
    figure.assertRelation(figure.measureSymbol(cd).pow(2) - 9.0, "square");
    EXPECT_THROWS_AS(figure.equationSolver().solveSystem(), SystemInconsistency);
    EXPECT_FALSE(figure.numericMeasure(cd).has_value());
}

int main() {
    return geodeduce::test::runAllTests();
}
