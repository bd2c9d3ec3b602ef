#include "test_harness/TestHarness.h"
#include "geometry/Figure.h"
#include "measure/ConstraintStore.h"
#include "solver/EquationSolver.h"

using namespace geodeduce::core;
using geometry::Figure;
using measure::MeasureValue;

//------------------------------------------------------------------------------
// Measure table
//------------------------------------------------------------------------------

TEST_CASE(Unset_Measure_Reads_As_Named_Unknown) {
    Figure figure;
    const EntityID ab = figure.segment("A B");

    const MeasureValue value = figure.measure(ab);
    EXPECT_TRUE(value.isUnknown());
    EXPECT_EQ(figure.measure(ab), value);
    EXPECT_TRUE(figure.measureSymbol(ab) == algebra::Polynomial::unknown(value.unknownId()));
    EXPECT_EQ(figure.describe(ab), std::string("Segment(A B) = mSegment1"));
    EXPECT_FALSE(figure.numericMeasure(ab).has_value());

    EXPECT_THROWS_AS(figure.measure(figure.point("A")), ConstructionError);
}

TEST_CASE(Conflicting_Numbers_Raise_Measure_Conflict) {
    Figure figure;
    const EntityID ab = figure.segment("A B");
    figure.setMeasure(ab, 5.0);

    EXPECT_NO_THROW(figure.setMeasure(ab, 5.0 + 1e-12));
    EXPECT_THROWS_AS(figure.setMeasure(ab, 6.0), MeasureConflict);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(ab), 5.0, 1e-12);
}

TEST_CASE(Inadmissible_Numbers_Are_Inconsistent) {
    Figure figure;
    const EntityID ab = figure.segment("A B");
    const EntityID abc = figure.angle("A B C");

    EXPECT_THROWS_AS(figure.setMeasure(ab, 0.0), SystemInconsistency);
    EXPECT_THROWS_AS(figure.setMeasure(ab, -3.0), SystemInconsistency);
    EXPECT_THROWS_AS(figure.setMeasure(abc, 360.0), SystemInconsistency);
    EXPECT_THROWS_AS(figure.setMeasure(abc, 400.0), SystemInconsistency);
    EXPECT_FALSE(figure.measures().peek(ab).has_value());
}

TEST_CASE(Shared_Unknown_Resolves_Everywhere) {
    Figure figure;
    const EntityID ab = figure.segment("A B");
    const EntityID cd = figure.segment("C D");
    const EntityID ef = figure.segment("E F");

    figure.setMeasure(ef, figure.measure(cd));
    figure.measure(ab);
    figure.setMeasure(ab, figure.measure(cd));
    EXPECT_EQ(figure.measures().entitiesMeasuredBy(figure.measure(cd).unknownId()).size(), 2u);

    figure.setMeasure(cd, 4.0);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(ab), 4.0, 1e-9);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(cd), 4.0, 1e-9);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(ef), 4.0, 1e-9);
}

TEST_CASE(Rejected_Resolution_Leaves_Every_Holder_Unknown) {
    Figure figure;
    const EntityID ab = figure.segment("A B");
    const EntityID pqr = figure.angle("P Q R");
    const auto shared = figure.measure(ab).unknownId();
    figure.setMeasure(pqr, figure.measure(ab));

    EXPECT_THROWS_AS(figure.measures().substituteUnknown(shared, 400.0), SystemInconsistency);
    EXPECT_FALSE(figure.numericMeasure(ab).has_value());
    EXPECT_FALSE(figure.numericMeasure(pqr).has_value());
    EXPECT_EQ(figure.measures().entitiesMeasuredBy(shared).size(), 2u);

    figure.measures().substituteUnknown(shared, 50.0);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(ab), 50.0, 1e-9);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(pqr), 50.0, 1e-9);
    EXPECT_TRUE(figure.measures().entitiesMeasuredBy(shared).empty());
}

//------------------------------------------------------------------------------
// Angle measures and reflex orientation
//------------------------------------------------------------------------------

TEST_CASE(Explementary_Angles_Sum_To_Full_Turn) {
    Figure figure;
    const EntityID abc = figure.angle("A B C");
    figure.setMeasure(abc, 70.0);

    const EntityID cba = figure.angle("C B A");
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(cba), 290.0, 1e-9);
    EXPECT_TRUE(figure.reflex(abc) == std::optional<bool>(false));
    EXPECT_TRUE(figure.reflex(cba) == std::optional<bool>(true));
    EXPECT_FALSE(figure.pairExplementary(abc));
}

TEST_CASE(Explementary_Of_Explementary_Is_Same_Angle) {
    Figure figure;
    const EntityID abc = figure.angle("A B C");
    const EntityID cba = figure.explementary(abc);
    EXPECT_NE(cba, abc);
    EXPECT_EQ(figure.explementary(cba), abc);

    // Extending ray B->C rekeys both angles
    figure.line("B C D");
    const EntityID abd = figure.resolve(abc);
    EXPECT_EQ(figure.getEntityAs<geometry::Angle>(abd)->key(), std::string("A B D"));
    const EntityID dba = figure.explementary(abd);
    EXPECT_EQ(dba, figure.resolve(cba));
    EXPECT_EQ(figure.explementary(dba), abd);
    EXPECT_EQ(figure.explementary(figure.explementary(abc)), abd);
}

TEST_CASE(Measure_Above_Straight_Marks_Reflex) {
    Figure figure;
    const EntityID abc = figure.angle("A B C");
    figure.setMeasure(abc, 200.0);

    EXPECT_TRUE(figure.reflex(abc) == std::optional<bool>(true));
    const EntityID other = figure.explementary(abc);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(other), 160.0, 1e-9);
    EXPECT_TRUE(figure.reflex(other) == std::optional<bool>(false));
}

TEST_CASE(Measure_Contradicting_Orientation_Is_Rejected) {
    Figure figure;
    const EntityID abc = figure.angle("A B C", false);
    EXPECT_THROWS_AS(figure.setMeasure(abc, 200.0), ConstructionError);
}

TEST_CASE(Explementary_Pair_Without_Numbers_Stays_Symbolic) {
    Figure figure;
    const EntityID abc = figure.angle("A B C");
    EXPECT_TRUE(figure.pairExplementary(abc));
    EXPECT_FALSE(figure.pairExplementary(figure.explementary(abc)));
    EXPECT_EQ(figure.constraints().liveExpressions().size(), 1u);
    EXPECT_FALSE(figure.numericMeasure(abc).has_value());
}

//------------------------------------------------------------------------------
// Constraint store
//------------------------------------------------------------------------------

TEST_CASE(Scaled_Duplicate_Relations_Are_Recorded_Once) {
    Figure figure;
    const auto x = figure.measureSymbol(figure.segment("A B"));
    const auto y = figure.measureSymbol(figure.segment("C D"));

    EXPECT_TRUE(figure.assertRelation(x - 2.0 * y, "test"));
    EXPECT_FALSE(figure.assertRelation(3.0 * x - 6.0 * y, "test"));
    EXPECT_FALSE(figure.assertRelation(x - x, "test"));
    EXPECT_THROWS_AS(figure.assertRelation(x - x + 1.0, "test"), SystemInconsistency);
    EXPECT_EQ(figure.constraints().liveExpressions().size(), 1u);
}

TEST_CASE(Substitution_Supersedes_Expression) {
    Registry registry;
    algebra::UnknownTable unknowns;
    SolverConfig config;
    measure::ConstraintStore store(registry, unknowns, config);

    const auto x = algebra::Polynomial::unknown(unknowns.allocate("Segment"));
    const auto y = algebra::Polynomial::unknown(unknowns.allocate("Segment"));
    const EntityID relation = store.assertZero(x + y - 10.0, "sum");
    EXPECT_NE(relation, kInvalidEntityID);
    EXPECT_EQ(store.assertZero(2.0 * x + 2.0 * y - 20.0, "sum again"), relation);
    EXPECT_EQ(store.assertZero(x - x, "nothing"), kInvalidEntityID);

    const EntityID partial = store.substitute(relation, {{1, algebra::Polynomial(4.0)}});
    EXPECT_NE(partial, relation);
    EXPECT_EQ(registry.resolve(relation), partial);
    EXPECT_TRUE(store.expression(relation)->residual() == y - 6.0);
    EXPECT_TRUE(store.expression(partial)->state() == measure::Expression::State::PartiallySubstituted);
    EXPECT_EQ(store.expression(partial)->predecessor(), relation);
    EXPECT_EQ(store.expression(partial)->origin(), std::string("sum"));

    EXPECT_THROWS_AS(store.substitute(relation, {{2, algebra::Polynomial(6.0)}}), StaleReferenceUse);

    const EntityID resolved = store.substitute(partial, {{2, algebra::Polynomial(6.0)}});
    EXPECT_TRUE(store.expression(resolved)->state() == measure::Expression::State::Resolved);
    EXPECT_TRUE(store.liveExpressions().empty());

    const EntityID other = store.assertZero(x - 3.0, "fixed");
    EXPECT_THROWS_AS(store.substitute(other, {{1, algebra::Polynomial(4.0)}}), SystemInconsistency);
    EXPECT_TRUE(store.expression(other)->state() == measure::Expression::State::Contradiction);
}

//------------------------------------------------------------------------------
// Solve policy
//------------------------------------------------------------------------------

TEST_CASE(Negative_Roots_Are_Discarded) {
    Figure figure;
    const EntityID ab = figure.segment("A B");
    figure.assertRelation(figure.measureSymbol(ab).pow(2) - 25.0, "square");
    figure.solve();
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(ab), 5.0, 1e-9);
}

TEST_CASE(Only_Negative_Roots_Are_Inconsistent) {
    Figure figure;
    const auto x = figure.measureSymbol(figure.segment("A B"));
    figure.assertRelation(x + 3.0, "negative");
    EXPECT_THROWS_AS(figure.solve(), SystemInconsistency);
}

TEST_CASE(Ambiguous_Roots_Are_Inconsistent) {
    Figure figure;
    const auto x = figure.measureSymbol(figure.segment("A B"));
    figure.assertRelation(x.pow(2) - 5.0 * x + 6.0, "two roots");
    EXPECT_THROWS_AS(figure.solve(), SystemInconsistency);
}

TEST_CASE(Parametric_Unknowns_Wait_For_More_Facts) {
    Figure figure;
    const EntityID ab = figure.segment("A B");
    const EntityID cd = figure.segment("C D");
    const EntityID ef = figure.segment("E F");
    const auto x = figure.measureSymbol(ab);
    const auto y = figure.measureSymbol(cd);

    figure.assertRelation(x - y - 1.0, "offset");
    figure.assertRelation(figure.measureSymbol(ef) - 2.0, "fixed");

    const auto report = figure.equationSolver().solveSystem();
    EXPECT_TRUE(report.outcome == solver::SolveReport::Outcome::Applied);
    EXPECT_EQ(report.applied.size(), 1u);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(ef), 2.0, 1e-9);
    EXPECT_FALSE(figure.numericMeasure(ab).has_value());
    EXPECT_FALSE(figure.numericMeasure(cd).has_value());

    figure.setMeasure(cd, 3.0);
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(ab), 4.0, 1e-9);
}

TEST_CASE(Manual_Solve_When_Auto_Solve_Is_Off) {
    EngineConfig config;
    config.autoSolve = false;
    Figure figure(config);

    const EntityID ab = figure.segment("A B");
    const EntityID bc = figure.segment("B C");
    const EntityID ac = figure.segment("A C");
    figure.assertRelation(figure.measureSymbol(ab) + figure.measureSymbol(bc) - figure.measureSymbol(ac), "sum");
    figure.setMeasure(ab, 2.0);
    figure.setMeasure(bc, 3.0);
    EXPECT_FALSE(figure.numericMeasure(ac).has_value());

    figure.solve();
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(ac), 5.0, 1e-9);
}

int main() {
    return geodeduce::test::runAllTests();
}
