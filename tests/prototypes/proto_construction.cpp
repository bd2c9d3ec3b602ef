#include "test_harness/TestHarness.h"
#include "geometry/Figure.h"

using namespace geodeduce::core;
using geometry::Figure;

namespace {

std::string keysOf(Figure& figure, const std::vector<EntityID>& ids) {
    std::string result;
    for (EntityID id : ids) {
        if (!result.empty()) {
            result += ", ";
        }
        result += figure.registry().resolveEntity(id)->key();
    }
    return result;
}

} // namespace

TEST_CASE(Construction_Is_Idempotent) {
    Figure figure;
    const EntityID a = figure.point("A");
    EXPECT_EQ(figure.point("A"), a);
    EXPECT_EQ(figure.label(a), std::string("A"));

    const EntityID ab = figure.segment("A B");
    EXPECT_EQ(figure.segment("B A"), ab);
    EXPECT_EQ(figure.findSegment(figure.point("B"), a), ab);

    const EntityID line = figure.line("A B C");
    EXPECT_EQ(figure.line("C B A"), line);
    EXPECT_EQ(figure.line("A C"), line);
    EXPECT_EQ(figure.lineThrough(ab), line);
}

TEST_CASE(Point_Handles_Build_The_Same_Entities_As_Labels) {
    Figure figure;
    const EntityID a = figure.point("A");
    const EntityID b = figure.point("B");
    const EntityID c = figure.point("C");

    EXPECT_EQ(figure.segment(a, b), figure.segment("A B"));
    EXPECT_EQ(figure.lineThrough(a, c), figure.line("A C"));
    EXPECT_EQ(figure.ray(b, a), figure.ray("B A"));
    EXPECT_EQ(figure.angle(a, b, c), figure.angle("A B C"));
    EXPECT_EQ(figure.points(std::vector<EntityID>{c, a}), figure.points("C A"));

    EXPECT_THROWS_AS(figure.segment(a, a), ConstructionError);
    EXPECT_THROWS_AS(figure.angle(a, b, a), ConstructionError);
}

TEST_CASE(Invalid_Point_Specifications_Are_Rejected) {
    Figure figure;
    EXPECT_THROWS_AS(figure.points(""), ConstructionError);
    EXPECT_THROWS_AS(figure.points("A A"), ConstructionError);
    EXPECT_THROWS_AS(figure.segment("A"), ConstructionError);
    EXPECT_THROWS_AS(figure.segment("A B C"), ConstructionError);
    EXPECT_THROWS_AS(figure.ray("A A"), ConstructionError);
    EXPECT_THROWS_AS(figure.angle("A B"), ConstructionError);
    EXPECT_THROWS_AS(figure.line("A"), ConstructionError);
    EXPECT_THROWS_AS(figure.triangle("A B C D"), ConstructionError);
    EXPECT_THROWS_AS(figure.point(""), ConstructionError);
}

TEST_CASE(Conflicting_Point_Orders_Raise_Collinear_Error) {
    Figure figure;
    figure.line("A B C");

    bool caught = false;
    try {
        figure.line("A D C");
    } catch (const CollinearSequenceError& error) {
        caught = true;
        EXPECT_EQ(error.firstSequence().size(), 3u);
        EXPECT_EQ(error.secondSequence().size(), 3u);
    }
    EXPECT_TRUE(caught);

    EXPECT_THROWS_AS(figure.line("A C B"), CollinearSequenceError);
}

TEST_CASE(Rays_Point_At_Farthest_Known_Point) {
    Figure figure;
    figure.line("A B C");

    const EntityID ab = figure.ray("A B");
    EXPECT_EQ(figure.ray("A C"), ab);
    EXPECT_EQ(figure.registry().raw(ab)->key(), std::string("A C"));

    const EntityID ba = figure.ray("B A");
    const EntityID bc = figure.ray("B C");
    EXPECT_NE(ba, bc);

    figure.line("A B C D");
    EXPECT_EQ(figure.registry().resolveEntity(bc)->key(), std::string("B D"));
    EXPECT_EQ(keysOf(figure, figure.pointsInRayDirection(bc)), std::string("C, D"));
    EXPECT_EQ(keysOf(figure, figure.pointsInRayDirection(figure.ray("C A"))), std::string("B, A"));
}

TEST_CASE(Angles_Are_Keyed_By_Their_Rays) {
    Figure figure;
    figure.line("B C D");
    const EntityID abc = figure.angle("A B C");
    EXPECT_EQ(figure.angle("A B D"), abc);
    EXPECT_EQ(figure.registry().raw(abc)->key(), std::string("A B D"));

    const EntityID cba = figure.angle("C B A");
    EXPECT_NE(cba, abc);
    EXPECT_EQ(figure.explementary(abc), cba);
    EXPECT_EQ(figure.findAngle(figure.point("A"), figure.point("B"), figure.point("C")), abc);

    EXPECT_THROWS_AS(figure.angleFromRays(figure.ray("B A"), figure.ray("C D")), ConstructionError);
    EXPECT_THROWS_AS(figure.angleFromRays(figure.ray("B A"), figure.ray("B A")), ConstructionError);
}

TEST_CASE(Find_Never_Constructs) {
    Figure figure;
    const EntityID a = figure.point("A");
    const EntityID b = figure.point("B");
    const EntityID c = figure.point("C");

    EXPECT_EQ(figure.findSegment(a, b), kInvalidEntityID);
    EXPECT_EQ(figure.findLine(a, b), kInvalidEntityID);
    EXPECT_EQ(figure.findAngle(a, b, c), kInvalidEntityID);
    EXPECT_EQ(figure.findAngle(a, a, c), kInvalidEntityID);
    EXPECT_TRUE(figure.entities(EntityType::Segment).empty());
    EXPECT_TRUE(figure.entities(EntityType::Line).empty());
    EXPECT_EQ(figure.knownPointsOnLine(a, b).size(), 2u);
}

TEST_CASE(Polygon_Orientation_Is_Fixed) {
    Figure figure;
    const EntityID abc = figure.triangle("A B C");
    EXPECT_EQ(figure.triangle("B C A"), abc);
    EXPECT_EQ(figure.triangle("C A B"), abc);
    EXPECT_THROWS_AS(figure.triangle("C B A"), ConstructionError);
    EXPECT_EQ(figure.findPolygon({figure.point("C"), figure.point("B"), figure.point("A")}), abc);

    EXPECT_EQ(keysOf(figure, figure.triangleSides(abc)), std::string("A B, B C, A C"));
    EXPECT_EQ(keysOf(figure, figure.triangleAngles(abc)), std::string("A B C, B C A, C A B"));

    const EntityID quad = figure.polygon("P Q R S");
    EXPECT_EQ(figure.registry().raw(quad)->type(), EntityType::Polygon);
    EXPECT_EQ(figure.polygon("R S P Q"), quad);
    EXPECT_EQ(figure.getEntityAs<geometry::Polygon>(quad)->segments().size(), 4u);
}

TEST_CASE(Collinear_Vertices_Do_Not_Form_A_Triangle) {
    Figure figure;
    figure.line("A B C");
    EXPECT_THROWS_AS(figure.triangle("A B C"), ConstructionError);
    EXPECT_THROWS_AS(figure.triangle("A C B"), ConstructionError);
    EXPECT_NO_THROW(figure.triangle("A B D"));
}

TEST_CASE(Line_Queries) {
    Figure figure;
    const EntityID first = figure.line("A O B");
    const EntityID second = figure.line("C O D");
    const EntityID third = figure.line("A C");

    EXPECT_EQ(figure.intersectionPoint(first, second), figure.point("O"));
    EXPECT_EQ(figure.intersectionPoint(first, first), kInvalidEntityID);
    EXPECT_EQ(figure.intersectionPoint(first, third), figure.point("A"));
    EXPECT_TRUE(figure.isInteriorOfKnownPoints(first, figure.point("O")));
    EXPECT_FALSE(figure.isInteriorOfKnownPoints(first, figure.point("A")));
    EXPECT_EQ(keysOf(figure, figure.knownPointsOnLine(figure.point("B"), figure.point("O"))),
              std::string("A, O, B"));
}

TEST_CASE(Segment_Decomposition) {
    Figure figure;
    const EntityID line = figure.line("A B C D");
    const EntityID ad = figure.segment("A D");
    const EntityID bd = figure.segment("B D");

    EXPECT_EQ(keysOf(figure, figure.containedPoints(ad)), std::string("A, B, C, D"));
    EXPECT_EQ(keysOf(figure, figure.atomicSubsegments(ad)), std::string("A B, B C, C D"));
    EXPECT_EQ(figure.subsegments(ad).size(), 5u);
    EXPECT_EQ(keysOf(figure, figure.segmentsWithSubsegments(line)), std::string("A C, A D, B D"));
    EXPECT_EQ(keysOf(figure, figure.componentsOf(bd)), std::string("A D"));

    figure.triangle("B D E");
    const auto components = figure.componentsOf(bd);
    EXPECT_EQ(components.size(), 2u);
    if (components.size() == 2) {
        EXPECT_EQ(figure.registry().raw(components[1])->type(), EntityType::Triangle);
    }
}

TEST_CASE(Nonreflex_Angles_Need_One_Known_Orientation) {
    Figure figure;
    const EntityID first = figure.line("A O B");
    const EntityID second = figure.line("C O D");

    EXPECT_TRUE(figure.nonreflexAnglesFormedByIntersection(first, second).empty());

    const EntityID aoc = figure.angle("A O C");
    figure.setReflex(aoc, false);

    const auto angles = figure.nonreflexAnglesFormedByIntersection(first, second);
    EXPECT_EQ(keysOf(figure, angles), std::string("A O C, C O B, B O D, D O A"));
    for (EntityID angle : angles) {
        EXPECT_TRUE(figure.reflex(angle) == std::optional<bool>(false));
    }
    EXPECT_TRUE(figure.reflex(figure.angle("C O A")) == std::optional<bool>(true));
    EXPECT_TRUE(figure.reflex(figure.angle("D O B")) == std::optional<bool>(true));
}

TEST_CASE(Reflex_Flag_Is_Immutable) {
    Figure figure;
    const EntityID abc = figure.angle("A B C", false);
    EXPECT_TRUE(figure.reflex(abc) == std::optional<bool>(false));
    EXPECT_NO_THROW(figure.setReflex(abc, false));
    EXPECT_THROWS_AS(figure.setReflex(abc, true), ConstructionError);
    EXPECT_TRUE(figure.reflex(figure.explementary(abc)) == std::optional<bool>(true));

}

TEST_CASE(Straight_Angle_Sides_Have_Opposite_Reflex_Flags) {
    Figure figure;
    figure.line("A B C");
    const EntityID abc = figure.angle("A B C");
    figure.setReflex(abc, false);
    figure.solve();

    const EntityID cba = figure.explementary(abc);
    EXPECT_EQ(cba, figure.angle("C B A"));
    EXPECT_TRUE(figure.reflex(abc) == std::optional<bool>(false));
    EXPECT_TRUE(figure.reflex(cba) == std::optional<bool>(true));

    figure.line("D E F");
    const EntityID def = figure.angle("D E F");
    EXPECT_NO_THROW(figure.setReflex(def, true));
    EXPECT_TRUE(figure.reflex(figure.explementary(def)) == std::optional<bool>(false));
}

TEST_CASE(Straight_Measure_Accepts_Either_Flag) {
    Figure figure;
    figure.line("P Q R");
    const EntityID pqr = figure.angle("P Q R");
    figure.setMeasure(pqr, 180.0);

    const EntityID rqp = figure.explementary(pqr);
    EXPECT_TRUE(figure.reflex(pqr) == std::optional<bool>(false));
    EXPECT_TRUE(figure.reflex(rqp) == std::optional<bool>(true));
    EXPECT_OPTIONAL_NEAR(figure.numericMeasure(rqp), 180.0, 1e-9);
}

int main() {
    return geodeduce::test::runAllTests();
}
