/**
 * @file Theorems.h
 * @brief Relation generators for classical plane geometry results.
 *
 * Each generator inspects registered entities and asserts the relations the
 * result implies through Figure::assertRelation. Generators never solve; the
 * caller decides when to run the equation solver.
 */
#ifndef GEODEDUCE_CORE_THEOREMS_THEOREMS_H
#define GEODEDUCE_CORE_THEOREMS_THEOREMS_H

#include "../registry/Entity.h"

#include <cstddef>
#include <vector>

namespace geodeduce::core::geometry {
class Figure;
}

namespace geodeduce::core::theorems {

/**
 * @brief Measures of @p angles sum to 180.
 */
bool definitionSupplementaryAngles(geometry::Figure& figure, const std::vector<EntityID>& angles);

/**
 * @brief Adjacent non-reflex angles at each single-point crossing of @p line are supplementary.
 * @return Number of relations asserted
 */
std::size_t straightAngleTheorem(geometry::Figure& figure, EntityID line);

/**
 * @brief Every segment of @p line with interior points equals the sum of its atomic parts.
 * @return Number of relations asserted
 */
std::size_t subsegmentSumTheorem(geometry::Figure& figure, EntityID line);

/**
 * @brief Adjacent non-reflex angles sharing a ray sum to the angle they span.
 * @return Number of relations asserted
 */
std::size_t angleAdditionPostulate(geometry::Figure& figure);

/**
 * @brief Interior angles of @p triangle sum to 180. Applies angle addition first.
 */
bool triangleAngleSumTheorem(geometry::Figure& figure, EntityID triangle);

/**
 * @brief area^2 = s(s-a)(s-b)(s-c)
 *
 * Only asserted when at most one side length is still unknown.
 */
bool heronsFormula(geometry::Figure& figure, EntityID triangle);

/**
 * @brief area = base * height / 2, using the legs when the triangle has a right angle.
 * @throws ConstructionError if @p altitude is not an altitude of @p triangle
 */
bool triangleAreaUsingAltitude(geometry::Figure& figure, EntityID triangle, EntityID altitude);

/**
 * @brief Sides adjacent to the bisected angle are proportional to the parts of the opposite side.
 * @throws ConstructionError if @p bisector is not an angle bisector of @p triangle
 */
bool angleBisectorTheorem(geometry::Figure& figure, EntityID triangle, EntityID bisector);

/**
 * @throws ConstructionError unless @p triangle has an angle measured at 90
 */
bool pythagoreanTheorem(geometry::Figure& figure, EntityID triangle);

} // namespace geodeduce::core::theorems

#endif // GEODEDUCE_CORE_THEOREMS_THEOREMS_H
