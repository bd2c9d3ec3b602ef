#ifndef GEODEDUCE_CORE_DRIVER_TYPEONECONSTRUCTIONS_H
#define GEODEDUCE_CORE_DRIVER_TYPEONECONSTRUCTIONS_H

#include <cstddef>

namespace geodeduce::core::geometry {
class Figure;
}

namespace geodeduce::core::driver {

/**
 * @brief Constructs the triangles implied by cevians of known triangles
 *
 * For triangle (a, b, c) and a point X on the line through b and c with a
 * known segment aX, the triangles obtained by replacing b or c with X are
 * constructed with the orientation given by X's position along the line.
 * New triangles are processed the same way until nothing new appears.
 *
 * @return Number of triangles constructed
 */
std::size_t enumerateSubAndSuperTriangles(geometry::Figure& figure);

} // namespace geodeduce::core::driver

#endif // GEODEDUCE_CORE_DRIVER_TYPEONECONSTRUCTIONS_H
