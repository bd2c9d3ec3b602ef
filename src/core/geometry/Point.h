/**
 * @file Point.h
 * @brief Labelled point
 *
 * Points carry no coordinates. Everything the engine knows about them comes
 * from the lines, polygons and measures that reference them.
 */
#ifndef GEODEDUCE_CORE_GEOMETRY_POINT_H
#define GEODEDUCE_CORE_GEOMETRY_POINT_H

#include "../registry/Entity.h"

namespace geodeduce::core::geometry {

class Point : public Entity {
public:
    explicit Point(std::string label) : Entity(std::move(label)) {}

    EntityType type() const override { return EntityType::Point; }

    const std::string& label() const { return key(); }
};

} // namespace geodeduce::core::geometry

#endif // GEODEDUCE_CORE_GEOMETRY_POINT_H
