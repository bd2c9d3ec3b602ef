#ifndef GEODEDUCE_CORE_ALGEBRA_UNKNOWNTABLE_H
#define GEODEDUCE_CORE_ALGEBRA_UNKNOWNTABLE_H

#include "Polynomial.h"

#include <map>
#include <string>
#include <vector>

namespace geodeduce::core::algebra {

/**
 * @brief Allocates unknowns and remembers their display names.
 *
 * Names are "m<Kind><n>" with n counted per kind, e.g. mSegment3.
 */
class UnknownTable {
public:
    UnknownID allocate(const std::string& kindName);

    std::string name(UnknownID id) const;
    std::size_t size() const { return names_.size(); }

    UnknownNamer namer() const;

private:
    std::vector<std::string> names_;
    std::map<std::string, int> perKindCounter_;
};

} // namespace geodeduce::core::algebra

#endif // GEODEDUCE_CORE_ALGEBRA_UNKNOWNTABLE_H
