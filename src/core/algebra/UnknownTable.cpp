#include "UnknownTable.h"

namespace geodeduce::core::algebra {

UnknownID UnknownTable::allocate(const std::string& kindName) {
    const int ordinal = ++perKindCounter_[kindName];
    names_.push_back("m" + kindName + std::to_string(ordinal));
    return static_cast<UnknownID>(names_.size());
}

std::string UnknownTable::name(UnknownID id) const {
    if (id == kInvalidUnknownID || id > names_.size()) {
        return "u" + std::to_string(id);
    }
    return names_[id - 1];
}

UnknownNamer UnknownTable::namer() const {
    return [this](UnknownID id) { return name(id); };
}

} // namespace geodeduce::core::algebra
