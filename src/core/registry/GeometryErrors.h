#ifndef GEODEDUCE_CORE_REGISTRY_GEOMETRYERRORS_H
#define GEODEDUCE_CORE_REGISTRY_GEOMETRYERRORS_H

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace geodeduce::core {

/**
 * @brief Base of every error raised by the engine.
 */
class GeometryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid construction arguments or a geometric contradiction
class ConstructionError : public GeometryError {
public:
    using GeometryError::GeometryError;
};

/// Two point sequences on a common line cannot be reconciled
class CollinearSequenceError : public ConstructionError {
public:
    CollinearSequenceError(const std::string& what,
                           std::vector<std::string> first,
                           std::vector<std::string> second)
        : ConstructionError(what)
        , m_first(std::move(first))
        , m_second(std::move(second)) {}

    const std::vector<std::string>& firstSequence() const { return m_first; }
    const std::vector<std::string>& secondSequence() const { return m_second; }

private:
    std::vector<std::string> m_first;
    std::vector<std::string> m_second;
};

/// Two concrete numbers were bound to the same measure
class MeasureConflict : public GeometryError {
public:
    using GeometryError::GeometryError;
};

/// The constraint system has no admissible solution
class SystemInconsistency : public GeometryError {
public:
    using GeometryError::GeometryError;
};

/// A superseded entity or expression was mutated directly
class StaleReferenceUse : public GeometryError {
public:
    using GeometryError::GeometryError;
};

} // namespace geodeduce::core

#endif // GEODEDUCE_CORE_REGISTRY_GEOMETRYERRORS_H
