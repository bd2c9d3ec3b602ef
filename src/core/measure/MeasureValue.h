#ifndef GEODEDUCE_CORE_MEASURE_MEASUREVALUE_H
#define GEODEDUCE_CORE_MEASURE_MEASUREVALUE_H

#include "../algebra/Polynomial.h"

#include <variant>

namespace geodeduce::core::measure {

using algebra::UnknownID;

/**
 * @brief Value of a measure: an unknown or a concrete positive number.
 */
class MeasureValue {
public:
    static MeasureValue unknown(UnknownID id) { return MeasureValue(id); }
    static MeasureValue number(double value) { return MeasureValue(value); }

    bool isNumber() const { return std::holds_alternative<double>(m_value); }
    bool isUnknown() const { return std::holds_alternative<UnknownID>(m_value); }

    double numberValue() const { return std::get<double>(m_value); }
    UnknownID unknownId() const { return std::get<UnknownID>(m_value); }

    algebra::Polynomial toPolynomial() const {
        return isNumber() ? algebra::Polynomial(numberValue()) : algebra::Polynomial::unknown(unknownId());
    }

    bool operator==(const MeasureValue& other) const { return m_value == other.m_value; }
    bool operator!=(const MeasureValue& other) const { return !(*this == other); }

private:
    explicit MeasureValue(UnknownID id) : m_value(id) {}
    explicit MeasureValue(double value) : m_value(value) {}

    std::variant<UnknownID, double> m_value;
};

} // namespace geodeduce::core::measure

#endif // GEODEDUCE_CORE_MEASURE_MEASUREVALUE_H
