/**
 * @file Polynomial.h
 * @brief Multivariate polynomials over measure unknowns.
 *
 * Residuals asserted by the engine are polynomials with real coefficients in
 * the unknowns allocated for measures. Terms are kept in a sorted map keyed
 * by monomial so structurally equal polynomials compare equal.
 */
#ifndef GEODEDUCE_CORE_ALGEBRA_POLYNOMIAL_H
#define GEODEDUCE_CORE_ALGEBRA_POLYNOMIAL_H

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace geodeduce::core::algebra {

using UnknownID = std::uint32_t;
constexpr UnknownID kInvalidUnknownID = 0;

/**
 * @brief Product of unknowns raised to positive powers, sorted by unknown.
 */
class Monomial {
public:
    Monomial() = default;
    static Monomial of(UnknownID unknown, int exponent = 1);

    bool isUnit() const { return m_factors.empty(); }
    int degree() const;
    int exponentOf(UnknownID unknown) const;
    Monomial without(UnknownID unknown) const;
    const std::vector<std::pair<UnknownID, int>>& factors() const { return m_factors; }

    Monomial operator*(const Monomial& other) const;
    bool operator<(const Monomial& other) const { return m_factors < other.m_factors; }
    bool operator==(const Monomial& other) const { return m_factors == other.m_factors; }

private:
    std::vector<std::pair<UnknownID, int>> m_factors;
};

using UnknownNamer = std::function<std::string(UnknownID)>;

class Polynomial {
public:
    Polynomial() = default;
    Polynomial(double constant);  // NOLINT(google-explicit-constructor)

    static Polynomial unknown(UnknownID id);

    // Arithmetic
    Polynomial operator+(const Polynomial& other) const;
    Polynomial operator-(const Polynomial& other) const;
    Polynomial operator*(const Polynomial& other) const;
    Polynomial operator-() const;
    Polynomial operator/(double divisor) const;
    Polynomial& operator+=(const Polynomial& other);
    Polynomial& operator-=(const Polynomial& other);
    Polynomial& operator*=(const Polynomial& other);
    Polynomial pow(unsigned exponent) const;

    /**
     * @brief Simultaneous substitution of unknowns by polynomials.
     */
    Polynomial substitute(const std::map<UnknownID, Polynomial>& bindings) const;

    // Queries
    bool isZero() const { return m_terms.empty(); }
    bool isConstant() const;
    double constantTerm() const;
    int degree() const;
    int degreeIn(UnknownID unknown) const;
    std::set<UnknownID> unknowns() const;
    bool contains(UnknownID unknown) const;
    std::size_t termCount() const { return m_terms.size(); }
    const std::map<Monomial, double>& terms() const { return m_terms; }
    double maxAbsCoefficient() const;

    /**
     * @brief Splits p = coefficient * x + rest where x does not occur in rest.
     *
     * Only meaningful when degreeIn(x) == 1.
     */
    std::pair<Polynomial, Polynomial> splitLinear(UnknownID unknown) const;

    /**
     * @brief Coefficients indexed by exponent; requires p to involve only that unknown.
     */
    std::vector<double> univariateCoefficients(UnknownID unknown) const;

    /**
     * @brief Drops coefficients negligible against the largest one or @p scale.
     */
    Polynomial cleaned(double tolerance, double scale = 0.0) const;

    /**
     * @brief Magnitude the result of substitute(bindings) should be judged against.
     *
     * Round-off after substituting large values grows with the coefficients
     * and the degree; a residual that reduces to a constant below
     * tolerance * scale is treated as zero.
     */
    double substitutionScale(const std::map<UnknownID, Polynomial>& bindings) const;

    /**
     * @brief Scaled so the leading term has coefficient 1. Zero stays zero.
     */
    Polynomial normalized() const;

    bool approxEquals(const Polynomial& other, double tolerance) const;
    bool operator==(const Polynomial& other) const { return m_terms == other.m_terms; }
    bool operator!=(const Polynomial& other) const { return !(*this == other); }

    std::string toString(const UnknownNamer& namer = {}) const;

private:
    void addTerm(const Monomial& monomial, double coefficient);

    std::map<Monomial, double> m_terms;
};

inline Polynomial operator+(double lhs, const Polynomial& rhs) { return Polynomial(lhs) + rhs; }
inline Polynomial operator-(double lhs, const Polynomial& rhs) { return Polynomial(lhs) - rhs; }
inline Polynomial operator*(double lhs, const Polynomial& rhs) { return Polynomial(lhs) * rhs; }

} // namespace geodeduce::core::algebra

#endif // GEODEDUCE_CORE_ALGEBRA_POLYNOMIAL_H
