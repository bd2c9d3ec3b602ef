#include "Polynomial.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace geodeduce::core::algebra {

Monomial Monomial::of(UnknownID unknown, int exponent) {
    Monomial m;
    if (exponent > 0) {
        m.m_factors.emplace_back(unknown, exponent);
    }
    return m;
}

int Monomial::degree() const {
    int total = 0;
    for (const auto& [unknown, exponent] : m_factors) {
        total += exponent;
    }
    return total;
}

int Monomial::exponentOf(UnknownID unknown) const {
    for (const auto& [id, exponent] : m_factors) {
        if (id == unknown) {
            return exponent;
        }
    }
    return 0;
}

Monomial Monomial::without(UnknownID unknown) const {
    Monomial result;
    for (const auto& factor : m_factors) {
        if (factor.first != unknown) {
            result.m_factors.push_back(factor);
        }
    }
    return result;
}

Monomial Monomial::operator*(const Monomial& other) const {
    Monomial result;
    auto a = m_factors.begin();
    auto b = other.m_factors.begin();
    while (a != m_factors.end() || b != other.m_factors.end()) {
        if (b == other.m_factors.end() || (a != m_factors.end() && a->first < b->first)) {
            result.m_factors.push_back(*a++);
        } else if (a == m_factors.end() || b->first < a->first) {
            result.m_factors.push_back(*b++);
        } else {
            result.m_factors.emplace_back(a->first, a->second + b->second);
            ++a;
            ++b;
        }
    }
    return result;
}

Polynomial::Polynomial(double constant) {
    addTerm(Monomial(), constant);
}

Polynomial Polynomial::unknown(UnknownID id) {
    Polynomial p;
    p.addTerm(Monomial::of(id), 1.0);
    return p;
}

void Polynomial::addTerm(const Monomial& monomial, double coefficient) {
    if (coefficient == 0.0) {
        return;
    }
    auto it = m_terms.find(monomial);
    if (it == m_terms.end()) {
        m_terms.emplace(monomial, coefficient);
        return;
    }
    it->second += coefficient;
    if (it->second == 0.0) {
        m_terms.erase(it);
    }
}

Polynomial Polynomial::operator+(const Polynomial& other) const {
    Polynomial result = *this;
    result += other;
    return result;
}

Polynomial Polynomial::operator-(const Polynomial& other) const {
    Polynomial result = *this;
    result -= other;
    return result;
}

Polynomial Polynomial::operator*(const Polynomial& other) const {
    Polynomial result;
    for (const auto& [ma, ca] : m_terms) {
        for (const auto& [mb, cb] : other.m_terms) {
            result.addTerm(ma * mb, ca * cb);
        }
    }
    return result;
}

Polynomial Polynomial::operator-() const {
    Polynomial result;
    for (const auto& [monomial, coefficient] : m_terms) {
        result.m_terms.emplace(monomial, -coefficient);
    }
    return result;
}

Polynomial Polynomial::operator/(double divisor) const {
    Polynomial result;
    for (const auto& [monomial, coefficient] : m_terms) {
        result.addTerm(monomial, coefficient / divisor);
    }
    return result;
}

Polynomial& Polynomial::operator+=(const Polynomial& other) {
    for (const auto& [monomial, coefficient] : other.m_terms) {
        addTerm(monomial, coefficient);
    }
    return *this;
}

Polynomial& Polynomial::operator-=(const Polynomial& other) {
    for (const auto& [monomial, coefficient] : other.m_terms) {
        addTerm(monomial, -coefficient);
    }
    return *this;
}

Polynomial& Polynomial::operator*=(const Polynomial& other) {
    *this = *this * other;
    return *this;
}

Polynomial Polynomial::pow(unsigned exponent) const {
    Polynomial result(1.0);
    Polynomial base = *this;
    while (exponent > 0) {
        if (exponent & 1u) {
            result *= base;
        }
        exponent >>= 1u;
        if (exponent > 0) {
            base *= base;
        }
    }
    return result;
}

Polynomial Polynomial::substitute(const std::map<UnknownID, Polynomial>& bindings) const {
    if (bindings.empty()) {
        return *this;
    }
    Polynomial result;
    for (const auto& [monomial, coefficient] : m_terms) {
        Polynomial term(coefficient);
        Monomial kept;
        for (const auto& [unknown, exponent] : monomial.factors()) {
            auto it = bindings.find(unknown);
            if (it == bindings.end()) {
                kept = kept * Monomial::of(unknown, exponent);
            } else {
                term *= it->second.pow(static_cast<unsigned>(exponent));
            }
        }
        if (!kept.isUnit()) {
            Polynomial keptPoly;
            keptPoly.addTerm(kept, 1.0);
            term *= keptPoly;
        }
        result += term;
    }
    return result;
}

bool Polynomial::isConstant() const {
    return m_terms.empty() || (m_terms.size() == 1 && m_terms.begin()->first.isUnit());
}

double Polynomial::constantTerm() const {
    auto it = m_terms.find(Monomial());
    return it == m_terms.end() ? 0.0 : it->second;
}

int Polynomial::degree() const {
    int result = 0;
    for (const auto& [monomial, coefficient] : m_terms) {
        result = std::max(result, monomial.degree());
    }
    return result;
}

int Polynomial::degreeIn(UnknownID unknown) const {
    int result = 0;
    for (const auto& [monomial, coefficient] : m_terms) {
        result = std::max(result, monomial.exponentOf(unknown));
    }
    return result;
}

std::set<UnknownID> Polynomial::unknowns() const {
    std::set<UnknownID> result;
    for (const auto& [monomial, coefficient] : m_terms) {
        for (const auto& factor : monomial.factors()) {
            result.insert(factor.first);
        }
    }
    return result;
}

bool Polynomial::contains(UnknownID unknown) const {
    return degreeIn(unknown) > 0;
}

double Polynomial::maxAbsCoefficient() const {
    double result = 0.0;
    for (const auto& [monomial, coefficient] : m_terms) {
        result = std::max(result, std::fabs(coefficient));
    }
    return result;
}

std::pair<Polynomial, Polynomial> Polynomial::splitLinear(UnknownID unknown) const {
    Polynomial coefficientPart;
    Polynomial rest;
    for (const auto& [monomial, coefficient] : m_terms) {
        if (monomial.exponentOf(unknown) == 1) {
            coefficientPart.addTerm(monomial.without(unknown), coefficient);
        } else {
            rest.addTerm(monomial, coefficient);
        }
    }
    return {coefficientPart, rest};
}

std::vector<double> Polynomial::univariateCoefficients(UnknownID unknown) const {
    std::vector<double> coefficients(static_cast<std::size_t>(degreeIn(unknown)) + 1, 0.0);
    for (const auto& [monomial, coefficient] : m_terms) {
        coefficients[static_cast<std::size_t>(monomial.exponentOf(unknown))] += coefficient;
    }
    return coefficients;
}

Polynomial Polynomial::cleaned(double tolerance, double scale) const {
    const double threshold = tolerance * std::max({1.0, maxAbsCoefficient(), scale});
    Polynomial result;
    for (const auto& [monomial, coefficient] : m_terms) {
        if (std::fabs(coefficient) > threshold) {
            result.m_terms.emplace(monomial, coefficient);
        }
    }
    return result;
}

double Polynomial::substitutionScale(const std::map<UnknownID, Polynomial>& bindings) const {
    double magnitude = 1.0;
    for (const auto& [unknown, value] : bindings) {
        if (contains(unknown)) {
            magnitude = std::max(magnitude, value.maxAbsCoefficient());
        }
    }
    return std::max(1.0, maxAbsCoefficient()) * std::pow(magnitude, degree());
}

Polynomial Polynomial::normalized() const {
    if (m_terms.empty()) {
        return *this;
    }
    return *this / m_terms.rbegin()->second;
}

bool Polynomial::approxEquals(const Polynomial& other, double tolerance) const {
    const Polynomial diff = (*this - other);
    const double scale = std::max({1.0, maxAbsCoefficient(), other.maxAbsCoefficient()});
    return diff.maxAbsCoefficient() <= tolerance * scale;
}

std::string Polynomial::toString(const UnknownNamer& namer) const {
    if (m_terms.empty()) {
        return "0";
    }

    std::ostringstream out;
    out << std::setprecision(12);
    bool first = true;
    // Constant term last.
    for (auto it = m_terms.rbegin(); it != m_terms.rend(); ++it) {
        const Monomial& monomial = it->first;
        double coefficient = it->second;
        if (first) {
            if (coefficient < 0) {
                out << "-";
            }
        } else {
            out << (coefficient < 0 ? " - " : " + ");
        }
        coefficient = std::fabs(coefficient);

        const bool printCoefficient = monomial.isUnit() || coefficient != 1.0;
        if (printCoefficient) {
            out << coefficient;
        }
        bool firstFactor = !printCoefficient;
        for (const auto& [unknown, exponent] : monomial.factors()) {
            if (!firstFactor) {
                out << "*";
            }
            firstFactor = false;
            out << (namer ? namer(unknown) : "u" + std::to_string(unknown));
            if (exponent > 1) {
                out << "^" << exponent;
            }
        }
        first = false;
    }
    return out.str();
}

} // namespace geodeduce::core::algebra
