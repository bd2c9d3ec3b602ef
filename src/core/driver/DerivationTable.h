/**
 * @file DerivationTable.h
 * @brief Ordered derivation rules per entity kind
 *
 * The goal driver applies the rules registered for a target's kind in
 * registration order and stops as soon as the target's measure is numeric.
 * Type-one rules are structural constructions run once before the first
 * target is processed.
 */
#ifndef GEODEDUCE_CORE_DRIVER_DERIVATIONTABLE_H
#define GEODEDUCE_CORE_DRIVER_DERIVATIONTABLE_H

#include "../registry/Entity.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace geodeduce::core::geometry {
class Figure;
}

namespace geodeduce::core::driver {

struct DerivationRule {
    std::string name;
    std::function<void(geometry::Figure&, EntityID)> apply;
};

struct TypeOneRule {
    std::string name;
    std::function<void(geometry::Figure&)> apply;
};

class DerivationTable {
public:
    void addRule(EntityType type, DerivationRule rule);
    void addTypeOneRule(TypeOneRule rule);

    /// Rules for @p type in application order; empty if none
    const std::vector<DerivationRule>& rulesFor(EntityType type) const;
    const std::vector<TypeOneRule>& typeOneRules() const { return typeOne_; }

    /**
     * @brief Segment, Angle and Triangle rules built from the theorem generators
     *
     * Segment: subsegment sum, area equivalence, angle bisector ratio,
     * Pythagorean relation. Angle: explementary pairing, straight angles,
     * triangle angle sum, angle addition. Triangle: Heron's formula and
     * area from each altitude.
     */
    static DerivationTable standard();

private:
    std::map<EntityType, std::vector<DerivationRule>> rules_;
    std::vector<TypeOneRule> typeOne_;
};

} // namespace geodeduce::core::driver

#endif // GEODEDUCE_CORE_DRIVER_DERIVATIONTABLE_H
