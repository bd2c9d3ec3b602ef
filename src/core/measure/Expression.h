#ifndef GEODEDUCE_CORE_MEASURE_EXPRESSION_H
#define GEODEDUCE_CORE_MEASURE_EXPRESSION_H

#include "../registry/Entity.h"
#include "../algebra/Polynomial.h"

#include <string>

namespace geodeduce::core::measure {

/**
 * @brief Asserted relation "residual == 0"
 *
 * Expressions are never edited. Substituting into one registers a
 * simplified successor and forwards the old handle to it.
 */
class Expression : public Entity {
public:
    enum class State {
        Unresolved,
        PartiallySubstituted,
        Resolved,      ///< Residual reduced to zero; no longer live
        Contradiction  ///< Residual reduced to a nonzero constant
    };

    Expression(std::string key, algebra::Polynomial residual, State state, std::string origin,
               EntityID predecessor = kInvalidEntityID)
        : Entity(std::move(key))
        , m_residual(std::move(residual))
        , m_state(state)
        , m_origin(std::move(origin))
        , m_predecessor(predecessor) {}

    EntityType type() const override { return EntityType::Expression; }

    const algebra::Polynomial& residual() const { return m_residual; }
    State state() const { return m_state; }
    bool isLive() const { return m_state == State::Unresolved || m_state == State::PartiallySubstituted; }

    /// Theorem or rule that asserted the relation
    const std::string& origin() const { return m_origin; }

    EntityID predecessor() const { return m_predecessor; }

private:
    friend class ConstraintStore;

    algebra::Polynomial m_residual;
    State m_state;
    std::string m_origin;
    EntityID m_predecessor;
};

} // namespace geodeduce::core::measure

#endif // GEODEDUCE_CORE_MEASURE_EXPRESSION_H
