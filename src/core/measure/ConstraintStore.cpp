#include "ConstraintStore.h"
#include "../registry/GeometryErrors.h"
#include "../registry/Registry.h"

#include <QLoggingCategory>
#include <QString>

Q_LOGGING_CATEGORY(logConstraints, "geodeduce.core.measure.constraints")

namespace geodeduce::core::measure {

using algebra::Polynomial;

ConstraintStore::ConstraintStore(Registry& registry, const algebra::UnknownTable& unknowns,
                                 const SolverConfig& config)
    : registry_(registry)
    , unknowns_(unknowns)
    , config_(config) {}

EntityID ConstraintStore::assertZero(const Polynomial& residual, const std::string& origin) {
    const Polynomial cleaned = residual.cleaned(config_.tolerance);
    if (cleaned.isZero()) {
        return kInvalidEntityID;
    }
    if (cleaned.isConstant()) {
        throw SystemInconsistency("asserted relation " + cleaned.toString(unknowns_.namer()) + " = 0 from " +
                                  origin + " cannot hold");
    }

    const Polynomial normalized = cleaned.normalized();
    for (Expression* existing : liveExpressions()) {
        if (existing->residual().normalized().approxEquals(normalized, config_.tolerance)) {
            return existing->id();
        }
    }
    return registerExpression(cleaned, Expression::State::Unresolved, origin, kInvalidEntityID);
}

EntityID ConstraintStore::registerExpression(Polynomial residual, Expression::State state,
                                             const std::string& origin, EntityID predecessor) {
    auto* expression = registry_.create<Expression>("e" + std::to_string(nextOrdinal_++), std::move(residual),
                                                    state, origin, predecessor);
    qCDebug(logConstraints).noquote() << "Asserted" << QString::fromStdString(describe(*expression));
    return expression->id();
}

EntityID ConstraintStore::substitute(EntityID id, const std::map<algebra::UnknownID, Polynomial>& bindings) {
    auto* expression = dynamic_cast<Expression*>(registry_.raw(id));
    if (!expression) {
        throw ConstructionError("entity " + std::to_string(id) + " is not an expression");
    }
    if (expression->isSuperseded()) {
        throw StaleReferenceUse("substitution into superseded expression " + expression->key());
    }
    if (!expression->isLive()) {
        return id;
    }

    bool touched = false;
    for (const auto& [unknown, value] : bindings) {
        if (expression->residual().contains(unknown)) {
            touched = true;
            break;
        }
    }
    if (!touched) {
        return id;
    }

    const double scale = expression->residual().substitutionScale(bindings);
    const Polynomial next = expression->residual().substitute(bindings).cleaned(config_.tolerance, scale);
    if (next.isConstant() && !next.isZero()) {
        expression->m_state = Expression::State::Contradiction;
        throw SystemInconsistency("relation " + describe(*expression) + " reduces to " +
                                  next.toString(unknowns_.namer()) + " = 0");
    }

    const auto state = next.isZero() ? Expression::State::Resolved : Expression::State::PartiallySubstituted;
    const EntityID successor = registerExpression(next, state, expression->origin(), id);
    registry_.replace(id, successor);
    return successor;
}

void ConstraintStore::substituteAll(const std::map<algebra::UnknownID, Polynomial>& bindings) {
    for (Expression* expression : liveExpressions()) {
        substitute(expression->id(), bindings);
    }
}

std::vector<Expression*> ConstraintStore::liveExpressions() const {
    std::vector<Expression*> result;
    for (Entity* entity : registry_.elements(EntityType::Expression)) {
        auto* expression = static_cast<Expression*>(entity);
        if (expression->isLive()) {
            result.push_back(expression);
        }
    }
    return result;
}

Expression* ConstraintStore::expression(EntityID id) {
    return registry_.getAs<Expression>(id);
}

std::string ConstraintStore::describe(const Expression& expression) const {
    return expression.key() + ": " + expression.residual().toString(unknowns_.namer()) + " = 0 [" +
           expression.origin() + "]";
}

} // namespace geodeduce::core::measure
