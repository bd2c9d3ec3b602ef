#include "Figure.h"
#include "../driver/GoalDriver.h"
#include "../solver/EliminationSolver.h"
#include "../solver/EquationSolver.h"

#include <QLoggingCategory>
#include <QString>

#include <sstream>

Q_LOGGING_CATEGORY(logFigure, "geodeduce.core.figure")

namespace geodeduce::core::geometry {

namespace {

constexpr double kStraightAngle = 180.0;

// Clears a re-entrancy flag on every exit path
class ScopedFlag {
public:
    explicit ScopedFlag(bool& flag) : flag_(flag) { flag_ = true; }
    ~ScopedFlag() { flag_ = false; }

    ScopedFlag(const ScopedFlag&) = delete;
    ScopedFlag& operator=(const ScopedFlag&) = delete;

private:
    bool& flag_;
};

} // namespace

Figure::Figure(EngineConfig config)
    : Figure(config, std::make_unique<solver::EliminationSolver>(config.solver)) {}

Figure::Figure(EngineConfig config, std::unique_ptr<solver::AlgebraSolver> algebra)
    : config_(config)
    , registry_(config_.maxCascadeSteps)
    , constraints_(registry_, unknowns_, config_.solver)
    , measures_(registry_, unknowns_, constraints_, config_.solver)
    , algebra_(std::move(algebra)) {
    registry_.setObserver(this);
    measures_.setListener(this);
    equationSolver_ = std::make_unique<solver::EquationSolver>(constraints_, measures_, *algebra_, unknowns_,
                                                               config_.solver);
    driver_ = std::make_unique<driver::GoalDriver>(*this);
    equationSolver_->setAfterApply([this]() { driver_->expandTargets(); });
}

Figure::~Figure() {
    registry_.setObserver(nullptr);
    measures_.setListener(nullptr);
}

//--------------------------------------------------------------------------
// Measures
//--------------------------------------------------------------------------

measure::MeasureValue Figure::measure(EntityID entity) {
    return measures_.read(entity);
}

algebra::Polynomial Figure::measureSymbol(EntityID entity) {
    return measures_.read(entity).toPolynomial();
}

std::optional<double> Figure::numericMeasure(EntityID entity) {
    return measures_.numeric(entity);
}

void Figure::setMeasure(EntityID entity, double value) {
    setMeasure(entity, measure::MeasureValue::number(value));
}

void Figure::setMeasure(EntityID entity, const measure::MeasureValue& value) {
    measures_.assign(entity, value);
    needsSolve_ = true;
    commit();
}

bool Figure::assertRelation(const algebra::Polynomial& residual, const std::string& origin) {
    const std::size_t before = constraints_.liveExpressions().size();
    const bool recorded = constraints_.assertZero(residual, origin) != kInvalidEntityID &&
                          constraints_.liveExpressions().size() > before;
    needsSolve_ = needsSolve_ || recorded;
    return recorded;
}

bool Figure::pairExplementary(EntityID angle) {
    Angle& first = require<Angle>(angle, "angle");
    if (first.explementaryPaired()) {
        return false;
    }
    Angle& second = require<Angle>(ensureAngle(first.ray2(), first.ray1()), "angle");
    first.markExplementaryPaired();
    second.markExplementaryPaired();
    return assertRelation(measureSymbol(first.id()) + measureSymbol(second.id()) - 360.0, "explementary angles");
}

void Figure::solve() {
    settle(true);
}

measure::MeasureValue Figure::solveFor(EntityID entity) {
    settle(true);
    driver_->addTarget(entity);
    driver_->run();
    return measures_.read(entity);
}

//--------------------------------------------------------------------------
// Registry and measure callbacks
//--------------------------------------------------------------------------

void Figure::entityReplaced(Entity& old, Entity& survivor) {
    if (!measure::MeasureTable::isMeasurable(old.type())) {
        return;
    }
    if (measures_.reconcile(old, survivor)) {
        needsSolve_ = true;
    }
    if (old.type() != EntityType::Angle) {
        return;
    }

    auto& from = static_cast<Angle&>(old);
    auto& to = static_cast<Angle&>(survivor);
    if (from.reflex()) {
        if (to.reflex() && *to.reflex() != *from.reflex()) {
            throw ConstructionError("merging " + from.toString() + " into " + to.toString() +
                                    " contradicts their reflex flags");
        }
        if (!to.reflex()) {
            to.setReflex(*from.reflex());
            reflexWork_.push_back({to.id(), *from.reflex()});
        }
    }
    if (from.explementaryPaired()) {
        to.markExplementaryPaired();
    }
    if (to.measure() && to.measure()->isNumber()) {
        angleWork_.push_back(to.id());
    }
}

void Figure::dependencyChanged(EntityID subscriber, EntityID oldSource, EntityID newSource) {
    Entity* entity = registry_.raw(subscriber);
    if (!entity) {
        return;
    }
    switch (entity->type()) {
        case EntityType::Ray:
            onLineChanged(subscriber);
            break;
        case EntityType::Angle:
            onRayChanged(subscriber, oldSource, newSource);
            break;
        default:
            break;
    }
}

std::string Figure::identity(const Entity& entity) {
    if (entity.type() == EntityType::Angle) {
        const auto& angle = static_cast<const Angle&>(entity);
        return std::to_string(registry_.resolve(angle.ray1())) + ":" +
               std::to_string(registry_.resolve(angle.ray2()));
    }
    return entity.key();
}

void Figure::measureAssigned(EntityID entity) {
    Entity* assigned = registry_.resolveEntity(entity);
    if (assigned && assigned->type() == EntityType::Angle) {
        angleWork_.push_back(assigned->id());
    }
}

//--------------------------------------------------------------------------
// Reflex bookkeeping
//--------------------------------------------------------------------------

bool Figure::isStraight(const Angle& angle) {
    return lineOfRay(angle.ray1()) == lineOfRay(angle.ray2());
}

void Figure::applyReflex(EntityID angle, bool reflex) {
    Angle& target = require<Angle>(angle, "angle");
    if (target.reflex()) {
        if (*target.reflex() != reflex) {
            throw ConstructionError(target.toString() + " is already " +
                                    (*target.reflex() ? "reflex" : "non-reflex"));
        }
        return;
    }
    target.setReflex(reflex);
    qCDebug(logFigure) << QString::fromStdString(target.toString()) << "reflex =" << reflex;
    reflexWork_.push_back({target.id(), reflex});
}

void Figure::propagateReflex(const ReflexUpdate& update) {
    Angle& angle = require<Angle>(update.angle, "angle");
    const EntityID explementary = ensureAngle(angle.ray2(), angle.ray1());
    applyReflex(explementary, !update.reflex);
    if (!isStraight(angle)) {
        computeNonreflexAngles(lineOfRay(angle.ray1()), lineOfRay(angle.ray2()));
    }
}

void Figure::setReflex(EntityID angle, bool reflex) {
    applyReflex(angle, reflex);
    commit();
}

std::optional<bool> Figure::reflex(EntityID angle) {
    return require<Angle>(angle, "angle").reflex();
}

void Figure::checkAngleMeasure(EntityID angle) {
    Angle* target = registry_.getAs<Angle>(angle);
    if (!target) {
        return;
    }
    const auto value = measures_.numeric(target->id());
    if (!value) {
        return;
    }
    const double tolerance = config_.solver.tolerance * kStraightAngle;
    if (*value < kStraightAngle - tolerance) {
        applyReflex(target->id(), false);
    } else if (*value > kStraightAngle + tolerance) {
        applyReflex(target->id(), true);
    } else if (!target->reflex()) {
        applyReflex(target->id(), false);
    }
    pairExplementary(target->id());
}

//--------------------------------------------------------------------------
// Settling
//--------------------------------------------------------------------------

void Figure::commit() {
    settle(false);
}

void Figure::settle(bool forceSolve) {
    if (settling_) {
        return;
    }
    ScopedFlag guard(settling_);

    bool progress = true;
    while (progress) {
        progress = false;
        registry_.processNotifications();

        while (!reflexWork_.empty()) {
            const ReflexUpdate update = reflexWork_.front();
            reflexWork_.pop_front();
            propagateReflex(update);
            progress = true;
        }
        while (!angleWork_.empty()) {
            const EntityID angle = angleWork_.front();
            angleWork_.pop_front();
            checkAngleMeasure(angle);
            progress = true;
        }

        if (needsSolve_ && (config_.autoSolve || forceSolve)) {
            needsSolve_ = false;
            const solver::SolveReport report = equationSolver_->solveSystem();
            if (report.outcome == solver::SolveReport::Outcome::Applied) {
                qCDebug(logFigure) << "Solver resolved" << report.applied.size() << "unknowns";
                progress = true;
            }
        }
    }
}

//--------------------------------------------------------------------------
// Description
//--------------------------------------------------------------------------

std::string Figure::label(EntityID point) {
    return require<Point>(point, "point").label();
}

std::string Figure::describe(EntityID entity) {
    Entity* resolved = registry_.resolveEntity(entity);
    if (!resolved) {
        throw ConstructionError("unknown entity id " + std::to_string(entity));
    }
    if (resolved->type() == EntityType::Expression) {
        return constraints_.describe(static_cast<const measure::Expression&>(*resolved));
    }

    std::ostringstream out;
    out << resolved->toString();
    if (auto* measurable = dynamic_cast<MeasurableEntity*>(resolved); measurable && measurable->measure()) {
        const auto& value = *measurable->measure();
        out << " = ";
        if (value.isNumber()) {
            out << value.numberValue();
        } else {
            out << unknowns_.name(value.unknownId());
        }
    }
    if (resolved->type() == EntityType::Angle) {
        const auto& flag = static_cast<const Angle*>(resolved)->reflex();
        if (flag) {
            out << (*flag ? " (reflex)" : " (non-reflex)");
        }
    }
    return out.str();
}

std::vector<EntityID> Figure::entities(EntityType type) const {
    std::vector<EntityID> result;
    for (const Entity* entity : registry_.elements(type)) {
        result.push_back(entity->id());
    }
    return result;
}

} // namespace geodeduce::core::geometry
