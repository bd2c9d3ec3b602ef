/**
 * @file Figure.h
 * @brief Session object owning one deductive geometry problem
 *
 * A Figure owns the entity registry, the unknown table, the constraint
 * store, the measure table, the equation solver and the goal driver.
 * Independent problems use independent Figures.
 *
 * Construction entry points are idempotent: building the same object twice,
 * with any equivalent point order, returns the same handle. Handles stay
 * valid across merges; they resolve to the surviving entity.
 *
 * Every public mutating call finishes by settling the figure: queued change
 * notifications, reflex propagation, explementary pairing and, when
 * configured, the equation solver run until nothing is left to do.
 */
#ifndef GEODEDUCE_CORE_GEOMETRY_FIGURE_H
#define GEODEDUCE_CORE_GEOMETRY_FIGURE_H

#include "Angle.h"
#include "Line.h"
#include "Point.h"
#include "Polygon.h"
#include "Ray.h"
#include "Segment.h"
#include "../EngineConfig.h"
#include "../algebra/UnknownTable.h"
#include "../measure/ConstraintStore.h"
#include "../measure/MeasureTable.h"
#include "../registry/GeometryErrors.h"
#include "../registry/Registry.h"

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geodeduce::core::solver {
class AlgebraSolver;
class EquationSolver;
}

namespace geodeduce::core::driver {
class GoalDriver;
}

namespace geodeduce::core::geometry {

class Figure : public RegistryObserver, public measure::MeasureListener {
public:
    explicit Figure(EngineConfig config = {});
    Figure(EngineConfig config, std::unique_ptr<solver::AlgebraSolver> algebra);
    ~Figure() override;

    Figure(const Figure&) = delete;
    Figure& operator=(const Figure&) = delete;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------

    EntityID point(const std::string& label);

    /**
     * @brief Distinct points from a space separated label list
     * @throws ConstructionError on invalid labels or repeated points
     */
    std::vector<EntityID> points(const std::string& names);
    std::vector<EntityID> points(const std::vector<EntityID>& handles);

    /**
     * @brief Line through the given points in the given order
     *
     * Lines sharing two or more points with the new one are merged with it.
     * Segments between every pair of points on the resulting line exist
     * afterwards.
     *
     * @throws CollinearSequenceError if the orders cannot be reconciled
     */
    EntityID line(const std::string& names);
    EntityID line(const std::vector<EntityID>& points);

    EntityID segment(const std::string& names);
    EntityID segment(EntityID a, EntityID b);

    /// Line the segment lies on, created if needed
    EntityID lineThrough(EntityID segment);
    EntityID lineThrough(EntityID a, EntityID b);

    EntityID ray(const std::string& names);
    EntityID ray(EntityID vertex, EntityID through);

    /**
     * @brief Angle "P V Q" from ray V->P to ray V->Q
     */
    EntityID angle(const std::string& names, std::optional<bool> reflex = std::nullopt);
    EntityID angle(EntityID p, EntityID vertex, EntityID q, std::optional<bool> reflex = std::nullopt);

    /// @throws ConstructionError unless the rays are distinct and share a vertex
    EntityID angleFromRays(EntityID ray1, EntityID ray2, std::optional<bool> reflex = std::nullopt);

    EntityID explementary(EntityID angle);
    std::optional<bool> reflex(EntityID angle);

    /// @throws ConstructionError if the angle's reflex flag is already the opposite
    void setReflex(EntityID angle, bool reflex);

    /**
     * @brief Polygon with the given cyclic vertex order; three points give a Triangle
     * @throws ConstructionError on orientation conflicts or collinear vertices
     */
    EntityID polygon(const std::string& names);
    EntityID polygon(const std::vector<EntityID>& points);
    EntityID triangle(const std::string& names);
    EntityID triangle(const std::vector<EntityID>& points);

    //--------------------------------------------------------------------------
    // Measures
    //--------------------------------------------------------------------------

    /// Current measure; allocates an unknown when unset
    measure::MeasureValue measure(EntityID entity);
    algebra::Polynomial measureSymbol(EntityID entity);
    std::optional<double> numericMeasure(EntityID entity);

    void setMeasure(EntityID entity, double value);
    void setMeasure(EntityID entity, const measure::MeasureValue& value);

    /**
     * @brief Asserts residual == 0 without solving
     * @return true if a new relation was recorded
     */
    bool assertRelation(const algebra::Polynomial& residual, const std::string& origin);

    /// Asserts m(angle) + m(explementary) == 360 once per pair
    bool pairExplementary(EntityID angle);

    /// Runs the equation solver to a fixed point
    void solve();

    /**
     * @brief Registers a target and drives derivation rules for it
     * @return The measure afterwards, numeric if it could be derived
     */
    measure::MeasureValue solveFor(EntityID entity);

    //--------------------------------------------------------------------------
    // Queries (never construct)
    //--------------------------------------------------------------------------

    std::string label(EntityID point);
    std::string describe(EntityID entity);
    std::vector<EntityID> entities(EntityType type) const;

    EntityID findLine(EntityID a, EntityID b) const;
    EntityID findSegment(EntityID a, EntityID b);
    EntityID findAngle(EntityID p, EntityID vertex, EntityID q);

    /// Points of the line through a and b in order, or {a, b} if no line is known
    std::vector<EntityID> knownPointsOnLine(EntityID a, EntityID b) const;

    /// Single common point of two distinct lines, or kInvalidEntityID
    EntityID intersectionPoint(EntityID line1, EntityID line2);

    bool isInteriorOfKnownPoints(EntityID line, EntityID point);

    /// Points of the ray's line beyond the vertex, nearest first
    std::vector<EntityID> pointsInRayDirection(EntityID ray);

    /// Points of the segment's line from one endpoint to the other, endpoints included
    std::vector<EntityID> containedPoints(EntityID segment);
    std::vector<EntityID> triangleSides(EntityID triangle);
    std::vector<EntityID> triangleAngles(EntityID triangle);

    /// Index into the triangle's points of a vertex measured at exactly 90 degrees
    std::optional<std::size_t> rightAngleVertex(EntityID triangle);

    /// Polygon with exactly these vertices in any order, or kInvalidEntityID
    EntityID findPolygon(const std::vector<EntityID>& points) const;

    std::vector<EntityID> trianglesWithSide(EntityID segment);
    std::vector<EntityID> trianglesWithAngle(EntityID angle);

    /**
     * @brief Segments from a vertex to a point on the opposite line meeting it at 90 degrees
     */
    std::vector<EntityID> altitudes(EntityID triangle);

    /**
     * @brief Segments from a vertex to an interior point of the opposite side
     * splitting the vertex angle into two angles of equal measure
     */
    std::vector<EntityID> angleBisectors(EntityID triangle);

    //--------------------------------------------------------------------------
    // Queries that may construct
    //--------------------------------------------------------------------------

    /**
     * @brief Non-reflex angles between the rays from the intersection of two lines
     *
     * Empty until the reflex flag of one of these angles is known.
     */
    std::vector<EntityID> nonreflexAnglesFormedByIntersection(EntityID line1, EntityID line2);

    /// Segments of the line with at least one point strictly inside
    std::vector<EntityID> segmentsWithSubsegments(EntityID line);

    /// Every segment strictly inside this one
    std::vector<EntityID> subsegments(EntityID segment);

    /// Consecutive segments covering this one
    std::vector<EntityID> atomicSubsegments(EntityID segment);

    /// Supersegments on the same line and triangles having the segment as a side
    std::vector<EntityID> componentsOf(EntityID segment);

    //--------------------------------------------------------------------------
    // Access
    //--------------------------------------------------------------------------

    template <typename T>
    T* getEntityAs(EntityID id) {
        return registry_.getAs<T>(id);
    }

    EntityID resolve(EntityID id) { return registry_.resolve(id); }

    Registry& registry() { return registry_; }
    const EngineConfig& config() const { return config_; }
    algebra::UnknownTable& unknowns() { return unknowns_; }
    measure::ConstraintStore& constraints() { return constraints_; }
    measure::MeasureTable& measures() { return measures_; }
    solver::EquationSolver& equationSolver() { return *equationSolver_; }
    driver::GoalDriver& driver() { return *driver_; }

    // RegistryObserver
    void entityReplaced(Entity& old, Entity& survivor) override;
    void dependencyChanged(EntityID subscriber, EntityID oldSource, EntityID newSource) override;
    std::string identity(const Entity& entity) override;

    // MeasureListener
    void measureAssigned(EntityID entity) override;

private:
    struct ReflexUpdate {
        EntityID angle;
        bool reflex;
    };

    // Construction without settling; safe inside notification handlers
    EntityID ensurePoint(const std::string& label);
    EntityID ensureLine(const std::vector<EntityID>& points);
    EntityID ensureSegment(EntityID a, EntityID b);
    EntityID ensureRay(EntityID vertex, EntityID through);
    EntityID ensureAngle(EntityID ray1, EntityID ray2);
    EntityID ensurePolygon(const std::vector<EntityID>& points, bool asTriangle);
    std::vector<EntityID> computeNonreflexAngles(EntityID line1, EntityID line2);

    EntityID farthestInDirection(EntityID vertex, EntityID through);
    EntityID farthestKnown(EntityID vertex, EntityID through) const;
    bool isStraight(const Angle& angle);
    EntityID lineOfRay(EntityID ray);
    std::string lineKey(const std::vector<EntityID>& points) const;
    std::vector<EntityID> canonicalLineOrder(std::vector<EntityID> points) const;
    std::string angleKey(EntityID ray1, EntityID ray2);
    std::vector<EntityID> bidirectionalMerge(const std::vector<EntityID>& a, const std::vector<EntityID>& b) const;
    std::vector<EntityID> orderPreservingMerge(const std::vector<EntityID>& a, const std::vector<EntityID>& b) const;
    std::vector<std::string> labels(const std::vector<EntityID>& points) const;

    template <typename T>
    T& require(EntityID id, const char* kind) {
        T* entity = registry_.getAs<T>(id);
        if (!entity) {
            throw ConstructionError("entity " + std::to_string(id) + " is not a " + kind);
        }
        return *entity;
    }

    void applyReflex(EntityID angle, bool reflex);
    void propagateReflex(const ReflexUpdate& update);
    void onLineChanged(EntityID ray);
    void onRayChanged(EntityID angle, EntityID oldRay, EntityID newRay);
    void checkAngleMeasure(EntityID angle);

    void commit();
    void settle(bool forceSolve);

    EngineConfig config_;
    Registry registry_;
    algebra::UnknownTable unknowns_;
    measure::ConstraintStore constraints_;
    measure::MeasureTable measures_;
    std::unique_ptr<solver::AlgebraSolver> algebra_;
    std::unique_ptr<solver::EquationSolver> equationSolver_;
    std::unique_ptr<driver::GoalDriver> driver_;

    std::deque<ReflexUpdate> reflexWork_;
    std::deque<EntityID> angleWork_;
    bool needsSolve_ = false;
    bool settling_ = false;
};

} // namespace geodeduce::core::geometry

#endif // GEODEDUCE_CORE_GEOMETRY_FIGURE_H
