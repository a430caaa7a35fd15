#pragma once

#include "PhysicsTypes.h"

#include <cstdint>
#include <functional>
#include <map>
#include <unordered_set>
#include <vector>

namespace Biomorph {

struct PhysicsSettings {
    int constraintIterations = 6;
    // Ground drag per unit of body friction, 1/s. Top-down bodies slide on a
    // substrate, so friction damps motion even without contacts.
    double substrateDrag = 6.0;
    double broadphaseCellSize = 64.0;
    double positionSlop = 0.05;
    double positionCorrection = 0.8;
};

/**
 * Gravity-free 2D rigid body world with distance constraints.
 *
 * Integration is position based: bodies are advanced, constraints and
 * contacts are solved on positions, and velocities are derived from the
 * resulting displacement. Dynamic bodies collide as circles, static
 * rectangles as axis-aligned boxes.
 *
 * Removing a body does not touch constraints that reference it. Call
 * removeDanglingConstraints() before step(), which refuses to integrate a
 * constraint whose body is gone.
 */
class PhysicsWorld {
public:
    explicit PhysicsWorld(PhysicsSettings settings = {});

    BodyId addCircle(const Vector2d& position, double radius, const BodyOptions& options);
    BodyId addRectangle(
        const Vector2d& position, double width, double height, const BodyOptions& options);
    bool removeBody(BodyId id);

    ConstraintId addConstraint(const ConstraintOptions& options);
    bool removeConstraint(ConstraintId id);

    bool hasBody(BodyId id) const { return bodies_.count(id) > 0; }
    bool hasConstraint(ConstraintId id) const { return constraints_.count(id) > 0; }

    Body* getBody(BodyId id);
    const Body* getBody(BodyId id) const;
    DistanceConstraint* getConstraint(ConstraintId id);
    const DistanceConstraint* getConstraint(ConstraintId id) const;

    const std::map<BodyId, Body>& getBodies() const { return bodies_; }
    const std::map<ConstraintId, DistanceConstraint>& getConstraints() const
    {
        return constraints_;
    }

    // Accumulates until the next step.
    void applyForce(BodyId id, const Vector2d& force);
    void setPosition(BodyId id, const Vector2d& position);
    void setVelocity(BodyId id, const Vector2d& velocity);

    // World-space location of a constraint attach point.
    Vector2d attachPoint(const Body& body, const Vector2d& localPoint) const;

    /**
     * Drop every constraint whose body no longer exists.
     * @return number of constraints removed
     */
    size_t removeDanglingConstraints();

    size_t removeBodiesIf(const std::function<bool(const Body&)>& predicate);
    size_t removeConstraintsIf(const std::function<bool(const DistanceConstraint&)>& predicate);

    /**
     * Advance by dt seconds.
     * @return collision-start events for pairs that began touching this step
     * @throws PhysicsError on a dangling constraint or non-finite body state
     */
    std::vector<CollisionEvent> step(double dt);

    void clear();

    size_t bodyCount() const { return bodies_.size(); }
    size_t constraintCount() const { return constraints_.size(); }

private:
    struct Contact {
        Body* a;
        Body* b;
        Vector2d normal; // From a toward b.
        double depth;
    };

    BodyId addBody(const Vector2d& position, const BodyShape& shape, const BodyOptions& options);

    void integrate(double dt);
    void solveConstraints(double dt);
    void deriveVelocities(double dt);
    void dampConstraints();
    std::vector<Contact> detectContacts();
    bool testPair(Body& a, Body& b, Contact& contact) const;
    void resolveContact(const Contact& contact);
    void validateState() const;

    static uint64_t pairKey(BodyId a, BodyId b);

    PhysicsSettings settings_;
    std::map<BodyId, Body> bodies_;
    std::map<ConstraintId, DistanceConstraint> constraints_;
    std::unordered_set<uint64_t> activePairs_;
    BodyId nextBodyId_{ 0 };
    ConstraintId nextConstraintId_{ 0 };
};

} // namespace Biomorph
