#pragma once

#include "core/StrongType.h"
#include "core/Vector2.h"

#include <stdexcept>
#include <string>
#include <variant>

namespace Biomorph {

using BodyId = StrongType<struct BodyIdTag>;
using ConstraintId = StrongType<struct ConstraintIdTag>;

struct CircleShape {
    double radius = 10.0;
};

// Width runs along the body's local x axis, height along local y.
struct RectangleShape {
    double width = 10.0;
    double height = 10.0;
};

using BodyShape = std::variant<CircleShape, RectangleShape>;

/**
 * What a body belongs to, so collision handling can map bodies back to
 * domain objects without string labels.
 */
enum class BodyKind { Boundary, Obstacle, PowerUp, CreatureSegment };

struct BodyTag {
    BodyKind kind = BodyKind::Obstacle;
    int ownerId = -1;   // Creature id or power-up id.
    int partIndex = -1; // Segment index within the owning creature.
};

struct BodyOptions {
    double mass = 1.0;
    double angle = 0.0;
    double friction = 0.1;
    double frictionAir = 0.01;
    double restitution = 0.2;
    bool isStatic = false;
    bool isSensor = false;
    // Bodies sharing the same negative group never collide with each other.
    int collisionGroup = 0;
    BodyTag tag;
};

struct Body {
    BodyId id;
    BodyShape shape;
    Vector2d position;
    Vector2d previousPosition;
    Vector2d velocity; // Units per second.
    Vector2d force;
    double angle = 0.0;
    double previousAngle = 0.0;
    double angularVelocity = 0.0;
    double mass = 1.0;
    double invMass = 1.0;
    double inertia = 1.0;
    double invInertia = 1.0;
    double friction = 0.1;
    double frictionAir = 0.01;
    double restitution = 0.2;
    bool isStatic = false;
    bool isSensor = false;
    int collisionGroup = 0;
    BodyTag tag;

    // Radius used for dynamic collision and broadphase bounds.
    double boundingRadius() const;
};

struct ConstraintOptions {
    BodyId bodyA;
    BodyId bodyB;
    Vector2d pointA; // Local to bodyA.
    Vector2d pointB; // Local to bodyB.
    double length = 20.0;
    double stiffness = 0.5;
    double damping = 0.1;
    int ownerId = -1;
};

struct DistanceConstraint {
    ConstraintId id;
    BodyId bodyA;
    BodyId bodyB;
    Vector2d pointA;
    Vector2d pointB;
    double length = 20.0;
    double stiffness = 0.5;
    double damping = 0.1;
    int ownerId = -1;
};

/**
 * Emitted once when two bodies start touching. relativeVelocity is
 * velocity(bodyA) - velocity(bodyB) in units per second, sampled before
 * the contact is resolved.
 */
struct CollisionEvent {
    BodyId bodyA;
    BodyId bodyB;
    Vector2d relativeVelocity;
};

/**
 * Thrown by PhysicsWorld::step when the world holds state it cannot integrate.
 */
class PhysicsError : public std::runtime_error {
public:
    explicit PhysicsError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace Biomorph
