#include "PhysicsWorld.h"

#include "core/LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <unordered_map>

namespace Biomorph {

namespace {

// Matter-style per-frame coefficients (frictionAir) are defined against 60 Hz.
constexpr double kReferenceHz = 60.0;

bool isFinite(const Vector2d& v)
{
    return std::isfinite(v.x) && std::isfinite(v.y);
}

} // namespace

double Body::boundingRadius() const
{
    return std::visit(
        [](auto&& s) -> double {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, CircleShape>) {
                return s.radius;
            }
            else {
                return (s.width + s.height) / 4.0;
            }
        },
        shape);
}

PhysicsWorld::PhysicsWorld(PhysicsSettings settings) : settings_(settings)
{}

BodyId PhysicsWorld::addCircle(const Vector2d& position, double radius, const BodyOptions& options)
{
    return addBody(position, CircleShape{ radius }, options);
}

BodyId PhysicsWorld::addRectangle(
    const Vector2d& position, double width, double height, const BodyOptions& options)
{
    return addBody(position, RectangleShape{ width, height }, options);
}

BodyId PhysicsWorld::addBody(
    const Vector2d& position, const BodyShape& shape, const BodyOptions& options)
{
    Body body;
    body.id = nextBodyId_++;
    body.shape = shape;
    body.position = position;
    body.previousPosition = position;
    body.angle = options.angle;
    body.previousAngle = options.angle;
    body.friction = options.friction;
    body.frictionAir = options.frictionAir;
    body.restitution = options.restitution;
    body.isStatic = options.isStatic;
    body.isSensor = options.isSensor;
    body.collisionGroup = options.collisionGroup;
    body.tag = options.tag;

    body.mass = std::max(options.mass, 1e-6);
    body.inertia = std::visit(
        [mass = body.mass](auto&& s) -> double {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, CircleShape>) {
                return 0.5 * mass * s.radius * s.radius;
            }
            else {
                return mass * (s.width * s.width + s.height * s.height) / 12.0;
            }
        },
        shape);

    if (body.isStatic) {
        body.invMass = 0.0;
        body.invInertia = 0.0;
    }
    else {
        body.invMass = 1.0 / body.mass;
        body.invInertia = body.inertia > 0.0 ? 1.0 / body.inertia : 0.0;
    }

    const BodyId id = body.id;
    bodies_.emplace(id, std::move(body));
    return id;
}

bool PhysicsWorld::removeBody(BodyId id)
{
    return bodies_.erase(id) > 0;
}

ConstraintId PhysicsWorld::addConstraint(const ConstraintOptions& options)
{
    DistanceConstraint constraint;
    constraint.id = nextConstraintId_++;
    constraint.bodyA = options.bodyA;
    constraint.bodyB = options.bodyB;
    constraint.pointA = options.pointA;
    constraint.pointB = options.pointB;
    constraint.length = options.length;
    constraint.stiffness = std::clamp(options.stiffness, 0.0, 1.0);
    constraint.damping = std::clamp(options.damping, 0.0, 1.0);
    constraint.ownerId = options.ownerId;

    const ConstraintId id = constraint.id;
    constraints_.emplace(id, constraint);
    return id;
}

bool PhysicsWorld::removeConstraint(ConstraintId id)
{
    return constraints_.erase(id) > 0;
}

Body* PhysicsWorld::getBody(BodyId id)
{
    auto it = bodies_.find(id);
    return it == bodies_.end() ? nullptr : &it->second;
}

const Body* PhysicsWorld::getBody(BodyId id) const
{
    auto it = bodies_.find(id);
    return it == bodies_.end() ? nullptr : &it->second;
}

DistanceConstraint* PhysicsWorld::getConstraint(ConstraintId id)
{
    auto it = constraints_.find(id);
    return it == constraints_.end() ? nullptr : &it->second;
}

const DistanceConstraint* PhysicsWorld::getConstraint(ConstraintId id) const
{
    auto it = constraints_.find(id);
    return it == constraints_.end() ? nullptr : &it->second;
}

void PhysicsWorld::applyForce(BodyId id, const Vector2d& force)
{
    if (Body* body = getBody(id); body && !body->isStatic) {
        body->force += force;
    }
}

void PhysicsWorld::setPosition(BodyId id, const Vector2d& position)
{
    if (Body* body = getBody(id)) {
        body->position = position;
        body->previousPosition = position;
    }
}

void PhysicsWorld::setVelocity(BodyId id, const Vector2d& velocity)
{
    if (Body* body = getBody(id); body && !body->isStatic) {
        body->velocity = velocity;
    }
}

Vector2d PhysicsWorld::attachPoint(const Body& body, const Vector2d& localPoint) const
{
    return body.position + localPoint.rotate(body.angle);
}

size_t PhysicsWorld::removeDanglingConstraints()
{
    return removeConstraintsIf([this](const DistanceConstraint& c) {
        return !hasBody(c.bodyA) || !hasBody(c.bodyB);
    });
}

size_t PhysicsWorld::removeBodiesIf(const std::function<bool(const Body&)>& predicate)
{
    size_t removed = 0;
    for (auto it = bodies_.begin(); it != bodies_.end();) {
        if (predicate(it->second)) {
            it = bodies_.erase(it);
            removed++;
        }
        else {
            ++it;
        }
    }
    return removed;
}

size_t PhysicsWorld::removeConstraintsIf(
    const std::function<bool(const DistanceConstraint&)>& predicate)
{
    size_t removed = 0;
    for (auto it = constraints_.begin(); it != constraints_.end();) {
        if (predicate(it->second)) {
            it = constraints_.erase(it);
            removed++;
        }
        else {
            ++it;
        }
    }
    return removed;
}

std::vector<CollisionEvent> PhysicsWorld::step(double dt)
{
    std::vector<CollisionEvent> events;
    if (dt <= 0.0) {
        return events;
    }

    for (const auto& [id, constraint] : constraints_) {
        if (!hasBody(constraint.bodyA) || !hasBody(constraint.bodyB)) {
            throw PhysicsError(
                "Constraint " + std::to_string(id.get()) + " references a removed body");
        }
    }

    integrate(dt);
    solveConstraints(dt);
    deriveVelocities(dt);
    dampConstraints();
    validateState();

    const std::vector<Contact> contacts = detectContacts();

    std::unordered_set<uint64_t> touching;
    touching.reserve(contacts.size());
    for (const Contact& contact : contacts) {
        const uint64_t key = pairKey(contact.a->id, contact.b->id);
        touching.insert(key);
        if (activePairs_.count(key) == 0) {
            events.push_back(CollisionEvent{ .bodyA = contact.a->id,
                                             .bodyB = contact.b->id,
                                             .relativeVelocity =
                                                 contact.a->velocity - contact.b->velocity });
        }
    }
    activePairs_ = std::move(touching);

    for (const Contact& contact : contacts) {
        if (!contact.a->isSensor && !contact.b->isSensor) {
            resolveContact(contact);
        }
    }

    validateState();
    return events;
}

void PhysicsWorld::integrate(double dt)
{
    const double frames = dt * kReferenceHz;

    for (auto& [id, body] : bodies_) {
        body.previousPosition = body.position;
        body.previousAngle = body.angle;
        if (body.isStatic) {
            body.force = Vector2d{};
            continue;
        }

        body.velocity += body.force * (body.invMass * dt);
        body.force = Vector2d{};

        const double airDamping = std::pow(std::max(0.0, 1.0 - body.frictionAir), frames);
        const double groundDamping = std::exp(-body.friction * settings_.substrateDrag * dt);
        body.velocity *= airDamping * groundDamping;
        body.angularVelocity *= airDamping * groundDamping;

        body.position += body.velocity * dt;
        body.angle += body.angularVelocity * dt;
    }
}

void PhysicsWorld::solveConstraints(double /*dt*/)
{
    const int iterations = std::max(1, settings_.constraintIterations);

    for (int iteration = 0; iteration < iterations; iteration++) {
        for (auto& [id, constraint] : constraints_) {
            Body& a = bodies_.at(constraint.bodyA);
            Body& b = bodies_.at(constraint.bodyB);
            const double totalInvMass = a.invMass + b.invMass;
            if (totalInvMass <= 0.0) {
                continue;
            }

            const Vector2d rA = constraint.pointA.rotate(a.angle);
            const Vector2d rB = constraint.pointB.rotate(b.angle);
            const Vector2d delta = (b.position + rB) - (a.position + rA);
            const double current = delta.magnitude();
            if (current < 1e-9) {
                continue;
            }

            // Spread the stiffness over the iterations so one step closes that fraction of the gap.
            const double share = 1.0 - std::pow(1.0 - constraint.stiffness, 1.0 / iterations);
            const Vector2d correction = delta * (((current - constraint.length) / current) * share);

            const Vector2d moveA = correction * (a.invMass / totalInvMass);
            const Vector2d moveB = correction * (-b.invMass / totalInvMass);

            a.position += moveA;
            b.position += moveB;
            a.angle += rA.cross(moveA) * a.invInertia * a.mass * 0.5;
            b.angle += rB.cross(moveB) * b.invInertia * b.mass * 0.5;
        }
    }
}

void PhysicsWorld::deriveVelocities(double dt)
{
    for (auto& [id, body] : bodies_) {
        if (body.isStatic) {
            continue;
        }
        body.velocity = (body.position - body.previousPosition) / dt;
        body.angularVelocity = (body.angle - body.previousAngle) / dt;
    }
}

void PhysicsWorld::dampConstraints()
{
    for (auto& [id, constraint] : constraints_) {
        if (constraint.damping <= 0.0) {
            continue;
        }
        Body& a = bodies_.at(constraint.bodyA);
        Body& b = bodies_.at(constraint.bodyB);
        const double totalInvMass = a.invMass + b.invMass;
        if (totalInvMass <= 0.0) {
            continue;
        }

        const Vector2d axis = (b.position - a.position).normalize();
        const double closing = (b.velocity - a.velocity).dot(axis);
        const Vector2d impulse = axis * (closing * constraint.damping);
        a.velocity += impulse * (a.invMass / totalInvMass);
        b.velocity -= impulse * (b.invMass / totalInvMass);
    }
}

std::vector<PhysicsWorld::Contact> PhysicsWorld::detectContacts()
{
    // Broadphase: bucket bounding boxes into a uniform grid.
    const double cell = settings_.broadphaseCellSize;
    std::unordered_map<int64_t, std::vector<Body*>> grid;

    const auto cellKey = [](int64_t cx, int64_t cy) { return (cx << 32) ^ (cy & 0xffffffff); };

    for (auto& [id, body] : bodies_) {
        Vector2d halfExtent;
        if (body.isStatic && std::holds_alternative<RectangleShape>(body.shape)) {
            const auto& rect = std::get<RectangleShape>(body.shape);
            halfExtent = Vector2d{ rect.width / 2.0, rect.height / 2.0 };
        }
        else {
            const double r = body.boundingRadius();
            halfExtent = Vector2d{ r, r };
        }

        const auto minX = static_cast<int64_t>(std::floor((body.position.x - halfExtent.x) / cell));
        const auto maxX = static_cast<int64_t>(std::floor((body.position.x + halfExtent.x) / cell));
        const auto minY = static_cast<int64_t>(std::floor((body.position.y - halfExtent.y) / cell));
        const auto maxY = static_cast<int64_t>(std::floor((body.position.y + halfExtent.y) / cell));
        for (int64_t cx = minX; cx <= maxX; cx++) {
            for (int64_t cy = minY; cy <= maxY; cy++) {
                grid[cellKey(cx, cy)].push_back(&body);
            }
        }
    }

    std::unordered_set<uint64_t> tested;
    std::vector<Contact> contacts;

    for (auto& [key, bucket] : grid) {
        for (size_t i = 0; i < bucket.size(); i++) {
            for (size_t j = i + 1; j < bucket.size(); j++) {
                Body* a = bucket[i];
                Body* b = bucket[j];
                if (a->isStatic && b->isStatic) {
                    continue;
                }
                if (a->collisionGroup < 0 && a->collisionGroup == b->collisionGroup) {
                    continue;
                }
                if (b->id < a->id) {
                    std::swap(a, b);
                }
                if (!tested.insert(pairKey(a->id, b->id)).second) {
                    continue;
                }

                Contact contact{ a, b, Vector2d{}, 0.0 };
                if (testPair(*a, *b, contact)) {
                    contacts.push_back(contact);
                }
            }
        }
    }

    // Grid iteration order is unspecified; resolve in a stable order.
    std::sort(contacts.begin(), contacts.end(), [](const Contact& l, const Contact& r) {
        if (l.a->id != r.a->id) return l.a->id < r.a->id;
        return l.b->id < r.b->id;
    });

    return contacts;
}

bool PhysicsWorld::testPair(Body& a, Body& b, Contact& contact) const
{
    const auto isBox = [](const Body& body) {
        return body.isStatic && std::holds_alternative<RectangleShape>(body.shape);
    };

    // Circle (a) against axis-aligned box (b). Normal points from circle toward box.
    const auto circleBox = [](const Vector2d& center,
                              double radius,
                              const Body& box,
                              Vector2d& normal,
                              double& depth) {
        const auto& rect = std::get<RectangleShape>(box.shape);
        const Vector2d half{ rect.width / 2.0, rect.height / 2.0 };
        const Vector2d min = box.position - half;
        const Vector2d max = box.position + half;

        const bool inside = center.x > min.x && center.x < max.x && center.y > min.y
            && center.y < max.y;
        if (!inside) {
            const Vector2d closest{ std::clamp(center.x, min.x, max.x),
                                    std::clamp(center.y, min.y, max.y) };
            const Vector2d diff = closest - center;
            const double dist = diff.magnitude();
            if (dist >= radius || dist < 1e-12) {
                return false;
            }
            normal = diff / dist;
            depth = radius - dist;
            return true;
        }

        const double left = center.x - min.x;
        const double right = max.x - center.x;
        const double top = center.y - min.y;
        const double bottom = max.y - center.y;
        const double nearest = std::min({ left, right, top, bottom });
        if (nearest == left) {
            normal = Vector2d{ 1.0, 0.0 };
        }
        else if (nearest == right) {
            normal = Vector2d{ -1.0, 0.0 };
        }
        else if (nearest == top) {
            normal = Vector2d{ 0.0, 1.0 };
        }
        else {
            normal = Vector2d{ 0.0, -1.0 };
        }
        depth = nearest + radius;
        return true;
    };

    if (isBox(b)) {
        return circleBox(a.position, a.boundingRadius(), b, contact.normal, contact.depth);
    }
    if (isBox(a)) {
        Vector2d normal;
        if (!circleBox(b.position, b.boundingRadius(), a, normal, contact.depth)) {
            return false;
        }
        contact.normal = -normal;
        return true;
    }

    const Vector2d diff = b.position - a.position;
    const double dist = diff.magnitude();
    const double radii = a.boundingRadius() + b.boundingRadius();
    if (dist >= radii) {
        return false;
    }
    contact.normal = dist > 1e-12 ? diff / dist : Vector2d{ 1.0, 0.0 };
    contact.depth = radii - dist;
    return true;
}

void PhysicsWorld::resolveContact(const Contact& contact)
{
    Body& a = *contact.a;
    Body& b = *contact.b;
    const double totalInvMass = a.invMass + b.invMass;
    if (totalInvMass <= 0.0) {
        return;
    }

    const double push =
        std::max(contact.depth - settings_.positionSlop, 0.0) * settings_.positionCorrection;
    a.position -= contact.normal * (push * a.invMass / totalInvMass);
    b.position += contact.normal * (push * b.invMass / totalInvMass);

    const Vector2d relative = a.velocity - b.velocity;
    const double approaching = relative.dot(contact.normal);
    if (approaching <= 0.0) {
        return;
    }

    const double restitution = std::max(a.restitution, b.restitution);
    const double j = -(1.0 + restitution) * approaching / totalInvMass;
    a.velocity += contact.normal * (j * a.invMass);
    b.velocity -= contact.normal * (j * b.invMass);

    // Coulomb friction on the tangential component.
    const Vector2d tangentVelocity =
        (a.velocity - b.velocity) - contact.normal * (a.velocity - b.velocity).dot(contact.normal);
    const double tangentSpeed = tangentVelocity.magnitude();
    if (tangentSpeed > 1e-9) {
        const Vector2d tangent = tangentVelocity / tangentSpeed;
        const double mu = std::sqrt(a.friction * b.friction);
        const double jt = std::min(tangentSpeed / totalInvMass, mu * std::abs(j));
        a.velocity -= tangent * (jt * a.invMass);
        b.velocity += tangent * (jt * b.invMass);
    }
}

void PhysicsWorld::validateState() const
{
    for (const auto& [id, body] : bodies_) {
        if (!isFinite(body.position) || !isFinite(body.velocity) || !std::isfinite(body.angle)) {
            throw PhysicsError("Body " + std::to_string(id.get()) + " has non-finite state");
        }
    }
}

void PhysicsWorld::clear()
{
    bodies_.clear();
    constraints_.clear();
    activePairs_.clear();
    LOG_DEBUG(Physics, "World cleared");
}

uint64_t PhysicsWorld::pairKey(BodyId a, BodyId b)
{
    const auto lo = static_cast<uint32_t>(std::min(a.get(), b.get()));
    const auto hi = static_cast<uint32_t>(std::max(a.get(), b.get()));
    return (static_cast<uint64_t>(lo) << 32) | hi;
}

} // namespace Biomorph
