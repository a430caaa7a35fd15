#include "Arena.h"

#include "core/EventSink.h"
#include "core/LoggingChannels.h"
#include "core/Random.h"
#include "core/organisms/Combat.h"

#include <algorithm>
#include <exception>

namespace Biomorph {

Arena::Arena(const ArenaConfig& config, std::mt19937& rng, EventSink* events)
    : config_(config), rng_(rng), events_(events)
{
    createBoundaries();
    regenerateObstacles();
}

Arena::~Arena()
{
    powerUps_.clear();
    clearCreatures();
}

void Arena::createBoundaries()
{
    for (const BodyId id : boundaries_) {
        world_.removeBody(id);
    }
    boundaries_.clear();

    BodyOptions options;
    options.isStatic = true;
    options.friction = config_.wallFriction;
    options.restitution = config_.wallRestitution;
    options.tag = BodyTag{ .kind = BodyKind::Boundary };

    const double t = config_.wallThickness;
    const double w = config_.width;
    const double h = config_.height;

    boundaries_.push_back(world_.addRectangle({ w / 2.0, -t / 2.0 }, w + t * 2.0, t, options));
    boundaries_.push_back(world_.addRectangle({ w / 2.0, h + t / 2.0 }, w + t * 2.0, t, options));
    boundaries_.push_back(world_.addRectangle({ -t / 2.0, h / 2.0 }, t, h + t * 2.0, options));
    boundaries_.push_back(world_.addRectangle({ w + t / 2.0, h / 2.0 }, t, h + t * 2.0, options));
}

void Arena::regenerateObstacles()
{
    const int low = std::min(config_.minObstacles, config_.maxObstacles);
    const int high = std::max(config_.minObstacles, config_.maxObstacles);
    createObstacles(uniformInt(rng_, low, high));
}

void Arena::createObstacles(int count)
{
    for (const BodyId id : obstacles_) {
        world_.removeBody(id);
    }
    obstacles_.clear();

    BodyOptions options;
    options.isStatic = true;
    options.tag = BodyTag{ .kind = BodyKind::Obstacle };

    for (int i = 0; i < count; i++) {
        const Vector2d position = randomPosition(config_.obstacleMargin);
        const double size = uniform(rng_, config_.obstacleMinSize, config_.obstacleMaxSize);
        if (chance(rng_, 0.5)) {
            obstacles_.push_back(world_.addCircle(position, size / 2.0, options));
        }
        else {
            obstacles_.push_back(world_.addRectangle(position, size, size, options));
        }
    }

    LOG_DEBUG(Physics, "Placed {} obstacles", obstacles_.size());
}

Vector2d Arena::randomPosition(double margin)
{
    const double spanX = std::max(0.0, config_.width - margin * 2.0);
    const double spanY = std::max(0.0, config_.height - margin * 2.0);
    return Vector2d{ margin + uniform(rng_, 0.0, 1.0) * spanX,
                     margin + uniform(rng_, 0.0, 1.0) * spanY };
}

Creature& Arena::spawnCreature(
    CreatureId id, std::shared_ptr<Genome> genome, const Vector2d& position)
{
    auto creature = std::make_unique<Creature>(id, std::move(genome), world_, position, events_);
    Creature& ref = *creature;

    // Replacing an existing id destroys the old creature first.
    creatures_.erase(id);
    creatures_.emplace(id, std::move(creature));
    tracked_.insert(id);
    return ref;
}

bool Arena::removeCreature(CreatureId id)
{
    tracked_.erase(id);
    return creatures_.erase(id) > 0;
}

void Arena::clearCreatures()
{
    tracked_.clear();
    creatures_.clear();
}

size_t Arena::removeDestructible()
{
    size_t removed = 0;
    for (auto it = creatures_.begin(); it != creatures_.end();) {
        if (it->second->canDestroy()) {
            tracked_.erase(it->first);
            it = creatures_.erase(it);
            removed++;
        }
        else {
            ++it;
        }
    }
    return removed;
}

Creature* Arena::getCreature(CreatureId id)
{
    auto it = creatures_.find(id);
    return it == creatures_.end() ? nullptr : it->second.get();
}

const Creature* Arena::getCreature(CreatureId id) const
{
    auto it = creatures_.find(id);
    return it == creatures_.end() ? nullptr : it->second.get();
}

std::vector<Creature*> Arena::getLivingCreatures()
{
    std::vector<Creature*> living;
    for (auto& [id, creature] : creatures_) {
        if (creature->isAlive()) {
            living.push_back(creature.get());
        }
    }
    return living;
}

std::vector<const Creature*> Arena::getCreatureViews() const
{
    std::vector<const Creature*> views;
    views.reserve(creatures_.size());
    for (const auto& [id, creature] : creatures_) {
        views.push_back(creature.get());
    }
    return views;
}

size_t Arena::livingCount() const
{
    return static_cast<size_t>(std::count_if(
        creatures_.begin(), creatures_.end(), [](const auto& entry) {
            return entry.second->isAlive();
        }));
}

void Arena::resetPowerUps()
{
    powerUps_.clear();
    for (int i = 0; i < config_.powerUpCount; i++) {
        spawnPowerUp();
    }
}

void Arena::spawnPowerUp()
{
    const PowerUpType type =
        chance(rng_, config_.superPowerUpChance) ? PowerUpType::Super : PowerUpType::Health;
    spawnPowerUp(type, randomPosition(config_.powerUpMargin));
}

void Arena::spawnPowerUp(PowerUpType type, const Vector2d& position)
{
    const PowerUpId id = nextPowerUpId_++;
    powerUps_.push_back(std::make_unique<PowerUp>(id, type, world_, position));
    LOG_DEBUG(PowerUp, "Spawned {} power-up {} at {}", toString(type), id, position);
}

void Arena::updatePowerUps()
{
    const size_t before = powerUps_.size();
    powerUps_.erase(
        std::remove_if(
            powerUps_.begin(),
            powerUps_.end(),
            [](const std::unique_ptr<PowerUp>& p) { return p->isCollected(); }),
        powerUps_.end());
    for (size_t i = powerUps_.size(); i < before; i++) {
        spawnPowerUp();
    }

    const std::vector<const Creature*> views = getCreatureViews();
    for (auto& powerUp : powerUps_) {
        powerUp->update(views, config_);
        applyGripperAttraction(*powerUp);
    }
}

void Arena::applyGripperAttraction(PowerUp& powerUp)
{
    const Body* target = world_.getBody(powerUp.getBodyId());
    if (!target || target->isStatic) {
        return;
    }

    for (const auto& [id, creature] : creatures_) {
        if (!creature->isAlive()) {
            continue;
        }
        for (const BodyId gripperId : creature->getGripperBodies()) {
            const Body* gripper = world_.getBody(gripperId);
            if (!gripper) {
                continue;
            }
            const Vector2d pull = gripper->position - target->position;
            if (pull.magnitude() < config_.gripperRange) {
                world_.applyForce(
                    powerUp.getBodyId(), pull * (config_.gripperStrength * target->mass));
            }
        }
    }
}

size_t Arena::ensureConsistency()
{
    size_t removed = world_.removeDanglingConstraints();

    // Segment bodies whose creature is gone would otherwise collide forever.
    removed += world_.removeBodiesIf([this](const Body& body) {
        return body.tag.kind == BodyKind::CreatureSegment
            && creatures_.count(CreatureId{ body.tag.ownerId }) == 0;
    });
    removed += world_.removeConstraintsIf([this](const DistanceConstraint& c) {
        return c.ownerId >= 0 && creatures_.count(CreatureId{ c.ownerId }) == 0;
    });

    if (removed > 0) {
        LOG_WARN(Physics, "Consistency pass removed {} stale bodies/constraints", removed);
    }
    return removed;
}

void Arena::update(double dt)
{
    ensureConsistency();

    std::vector<CollisionEvent> collisions;
    try {
        collisions = world_.step(std::min(dt, config_.maxPhysicsStep));
    }
    catch (const std::exception& e) {
        LOG_ERROR(Physics, "Physics step failed: {}", e.what());
        recoverFromError();
        return;
    }

    for (const CollisionEvent& event : collisions) {
        handleCollision(event);
    }

    const std::vector<CreatureId> ids(tracked_.begin(), tracked_.end());
    for (const CreatureId id : ids) {
        Creature* creature = getCreature(id);
        if (!creature) {
            tracked_.erase(id);
            continue;
        }
        if (!creature->isInWorld()) {
            evict(*creature, "no longer in the physics world");
            continue;
        }

        try {
            creature->update(dt);
        }
        catch (const std::exception& e) {
            LOG_WARN(Creature, "Update of creature {} failed: {}", id, e.what());
            evict(*creature, "update failed");
        }
    }
}

void Arena::evict(Creature& creature, const char* reason)
{
    LOG_WARN(Physics, "Evicting creature {}: {}", creature.getId(), reason);
    tracked_.erase(creature.getId());
    creature.die(nullptr, DeathCause::Evicted);
    creature.markDestructible();
}

void Arena::recoverFromError()
{
    const size_t count = tracked_.size();
    for (const CreatureId id : tracked_) {
        if (Creature* creature = getCreature(id)) {
            creature->detachFromWorld();
            creature->die(nullptr, DeathCause::Evicted);
            creature->markDestructible();
        }
    }
    tracked_.clear();

    const size_t orphans = world_.removeDanglingConstraints();
    LOG_WARN(
        Physics,
        "Recovered from physics failure: purged {} creatures, {} orphaned constraints",
        count,
        orphans);
}

void Arena::handleCollision(const CollisionEvent& event)
{
    const Body* a = world_.getBody(event.bodyA);
    const Body* b = world_.getBody(event.bodyB);
    if (!a || !b) {
        return;
    }

    const BodyKind kindA = a->tag.kind;
    const BodyKind kindB = b->tag.kind;

    if (kindA == BodyKind::PowerUp && kindB == BodyKind::CreatureSegment) {
        collectPowerUp(a->tag.ownerId, b->tag.ownerId);
        return;
    }
    if (kindB == BodyKind::PowerUp && kindA == BodyKind::CreatureSegment) {
        collectPowerUp(b->tag.ownerId, a->tag.ownerId);
        return;
    }

    if (kindA != BodyKind::CreatureSegment || kindB != BodyKind::CreatureSegment) {
        return;
    }
    if (a->tag.ownerId == b->tag.ownerId) {
        return;
    }

    const CreatureId idA{ a->tag.ownerId };
    const CreatureId idB{ b->tag.ownerId };
    if (!isTracked(idA) || !isTracked(idB)) {
        return;
    }
    Creature* creatureA = getCreature(idA);
    Creature* creatureB = getCreature(idB);
    if (!creatureA || !creatureB || !creatureA->isAlive() || !creatureB->isAlive()) {
        return;
    }

    Combat::resolveContact(*creatureA, *creatureB, event.relativeVelocity, a->mass + b->mass);
}

void Arena::collectPowerUp(int powerUpId, int creatureId)
{
    Creature* creature = getCreature(CreatureId{ creatureId });
    if (!creature || !creature->isAlive()) {
        return;
    }

    auto it = std::find_if(powerUps_.begin(), powerUps_.end(), [powerUpId](const auto& p) {
        return p->getId() == PowerUpId{ powerUpId };
    });
    if (it == powerUps_.end()) {
        return;
    }

    const double amount = (*it)->collect(*creature);
    if (amount > 0.0 && events_) {
        events_->onPowerUpCollected(creature->getId(), amount);
    }
}

} // namespace Biomorph
