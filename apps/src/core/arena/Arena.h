#pragma once

#include "ArenaConfig.h"
#include "PowerUp.h"

#include "core/organisms/Creature.h"
#include "core/organisms/CreatureTypes.h"
#include "core/physics/PhysicsWorld.h"

#include <map>
#include <memory>
#include <random>
#include <set>
#include <vector>

namespace Biomorph {

class EventSink;

/**
 * The physical arena: a walled, gravity-free world with obstacles, power-ups
 * and the registry of creatures living in it.
 *
 * Turns raw collision events into domain effects (feeding, eating, blunt
 * damage) and keeps the physics world consistent before every step.
 *
 * A creature stays owned by the arena until removeCreature() or
 * removeDestructible(); "tracked" creatures are the ones still updated.
 */
class Arena {
public:
    Arena(const ArenaConfig& config, std::mt19937& rng, EventSink* events = nullptr);
    ~Arena();

    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;

    Creature& spawnCreature(
        CreatureId id, std::shared_ptr<Genome> genome, const Vector2d& position);
    bool removeCreature(CreatureId id);
    void clearCreatures();

    // Destroy every creature flagged destructible. Returns how many.
    size_t removeDestructible();

    Creature* getCreature(CreatureId id);
    const Creature* getCreature(CreatureId id) const;
    const std::map<CreatureId, std::unique_ptr<Creature>>& getCreatures() const
    {
        return creatures_;
    }
    std::vector<Creature*> getLivingCreatures();
    std::vector<const Creature*> getCreatureViews() const;
    bool isTracked(CreatureId id) const { return tracked_.count(id) > 0; }
    size_t creatureCount() const { return creatures_.size(); }
    size_t livingCount() const;

    // Random count between minObstacles and maxObstacles.
    void regenerateObstacles();
    void createObstacles(int count);
    const std::vector<BodyId>& getObstacles() const { return obstacles_; }
    const std::vector<BodyId>& getBoundaries() const { return boundaries_; }

    void resetPowerUps();
    void spawnPowerUp();
    void spawnPowerUp(PowerUpType type, const Vector2d& position);

    /**
     * Replace collected power-ups, let super power-ups flee, and pull
     * power-ups toward nearby gripper segments.
     */
    void updatePowerUps();
    const std::vector<std::unique_ptr<PowerUp>>& getPowerUps() const { return powerUps_; }

    /**
     * One physics step of dt (capped at maxPhysicsStep) followed by an update
     * of every tracked creature, dead ones included so corpses keep fading.
     * Physics failures are logged and recovered from, never propagated.
     */
    void update(double dt);

    void handleCollision(const CollisionEvent& event);

    /**
     * Strip every tracked creature out of the world after a failed step and
     * drop orphaned constraints. The creatures are flagged destructible.
     */
    void recoverFromError();

    PhysicsWorld& getWorld() { return world_; }
    const PhysicsWorld& getWorld() const { return world_; }
    const ArenaConfig& getConfig() const { return config_; }

private:
    void createBoundaries();
    size_t ensureConsistency();
    void collectPowerUp(int powerUpId, int creatureId);
    void applyGripperAttraction(PowerUp& powerUp);
    void evict(Creature& creature, const char* reason);
    Vector2d randomPosition(double margin);

    ArenaConfig config_;
    std::mt19937& rng_;
    EventSink* events_;

    PhysicsWorld world_;
    std::vector<BodyId> boundaries_;
    std::vector<BodyId> obstacles_;
    std::map<CreatureId, std::unique_ptr<Creature>> creatures_;
    std::set<CreatureId> tracked_;
    std::vector<std::unique_ptr<PowerUp>> powerUps_;
    PowerUpId nextPowerUpId_{ 0 };
};

} // namespace Biomorph
