#pragma once

#include "core/StrongType.h"
#include "core/Vector2.h"
#include "core/physics/PhysicsTypes.h"

#include <optional>
#include <vector>

namespace Biomorph {

class Creature;
class PhysicsWorld;
struct ArenaConfig;

using PowerUpId = StrongType<struct PowerUpIdTag>;

enum class PowerUpType { Health, Super };

const char* toString(PowerUpType type);

/**
 * Collectible food item backed by a sensor body.
 *
 * Health items sit still. Super items are dynamic and drift away from
 * nearby living creatures.
 */
class PowerUp {
public:
    static constexpr double HealthRadius = 12.0;
    static constexpr double SuperRadius = 18.0;
    static constexpr double HealthRestore = 50.0;
    static constexpr double SuperRestore = 150.0;

    PowerUp(PowerUpId id, PowerUpType type, PhysicsWorld& world, const Vector2d& position);
    ~PowerUp();

    PowerUp(const PowerUp&) = delete;
    PowerUp& operator=(const PowerUp&) = delete;

    void update(const std::vector<const Creature*>& creatures, const ArenaConfig& config);

    /**
     * Feed the creature and remove the body. Only the first call has an effect.
     * @return amount restored, 0 if already collected
     */
    double collect(Creature& creature);

    bool isCollected() const { return collected_; }
    PowerUpId getId() const { return id_; }
    PowerUpType getType() const { return type_; }
    BodyId getBodyId() const { return bodyId_; }
    double getRadius() const;
    double getRestoreAmount() const;
    std::optional<Vector2d> getPosition() const;

private:
    PowerUpId id_;
    PowerUpType type_;
    PhysicsWorld& world_;
    BodyId bodyId_;
    bool collected_ = false;
};

} // namespace Biomorph
