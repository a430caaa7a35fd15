#include "PowerUp.h"
#include "ArenaConfig.h"

#include "core/LoggingChannels.h"
#include "core/organisms/Creature.h"
#include "core/physics/PhysicsWorld.h"

namespace Biomorph {

const char* toString(PowerUpType type)
{
    switch (type) {
        case PowerUpType::Health:
            return "health";
        case PowerUpType::Super:
            return "super";
    }
    return "health";
}

PowerUp::PowerUp(PowerUpId id, PowerUpType type, PhysicsWorld& world, const Vector2d& position)
    : id_(id), type_(type), world_(world)
{
    BodyOptions options;
    options.isSensor = true;
    options.isStatic = type_ != PowerUpType::Super;
    options.frictionAir = 0.1;
    options.friction = 0.0;
    options.tag = BodyTag{ .kind = BodyKind::PowerUp, .ownerId = id_.get() };

    bodyId_ = world_.addCircle(position, getRadius(), options);
}

PowerUp::~PowerUp()
{
    world_.removeBody(bodyId_);
}

double PowerUp::getRadius() const
{
    return type_ == PowerUpType::Super ? SuperRadius : HealthRadius;
}

double PowerUp::getRestoreAmount() const
{
    return type_ == PowerUpType::Super ? SuperRestore : HealthRestore;
}

std::optional<Vector2d> PowerUp::getPosition() const
{
    if (const Body* body = world_.getBody(bodyId_)) {
        return body->position;
    }
    return std::nullopt;
}

void PowerUp::update(const std::vector<const Creature*>& creatures, const ArenaConfig& config)
{
    if (type_ != PowerUpType::Super || collected_) {
        return;
    }
    const Body* body = world_.getBody(bodyId_);
    if (!body) {
        return;
    }

    Vector2d flee{ 0.0, 0.0 };
    int count = 0;
    for (const Creature* creature : creatures) {
        if (!creature->isAlive()) {
            continue;
        }
        const Vector2d away = body->position - creature->getCenterPosition();
        const double distance = away.magnitude();
        if (distance >= config.superFleeRange || distance < 1e-9) {
            continue;
        }
        flee += (away / distance) * (config.superFleeRange - distance);
        count++;
    }

    if (count > 0) {
        flee = flee / static_cast<double>(count);
        world_.applyForce(bodyId_, flee * (config.superFleeStrength * body->mass));
    }
}

double PowerUp::collect(Creature& creature)
{
    if (collected_) {
        return 0.0;
    }
    collected_ = true;

    const double amount = getRestoreAmount();
    creature.restoreHealth(amount);
    creature.recordPowerUpCollected();
    world_.removeBody(bodyId_);

    LOG_DEBUG(
        PowerUp,
        "Creature {} collected {} power-up {} (+{})",
        creature.getId(),
        toString(type_),
        id_,
        amount);
    return amount;
}

} // namespace Biomorph
