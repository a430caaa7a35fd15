#include "Combat.h"
#include "Creature.h"

#include "core/LoggingChannels.h"
#include "core/physics/PhysicsWorld.h"

#include <algorithm>

namespace Biomorph {
namespace Combat {

namespace {

double maturity(double age)
{
    return std::clamp(age, 0.0, MaturityAge) / MaturityAge;
}

} // namespace

double attackMultiplier(double age)
{
    return 1.0 + maturity(age);
}

double defenseMultiplier(double age)
{
    return 1.0 - 0.5 * maturity(age);
}

double impactSpeed(const Vector2d& relativeVelocity)
{
    return relativeVelocity.magnitude() / FrameRate;
}

double baseImpactDamage(double impactSpeed, double combinedMass)
{
    if (impactSpeed <= DamageThreshold) {
        return 0.0;
    }
    return (impactSpeed - DamageThreshold) * combinedMass * DamageMultiplier;
}

double bluntDamage(double baseDamage, double attackerAge, double defenderAge)
{
    return baseDamage * 0.5 * attackMultiplier(attackerAge) * defenseMultiplier(defenderAge);
}

bool isMouthOnHeart(const Vector2d& mouth, const Vector2d& heart)
{
    return (mouth - heart).magnitude() < MouthHeartRadius;
}

bool tryEat(Creature& attacker, Creature& victim)
{
    const auto mouthId = attacker.getMouthBody();
    const auto heartId = victim.getHeartBody();
    if (!mouthId || !heartId) {
        return false;
    }

    const PhysicsWorld& world = attacker.getWorld();
    const Body* mouth = world.getBody(*mouthId);
    const Body* heart = world.getBody(*heartId);
    if (!mouth || !heart || !isMouthOnHeart(mouth->position, heart->position)) {
        return false;
    }

    LOG_INFO(Combat, "Creature {} ate creature {}", attacker.getId(), victim.getId());
    victim.die(&attacker, DeathCause::Eaten);
    attacker.restoreHealth(EatingReward);
    return true;
}

void resolveContact(
    Creature& a, Creature& b, const Vector2d& relativeVelocity, double combinedMass)
{
    // At most one eat per contact: once a has eaten b, b is a corpse and cannot bite back.
    if (tryEat(a, b)) {
        return;
    }
    if (tryEat(b, a)) {
        return;
    }

    const double speed = impactSpeed(relativeVelocity);
    const double base = baseImpactDamage(speed, combinedMass);
    if (base <= 0.0) {
        return;
    }

    const double toA = bluntDamage(base, b.getAge(), a.getAge());
    const double toB = bluntDamage(base, a.getAge(), b.getAge());

    LOG_DEBUG(
        Combat,
        "Impact {} <-> {}: speed {:.2f}, damage {:.2f}/{:.2f}",
        a.getId(),
        b.getId(),
        speed,
        toA,
        toB);

    a.takeDamage(toA, &b);
    b.takeDamage(toB, &a);
}

} // namespace Combat
} // namespace Biomorph
