#pragma once

#include "core/Vector2.h"

namespace Biomorph {

class Creature;

/**
 * Damage rules for creature-on-creature contact.
 *
 * Impact speeds are in units per 60 Hz frame, the scale the damage threshold
 * was tuned against. Use impactSpeed() to convert a physics relative velocity.
 */
namespace Combat {

constexpr double FrameRate = 60.0;
constexpr double DamageThreshold = 2.0;
constexpr double DamageMultiplier = 0.15;
constexpr double MouthHeartRadius = 25.0;
constexpr double EatingReward = 150.0;
// Age at which combat bonuses stop growing: four hours.
constexpr double MaturityAge = 14400.0;

// 1.0 at birth rising linearly to 2.0 at maturity.
double attackMultiplier(double age);

// 1.0 at birth falling linearly to 0.5 at maturity.
double defenseMultiplier(double age);

// Relative velocity in units/s to impact speed in units/frame.
double impactSpeed(const Vector2d& relativeVelocity);

// Shared blunt damage before the per-side split; zero at or below the threshold.
double baseImpactDamage(double impactSpeed, double combinedMass);

// Damage the defender takes from its half of the impact.
double bluntDamage(double baseDamage, double attackerAge, double defenderAge);

bool isMouthOnHeart(const Vector2d& mouth, const Vector2d& heart);

/**
 * Instant kill when the attacker's mouth body touches the victim's heart body.
 * The attacker is fed EatingReward on success.
 * @return true if the victim died
 */
bool tryEat(Creature& attacker, Creature& victim);

/**
 * Apply both instant-kill checks and then blunt damage for a contact between
 * two living creatures of different ids.
 */
void resolveContact(
    Creature& a, Creature& b, const Vector2d& relativeVelocity, double combinedMass);

} // namespace Combat
} // namespace Biomorph
