#pragma once

#include "core/organisms/CreatureTypes.h"

#include <optional>

namespace Biomorph {

struct SimulationStats {
    int generation = 0;
    double totalTime = 0.0; // Simulated seconds, never reset.
    int aliveCount = 0;
    int creatureCount = 0;
    double bestFitness = 0.0;
    double avgFitness = 0.0;
    std::optional<CreatureId> oldestCreatureId;
    double oldestCreatureAge = 0.0;
};

/**
 * Receiver for domain events. Notifications are fire-and-forget and arrive
 * synchronously from inside the tick. Default implementations ignore everything.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void onBirth(
        CreatureId /*child*/,
        std::optional<CreatureId> /*parentA*/,
        std::optional<CreatureId> /*parentB*/)
    {}

    virtual void onDeath(
        CreatureId /*victim*/, std::optional<CreatureId> /*killer*/, DeathCause /*cause*/)
    {}

    virtual void onDamage(CreatureId /*attacker*/, CreatureId /*victim*/, double /*amount*/) {}

    virtual void onPowerUpCollected(CreatureId /*collector*/, double /*amount*/) {}

    virtual void onGenerationEnd(int /*finishedGeneration*/, double /*bestFitness*/) {}

    virtual void onStats(const SimulationStats& /*stats*/) {}
};

} // namespace Biomorph
