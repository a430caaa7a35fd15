#pragma once

#include "core/EventSink.h"

namespace Biomorph {
namespace Client {

/**
 * Writes domain events to the log channels: births and deaths on "creature",
 * damage on "combat", stats on "stats".
 */
class LoggingEventSink : public EventSink {
public:
    void onBirth(
        CreatureId child,
        std::optional<CreatureId> parentA,
        std::optional<CreatureId> parentB) override;
    void onDeath(
        CreatureId victim, std::optional<CreatureId> killer, DeathCause cause) override;
    void onDamage(CreatureId attacker, CreatureId victim, double amount) override;
    void onPowerUpCollected(CreatureId collector, double amount) override;
    void onGenerationEnd(int finishedGeneration, double bestFitness) override;
    void onStats(const SimulationStats& stats) override;

    int births() const { return births_; }
    int deaths() const { return deaths_; }
    int kills() const { return kills_; }
    int starvations() const { return starvations_; }

private:
    int births_ = 0;
    int deaths_ = 0;
    int kills_ = 0;
    int starvations_ = 0;
};

} // namespace Client
} // namespace Biomorph
