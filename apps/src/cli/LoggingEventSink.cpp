#include "LoggingEventSink.h"

#include "core/LoggingChannels.h"

namespace Biomorph {
namespace Client {

void LoggingEventSink::onBirth(
    CreatureId child, std::optional<CreatureId> parentA, std::optional<CreatureId> parentB)
{
    births_++;
    if (parentA && parentB) {
        LOG_INFO(Creature, "Creature {} was born (parents {} & {})", child, *parentA, *parentB);
    }
    else {
        LOG_DEBUG(Creature, "Creature {} was born", child);
    }
}

void LoggingEventSink::onDeath(
    CreatureId victim, std::optional<CreatureId> killer, DeathCause cause)
{
    deaths_++;
    if (cause == DeathCause::Starvation) {
        starvations_++;
        LOG_INFO(Creature, "Creature {} starved", victim);
    }
    else if (killer) {
        kills_++;
        LOG_INFO(Combat, "Creature {} killed creature {}", *killer, victim);
    }
    else {
        LOG_INFO(Creature, "Creature {} died ({})", victim, toString(cause));
    }
}

void LoggingEventSink::onDamage(CreatureId attacker, CreatureId victim, double amount)
{
    LOG_DEBUG(Combat, "Creature {} dealt {:.1f} damage to creature {}", attacker, amount, victim);
}

void LoggingEventSink::onPowerUpCollected(CreatureId collector, double amount)
{
    LOG_DEBUG(PowerUp, "Creature {} ate a power-up (+{:.0f})", collector, amount);
}

void LoggingEventSink::onGenerationEnd(int finishedGeneration, double bestFitness)
{
    LOG_INFO(Evolution, "Generation {} complete, best fitness {:.1f}", finishedGeneration, bestFitness);
}

void LoggingEventSink::onStats(const SimulationStats& stats)
{
    if (stats.oldestCreatureId) {
        LOG_DEBUG(
            Stats,
            "Oldest living creature: {} ({:.0f}s)",
            *stats.oldestCreatureId,
            stats.oldestCreatureAge);
    }
}

} // namespace Client
} // namespace Biomorph
