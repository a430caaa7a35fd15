#pragma once

#include "core/ReflectSerializer.h"
#include <nlohmann/json.hpp>

namespace Biomorph {

/**
 * Genetic algorithm parameters for generation turnover.
 */
struct EvolutionConfig {
    int populationSize = 20;
    int eliteCount = 2;         // Top genomes carried over unchanged.
    double mutationRate = 0.15; // Applied to every offspring.
    double crossoverRate = 0.3; // Chance an offspring has two parents.
    int tournamentSize = 3;
};

/**
 * Mid-generation mating between nearby creatures.
 */
struct ReproductionConfig {
    double minAge = 30.0; // Seconds.
    double minFood = 50.0;
    double minHealth = 50.0;
    double maxDistance = 80.0;
    double cooldown = 60.0; // Seconds between births per parent.
    int maxPopulation = 100;
    double mutationRate = 0.1;
    double spawnJitter = 40.0; // Full width of the random offset around the midpoint.
    double boundsMargin = 50.0;
};

inline void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    config = ReflectSerializer::from_json<EvolutionConfig>(j);
}

inline void to_json(nlohmann::json& j, const ReproductionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, ReproductionConfig& config)
{
    config = ReflectSerializer::from_json<ReproductionConfig>(j);
}

} // namespace Biomorph
