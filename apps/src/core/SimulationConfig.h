#pragma once

#include "core/ReflectSerializer.h"
#include "core/arena/ArenaConfig.h"
#include "core/organisms/evolution/EvolutionConfig.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>

namespace Biomorph {

/**
 * Everything needed to start a run. Loaded from biomorph.json through
 * ConfigLoader; keys missing from the file keep these defaults.
 */
struct SimulationConfig {
    ArenaConfig arena;
    EvolutionConfig evolution;
    ReproductionConfig reproduction;

    double spawnMargin = 150.0;     // Keep-out band for generation spawns.
    double maxFrameTime = 0.1;      // Real seconds per frame before speed scaling.
    double speedMultiplier = 1.0;
    double statsInterval = 10.0;    // Simulated seconds between stats reports.
    std::optional<uint32_t> seed;   // Random device when unset.
};

inline void to_json(nlohmann::json& j, const SimulationConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, SimulationConfig& config)
{
    config = ReflectSerializer::from_json<SimulationConfig>(j);
}

} // namespace Biomorph
