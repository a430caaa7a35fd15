#pragma once

#include "core/ReflectSerializer.h"
#include <nlohmann/json.hpp>

namespace Biomorph {

/**
 * Layout and item rules for the arena. Distances are world units, forces are
 * per unit of body mass.
 */
struct ArenaConfig {
    double width = 1600.0;
    double height = 1000.0;

    double wallThickness = 200.0;
    double wallRestitution = 0.8;
    double wallFriction = 0.1;

    int minObstacles = 5;
    int maxObstacles = 9;
    double obstacleMinSize = 30.0;
    double obstacleMaxSize = 80.0;
    double obstacleMargin = 100.0;

    int powerUpCount = 2;
    double superPowerUpChance = 0.2;
    double powerUpMargin = 100.0;
    double superFleeRange = 150.0;
    double superFleeStrength = 1.8;
    double gripperRange = 100.0;
    double gripperStrength = 0.72;

    double maxPhysicsStep = 0.05; // Seconds.
};

inline void to_json(nlohmann::json& j, const ArenaConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, ArenaConfig& config)
{
    config = ReflectSerializer::from_json<ArenaConfig>(j);
}

} // namespace Biomorph
