#pragma once

#include "core/EventSink.h"
#include "core/Result.h"
#include "core/SimulationConfig.h"
#include "core/Vector2.h"
#include "core/arena/Arena.h"
#include "core/organisms/evolution/EvolutionManager.h"

#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <random>
#include <string>
#include <variant>

namespace Biomorph {

/**
 * Drives a population of creatures through continuous time: frame
 * sub-stepping, mid-generation mating, and generation turnover once the
 * population has nearly died out.
 *
 * Single threaded. tick() and the control methods must be called from the
 * same thread.
 */
class Simulation {
public:
    static constexpr double MinSpeed = 0.5;
    static constexpr double MaxSpeed = 1000.0;
    static constexpr int MinPopulation = 5;
    static constexpr int MaxPopulation = 50;
    static constexpr double ImportMutationRate = 0.2;
    // Turnover happens once this many or fewer creatures are alive.
    static constexpr size_t GenerationEndSurvivors = 2;

    explicit Simulation(const SimulationConfig& config, EventSink* events = nullptr);
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    void start();
    void pause();
    bool isRunning() const { return running_; }

    // Fresh population at generation 0 with the current target size. Leaves the
    // simulation paused.
    void reset();

    /**
     * Advance by one frame of realDt real seconds, scaled by the speed
     * multiplier. Does nothing while paused.
     */
    void tick(double realDt);

    // Same as tick() but ignores the paused state.
    void advance(double realDt);

    // Pair up eligible living creatures that are close enough to mate.
    void checkReproduction();

    // Score, keep the elites alive, evolve and respawn the rest.
    void endGeneration();

    void setSpeedMultiplier(double multiplier);
    double getSpeedMultiplier() const { return speedMultiplier_; }

    // Applies from the next turnover or reset.
    void setPopulationSize(int size);

    // Genome of the creature with the highest current fitness, dead or alive.
    std::optional<Genome> exportBestGenome() const;

    /**
     * Validate a genome and restart from it. On error nothing changes; on
     * success the simulation is running again.
     */
    Result<std::monostate, std::string> importGenome(const nlohmann::json& document);
    Result<std::monostate, std::string> importGenome(const Genome& genome);

    SimulationStats getStats() const;
    double getTotalTime() const { return totalTime_; }
    int getGeneration() const { return evolution_->getGeneration(); }

    Arena& getArena() { return *arena_; }
    const Arena& getArena() const { return *arena_; }
    EvolutionManager& getEvolution() { return *evolution_; }
    const EvolutionManager& getEvolution() const { return *evolution_; }
    const SimulationConfig& getConfig() const { return config_; }

    Creature& spawnCreature(
        std::shared_ptr<Genome> genome,
        const Vector2d& position,
        std::optional<CreatureId> parentA = std::nullopt,
        std::optional<CreatureId> parentB = std::nullopt);

private:
    void initGeneration();
    void refreshVisibility();
    void reproduce(Creature& first, Creature& second);
    void reportStats();
    Vector2d randomSpawnPosition();

    SimulationConfig config_;
    EventSink* events_;
    std::mt19937 rng_;
    std::unique_ptr<EvolutionManager> evolution_;
    std::unique_ptr<Arena> arena_;

    bool running_ = false;
    double totalTime_ = 0.0;
    double speedMultiplier_ = 1.0;
    double nextStatsTime_ = 0.0;
    CreatureId nextCreatureId_{ 0 };
};

} // namespace Biomorph
