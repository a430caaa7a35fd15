#include "Simulation.h"

#include "core/LoggingChannels.h"
#include "core/Random.h"
#include "core/organisms/evolution/Crossover.h"
#include "core/organisms/evolution/Mutation.h"
#include "core/organisms/genetics/GenomeSerializer.h"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>
#include <set>

namespace Biomorph {

namespace {

std::mt19937 makeRng(const std::optional<uint32_t>& seed)
{
    if (seed.has_value()) {
        return std::mt19937(*seed);
    }
    std::random_device device;
    return std::mt19937(device());
}

} // namespace

Simulation::Simulation(const SimulationConfig& config, EventSink* events)
    : config_(config), events_(events), rng_(makeRng(config.seed))
{
    config_.evolution.populationSize =
        std::clamp(config_.evolution.populationSize, MinPopulation, MaxPopulation);
    speedMultiplier_ = std::clamp(config_.speedMultiplier, MinSpeed, MaxSpeed);

    evolution_ = std::make_unique<EvolutionManager>(config_.evolution, rng_);
    arena_ = std::make_unique<Arena>(config_.arena, rng_, events_);

    initGeneration();
}

Simulation::~Simulation()
{
    // Creatures hold references into the arena's world.
    arena_.reset();
}

void Simulation::start()
{
    if (running_) {
        return;
    }
    running_ = true;
    LOG_INFO(Sim, "Simulation started (speed {}x)", speedMultiplier_);
}

void Simulation::pause()
{
    if (!running_) {
        return;
    }
    running_ = false;
    LOG_INFO(Sim, "Simulation paused at {:.1f}s", totalTime_);
}

void Simulation::reset()
{
    pause();
    evolution_ = std::make_unique<EvolutionManager>(config_.evolution, rng_);
    nextCreatureId_ = CreatureId{ 0 };
    initGeneration();
    LOG_INFO(Sim, "Simulation reset with population {}", config_.evolution.populationSize);
}

void Simulation::initGeneration()
{
    arena_->clearCreatures();
    arena_->resetPowerUps();
    arena_->regenerateObstacles();

    if (evolution_->getPopulation().empty()) {
        evolution_->initializePopulation();
    }

    for (const auto& genome : evolution_->getPopulation()) {
        spawnCreature(genome, randomSpawnPosition());
    }
    refreshVisibility();

    LOG_INFO(
        Sim,
        "Generation {} started with {} creatures",
        evolution_->getGeneration(),
        arena_->creatureCount());
}

Vector2d Simulation::randomSpawnPosition()
{
    const ArenaConfig& arena = config_.arena;
    const double margin = config_.spawnMargin;
    return Vector2d{ margin + uniform(rng_, 0.0, 1.0) * std::max(0.0, arena.width - margin * 2.0),
                     margin
                         + uniform(rng_, 0.0, 1.0) * std::max(0.0, arena.height - margin * 2.0) };
}

Creature& Simulation::spawnCreature(
    std::shared_ptr<Genome> genome,
    const Vector2d& position,
    std::optional<CreatureId> parentA,
    std::optional<CreatureId> parentB)
{
    const CreatureId id = nextCreatureId_++;
    Creature& creature = arena_->spawnCreature(id, std::move(genome), position);
    if (events_) {
        events_->onBirth(id, parentA, parentB);
    }
    return creature;
}

void Simulation::refreshVisibility()
{
    const std::vector<const Creature*> views = arena_->getCreatureViews();
    for (Creature* creature : arena_->getLivingCreatures()) {
        creature->setVisibleCreatures(views);
    }
}

void Simulation::tick(double realDt)
{
    if (!running_) {
        return;
    }
    advance(realDt);
}

void Simulation::advance(double realDt)
{
    const double frame = std::clamp(realDt, 0.0, config_.maxFrameTime);
    const double simulated = frame * speedMultiplier_;
    const int subSteps = std::max(1, static_cast<int>(std::ceil(speedMultiplier_)));
    const double subDt = simulated / subSteps;

    for (int s = 0; s < subSteps; s++) {
        if (s == 0) {
            refreshVisibility();
        }

        arena_->update(subDt);

        if (s == 0) {
            arena_->updatePowerUps();
            if (arena_->removeDestructible() > 0) {
                refreshVisibility();
            }
        }

        totalTime_ += subDt;
    }

    checkReproduction();

    if (arena_->livingCount() <= GenerationEndSurvivors) {
        endGeneration();
    }

    if (totalTime_ >= nextStatsTime_) {
        reportStats();
        nextStatsTime_ = totalTime_ + config_.statsInterval;
    }
}

void Simulation::checkReproduction()
{
    const ReproductionConfig& rules = config_.reproduction;
    std::vector<Creature*> living = arena_->getLivingCreatures();
    size_t population = living.size();
    if (population >= static_cast<size_t>(rules.maxPopulation)) {
        return;
    }

    const auto eligible = [&](const Creature& c) {
        return c.isAlive() && c.getAge() >= rules.minAge && c.getFood() >= rules.minFood
            && c.getHealth() >= rules.minHealth
            && totalTime_ - c.getLastReproductionTime() >= rules.cooldown;
    };

    for (size_t i = 0; i < living.size(); i++) {
        Creature& first = *living[i];
        if (!eligible(first)) {
            continue;
        }

        for (size_t j = i + 1; j < living.size(); j++) {
            Creature& second = *living[j];
            if (!eligible(second)) {
                continue;
            }

            const double distance =
                (second.getCenterPosition() - first.getCenterPosition()).magnitude();
            if (distance >= rules.maxDistance) {
                continue;
            }

            reproduce(first, second);
            first.setLastReproductionTime(totalTime_);
            second.setLastReproductionTime(totalTime_);

            if (++population >= static_cast<size_t>(rules.maxPopulation)) {
                return;
            }
            break;
        }
    }
}

void Simulation::reproduce(Creature& first, Creature& second)
{
    const ReproductionConfig& rules = config_.reproduction;

    Genome child = crossover(*first.getGenome(), *second.getGenome(), rng_);
    child = mutate(child, rules.mutationRate, rng_);
    child.generation = evolution_->getGeneration();
    child.fitness = 0.0;

    const Vector2d midpoint = (first.getCenterPosition() + second.getCenterPosition()) / 2.0;
    const Vector2d jitter{ (uniform(rng_, 0.0, 1.0) - 0.5) * rules.spawnJitter,
                           (uniform(rng_, 0.0, 1.0) - 0.5) * rules.spawnJitter };
    const ArenaConfig& arena = config_.arena;
    const double margin = rules.boundsMargin;
    const Vector2d position{
        std::clamp(midpoint.x + jitter.x, margin, std::max(margin, arena.width - margin)),
        std::clamp(midpoint.y + jitter.y, margin, std::max(margin, arena.height - margin))
    };

    Creature& offspring = spawnCreature(
        std::make_shared<Genome>(std::move(child)), position, first.getId(), second.getId());

    LOG_INFO(
        Reproduction,
        "Creatures {} and {} produced {} at {}",
        first.getId(),
        second.getId(),
        offspring.getId(),
        position);
}

void Simulation::endGeneration()
{
    const int finished = evolution_->getGeneration();
    evolution_->updateFitness(arena_->getCreatureViews());

    std::vector<Creature*> living = arena_->getLivingCreatures();
    std::stable_sort(living.begin(), living.end(), [](const Creature* a, const Creature* b) {
        return a->calculateFitness() > b->calculateFitness();
    });
    const size_t eliteCount =
        std::min(living.size(), static_cast<size_t>(std::max(0, config_.evolution.eliteCount)));
    std::vector<Creature*> elites(living.begin(), living.begin() + eliteCount);

    std::set<CreatureId> keep;
    for (const Creature* elite : elites) {
        keep.insert(elite->getId());
    }
    std::vector<CreatureId> doomed;
    for (const auto& [id, creature] : arena_->getCreatures()) {
        if (keep.count(id) == 0) {
            doomed.push_back(id);
        }
    }
    for (const CreatureId id : doomed) {
        arena_->removeCreature(id);
    }

    const EvolutionManager::SuccessorMap successors = evolution_->evolveNextGeneration();

    std::set<const Genome*> embodied;
    for (Creature* elite : elites) {
        auto it = successors.find(elite->getGenome().get());
        if (it != successors.end() && embodied.count(it->second.get()) == 0) {
            elite->setGenome(it->second);
        }
        else {
            elite->setGenome(evolution_->adoptSurvivor(*elite->getGenome()));
        }
        embodied.insert(elite->getGenome().get());
    }

    arena_->resetPowerUps();
    arena_->regenerateObstacles();

    for (const auto& genome : evolution_->getPopulation()) {
        if (embodied.count(genome.get()) == 0) {
            spawnCreature(genome, randomSpawnPosition());
        }
    }
    refreshVisibility();

    LOG_INFO(
        Evolution,
        "Generation {} ended: {} elites kept, {} creatures in generation {}",
        finished,
        elites.size(),
        arena_->creatureCount(),
        evolution_->getGeneration());

    if (events_) {
        events_->onGenerationEnd(finished, evolution_->getBestFitness());
    }
}

void Simulation::setSpeedMultiplier(double multiplier)
{
    speedMultiplier_ = std::clamp(multiplier, MinSpeed, MaxSpeed);
    LOG_INFO(Sim, "Speed multiplier set to {}x", speedMultiplier_);
}

void Simulation::setPopulationSize(int size)
{
    config_.evolution.populationSize = std::clamp(size, MinPopulation, MaxPopulation);
    evolution_->setPopulationSize(config_.evolution.populationSize);
}

std::optional<Genome> Simulation::exportBestGenome() const
{
    const Creature* best = nullptr;
    double bestFitness = 0.0;
    for (const auto& [id, creature] : arena_->getCreatures()) {
        const double fitness = creature->calculateFitness();
        if (!best || fitness > bestFitness) {
            best = creature.get();
            bestFitness = fitness;
        }
    }
    if (!best) {
        return std::nullopt;
    }

    Genome genome = best->getGenome()->clone();
    genome.fitness = bestFitness;
    return genome;
}

Result<std::monostate, std::string> Simulation::importGenome(const nlohmann::json& document)
{
    auto parsed = GenomeSerializer::fromJson(document);
    if (parsed.isError()) {
        LOG_WARN(Sim, "Genome import rejected: {}", parsed.errorValue());
        return Result<std::monostate, std::string>::error(parsed.errorValue());
    }
    return importGenome(parsed.value());
}

Result<std::monostate, std::string> Simulation::importGenome(const Genome& genome)
{
    using ImportResult = Result<std::monostate, std::string>;

    const std::string problem = GenomeSerializer::validate(genome);
    if (!problem.empty()) {
        LOG_WARN(Sim, "Genome import rejected: {}", problem);
        return ImportResult::error(problem);
    }

    // The population is rebuilt first; live creatures are only replaced once it exists.
    try {
        evolution_->seedFromGenome(genome, ImportMutationRate);
    }
    catch (const std::exception& e) {
        LOG_ERROR(Sim, "Genome import failed: {}", e.what());
        return ImportResult::error(std::string("cannot seed population: ") + e.what());
    }

    pause();
    initGeneration();
    start();
    return ImportResult::okay(std::monostate{});
}

SimulationStats Simulation::getStats() const
{
    SimulationStats stats;
    stats.generation = evolution_->getGeneration();
    stats.totalTime = totalTime_;
    stats.creatureCount = static_cast<int>(arena_->creatureCount());
    stats.bestFitness = evolution_->getBestFitness();
    stats.avgFitness = evolution_->getAvgFitness();

    for (const auto& [id, creature] : arena_->getCreatures()) {
        if (!creature->isAlive()) {
            continue;
        }
        stats.aliveCount++;
        if (!stats.oldestCreatureId || creature->getAge() > stats.oldestCreatureAge) {
            stats.oldestCreatureId = id;
            stats.oldestCreatureAge = creature->getAge();
        }
    }
    return stats;
}

void Simulation::reportStats()
{
    const SimulationStats stats = getStats();
    LOG_INFO(
        Stats,
        "gen {} | t {:.0f}s | alive {}/{} | best {:.0f} avg {:.0f}",
        stats.generation,
        stats.totalTime,
        stats.aliveCount,
        stats.creatureCount,
        stats.bestFitness,
        stats.avgFitness);
    if (events_) {
        events_->onStats(stats);
    }
}

} // namespace Biomorph
