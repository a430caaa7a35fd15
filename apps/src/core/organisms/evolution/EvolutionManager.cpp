#include "EvolutionManager.h"
#include "Crossover.h"
#include "Mutation.h"
#include "Selection.h"

#include "core/LoggingChannels.h"
#include "core/organisms/Creature.h"

#include <algorithm>

namespace Biomorph {

EvolutionManager::EvolutionManager(const EvolutionConfig& config, std::mt19937& rng)
    : config_(config), rng_(rng)
{}

void EvolutionManager::initializePopulation()
{
    initializePopulation(config_.populationSize);
}

void EvolutionManager::initializePopulation(int size)
{
    population_.clear();
    population_.reserve(static_cast<size_t>(std::max(0, size)));
    for (int i = 0; i < size; i++) {
        population_.push_back(std::make_shared<Genome>(Genome::random(rng_)));
    }
    generation_ = 0;
    adopted_ = 0;

    LOG_INFO(Evolution, "Initialized population of {} random genomes", population_.size());
}

void EvolutionManager::seedFromGenome(const Genome& genome, double mutationRate)
{
    // Built aside so a throw leaves the current population in place.
    std::vector<std::shared_ptr<Genome>> seeded;
    seeded.reserve(static_cast<size_t>(std::max(1, config_.populationSize)));

    seeded.push_back(std::make_shared<Genome>(genome.clone()));
    for (int i = 1; i < config_.populationSize; i++) {
        seeded.push_back(std::make_shared<Genome>(mutate(genome, mutationRate, rng_)));
    }

    population_.swap(seeded);
    generation_ = genome.generation;
    adopted_ = 0;

    LOG_INFO(
        Evolution,
        "Seeded population of {} from imported genome (generation {})",
        population_.size(),
        generation_);
}

void EvolutionManager::updateFitness(const std::vector<const Creature*>& creatures)
{
    for (const Creature* creature : creatures) {
        const Genome* genome = creature->getGenome().get();
        auto it = std::find_if(
            population_.begin(), population_.end(), [genome](const std::shared_ptr<Genome>& g) {
                return g.get() == genome;
            });
        if (it == population_.end()) {
            LOG_DEBUG(
                Evolution,
                "Creature {} carries a genome outside the population",
                creature->getId());
            continue;
        }
        (*it)->fitness = creature->calculateFitness();
    }

    if (population_.empty()) {
        bestFitness_ = 0.0;
        avgFitness_ = 0.0;
    }
    else {
        double best = population_.front()->fitness;
        double sum = 0.0;
        for (const auto& genome : population_) {
            best = std::max(best, genome->fitness);
            sum += genome->fitness;
        }
        bestFitness_ = best;
        avgFitness_ = sum / static_cast<double>(population_.size());
    }

    history_.push_back(
        FitnessRecord{ .generation = generation_, .best = bestFitness_, .avg = avgFitness_ });

    LOG_INFO(
        Evolution,
        "Generation {} fitness: best {:.1f}, avg {:.1f}",
        generation_,
        bestFitness_,
        avgFitness_);
}

EvolutionManager::SuccessorMap EvolutionManager::evolveNextGeneration()
{
    SuccessorMap successors;
    const int nextGeneration = generation_ + 1;

    const std::vector<size_t> order = rankByFitness(population_);
    std::vector<std::shared_ptr<Genome>> sorted;
    sorted.reserve(order.size());
    for (const size_t index : order) {
        sorted.push_back(population_[index]);
    }

    std::vector<std::shared_ptr<Genome>> next;
    next.reserve(static_cast<size_t>(std::max(0, config_.populationSize)));

    const int eliteCount = std::min<int>(config_.eliteCount, static_cast<int>(sorted.size()));
    for (int i = 0; i < eliteCount && static_cast<int>(next.size()) < config_.populationSize;
         i++) {
        auto elite = std::make_shared<Genome>(sorted[i]->clone());
        elite->generation = nextGeneration;
        elite->fitness = 0.0;
        successors[sorted[i].get()] = elite;
        next.push_back(std::move(elite));
    }

    int crossovers = 0;
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    while (static_cast<int>(next.size()) < config_.populationSize && !sorted.empty()) {
        Genome child;
        if (sorted.size() >= 2 && unit(rng_) < config_.crossoverRate) {
            const auto first = tournamentSelect(sorted, config_.tournamentSize, rng_);
            const auto second = tournamentSelect(sorted, config_.tournamentSize, rng_);
            child = crossover(*first, *second, rng_);
            crossovers++;
        }
        else {
            child = tournamentSelect(sorted, config_.tournamentSize, rng_)->clone();
        }

        child = mutate(child, config_.mutationRate, rng_);
        child.generation = nextGeneration;
        child.fitness = 0.0;
        next.push_back(std::make_shared<Genome>(std::move(child)));
    }

    const size_t offspring = next.size() - successors.size();
    population_ = std::move(next);
    generation_ = nextGeneration;
    adopted_ = 0;

    LOG_INFO(
        Evolution,
        "Advanced to generation {}: {} elites, {} offspring ({} crossover)",
        generation_,
        successors.size(),
        offspring,
        crossovers);

    return successors;
}

std::shared_ptr<Genome> EvolutionManager::adoptSurvivor(const Genome& genome)
{
    auto adopted = std::make_shared<Genome>(genome.clone());
    adopted->generation = generation_;
    adopted->fitness = 0.0;

    // Fill offspring slots from the back so elites are never displaced.
    const int slot = static_cast<int>(population_.size()) - 1 - adopted_;
    if (slot >= config_.eliteCount && slot >= 0) {
        population_[static_cast<size_t>(slot)] = adopted;
        adopted_++;
    }
    else {
        population_.push_back(adopted);
        LOG_WARN(
            Evolution,
            "No offspring slot left for survivor, population grows to {}",
            population_.size());
    }
    return adopted;
}

void EvolutionManager::setPopulationSize(int size)
{
    config_.populationSize = size;
    LOG_INFO(Evolution, "Population size set to {} from next generation", size);
}

EvolutionStats EvolutionManager::getStats() const
{
    return EvolutionStats{ .generation = generation_,
                           .populationSize = static_cast<int>(population_.size()),
                           .bestFitness = bestFitness_,
                           .avgFitness = avgFitness_,
                           .history = history_ };
}

} // namespace Biomorph
