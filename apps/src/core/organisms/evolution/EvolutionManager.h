#pragma once

#include "core/organisms/evolution/EvolutionConfig.h"
#include "core/organisms/genetics/Genome.h"

#include <map>
#include <memory>
#include <random>
#include <vector>

namespace Biomorph {

class Creature;

struct FitnessRecord {
    int generation = 0;
    double best = 0.0;
    double avg = 0.0;
};

struct EvolutionStats {
    int generation = 0;
    int populationSize = 0;
    double bestFitness = 0.0;
    double avgFitness = 0.0;
    std::vector<FitnessRecord> history;
};

/**
 * Owns the genome population across generations.
 *
 * Genomes are shared with the creatures that embody them; fitness write-back
 * matches creatures to genomes by pointer identity.
 */
class EvolutionManager {
public:
    // Old genome -> clone that represents it in the new population.
    using SuccessorMap = std::map<const Genome*, std::shared_ptr<Genome>>;

    EvolutionManager(const EvolutionConfig& config, std::mt19937& rng);

    void initializePopulation();
    void initializePopulation(int size);

    /**
     * Replace the population with one exact copy of the genome plus mutated
     * copies, continuing from the genome's recorded generation.
     */
    void seedFromGenome(const Genome& genome, double mutationRate);

    const std::vector<std::shared_ptr<Genome>>& getPopulation() const { return population_; }

    /**
     * Write calculateFitness() back to each creature's genome and record
     * best/avg of the whole population. Creatures whose genome is not part of
     * the population are skipped.
     */
    void updateFitness(const std::vector<const Creature*>& creatures);

    /**
     * Elites cloned verbatim, the rest filled by tournament selection with
     * optional crossover, every offspring mutated.
     * @return successors of the elite genomes, keyed by the genome they copy
     */
    SuccessorMap evolveNextGeneration();

    /**
     * Give a surviving creature whose genome has no successor a place in the
     * new population by replacing the last offspring slot with a clone of it.
     * @return the clone, stamped with the current generation
     */
    std::shared_ptr<Genome> adoptSurvivor(const Genome& genome);

    int getGeneration() const { return generation_; }
    void setGeneration(int generation) { generation_ = generation; }

    const EvolutionConfig& getConfig() const { return config_; }
    void setPopulationSize(int size);

    EvolutionStats getStats() const;
    double getBestFitness() const { return bestFitness_; }
    double getAvgFitness() const { return avgFitness_; }
    const std::vector<FitnessRecord>& getHistory() const { return history_; }

private:
    EvolutionConfig config_;
    std::mt19937& rng_;

    std::vector<std::shared_ptr<Genome>> population_;
    int generation_ = 0;
    int adopted_ = 0;
    double bestFitness_ = 0.0;
    double avgFitness_ = 0.0;
    std::vector<FitnessRecord> history_;
};

} // namespace Biomorph
