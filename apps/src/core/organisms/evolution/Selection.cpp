#include "Selection.h"

#include "core/Assert.h"
#include "core/organisms/genetics/Genome.h"

#include <algorithm>
#include <numeric>

namespace Biomorph {

size_t tournamentSelectIndex(
    const std::vector<double>& fitness, int tournamentSize, std::mt19937& rng)
{
    BIOMORPH_ASSERT(!fitness.empty(), "Tournament over an empty population");
    BIOMORPH_ASSERT(tournamentSize > 0, "Tournament size must be positive");

    std::uniform_int_distribution<size_t> dist(0, fitness.size() - 1);

    size_t bestIdx = dist(rng);
    for (int i = 1; i < tournamentSize; i++) {
        const size_t idx = dist(rng);
        if (fitness[idx] > fitness[bestIdx]) {
            bestIdx = idx;
        }
    }

    return bestIdx;
}

std::shared_ptr<Genome> tournamentSelect(
    const std::vector<std::shared_ptr<Genome>>& population, int tournamentSize, std::mt19937& rng)
{
    std::vector<double> fitness;
    fitness.reserve(population.size());
    for (const auto& genome : population) {
        fitness.push_back(genome->fitness);
    }

    return population[tournamentSelectIndex(fitness, tournamentSize, rng)];
}

std::vector<size_t> rankByFitness(const std::vector<std::shared_ptr<Genome>>& population)
{
    std::vector<size_t> order(population.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&population](size_t a, size_t b) {
        return population[a]->fitness > population[b]->fitness;
    });
    return order;
}

} // namespace Biomorph
