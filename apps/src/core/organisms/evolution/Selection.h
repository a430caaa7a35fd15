#pragma once

#include <memory>
#include <random>
#include <vector>

namespace Biomorph {

struct Genome;

/**
 * Tournament selection with replacement: draw tournamentSize random
 * indices, return the one with the highest fitness. The first drawn wins ties.
 */
size_t tournamentSelectIndex(
    const std::vector<double>& fitness, int tournamentSize, std::mt19937& rng);

/**
 * Tournament over genomes using their recorded fitness.
 */
std::shared_ptr<Genome> tournamentSelect(
    const std::vector<std::shared_ptr<Genome>>& population, int tournamentSize, std::mt19937& rng);

/**
 * Indices of population ordered by descending fitness. Equal fitness keeps
 * population order.
 */
std::vector<size_t> rankByFitness(const std::vector<std::shared_ptr<Genome>>& population);

} // namespace Biomorph
