#pragma once

#include <random>

namespace Biomorph {

struct Genome;

/**
 * Sexual recombination. The child inherits one parent's complete body plan,
 * chosen at random, so topology and the sensor-motor matrix always agree.
 * Motor patterns of joints present in both parents are then drawn from
 * either parent, and baseHue becomes the parents' midpoint plus jitter.
 * Neither parent is modified.
 */
Genome crossover(const Genome& first, const Genome& second, std::mt19937& rng);

} // namespace Biomorph
