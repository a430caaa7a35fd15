#pragma once

#include <random>

namespace Biomorph {

// Uniform double in [lo, hi).
inline double uniform(std::mt19937& rng, double lo, double hi)
{
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng);
}

// Uniform int in [lo, hi].
inline int uniformInt(std::mt19937& rng, int lo, int hi)
{
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng);
}

// Bernoulli trial. Probabilities outside [0, 1] saturate.
inline bool chance(std::mt19937& rng, double probability)
{
    if (probability <= 0.0) return false;
    if (probability >= 1.0) return true;
    return uniform(rng, 0.0, 1.0) < probability;
}

} // namespace Biomorph
