#include "Crossover.h"

#include "core/Random.h"
#include "core/organisms/genetics/Genome.h"

#include <algorithm>

namespace Biomorph {

Genome crossover(const Genome& first, const Genome& second, std::mt19937& rng)
{
    Genome child = chance(rng, 0.5) ? first.clone() : second.clone();

    const size_t shared =
        std::min({ child.joints.size(), first.joints.size(), second.joints.size() });
    for (size_t i = 0; i < shared; i++) {
        const Genome& source = chance(rng, 0.5) ? first : second;
        child.joints[i].motorPattern = source.joints[i].motorPattern;
    }

    child.baseHue = (first.baseHue + second.baseHue) / 2.0 + uniform(rng, -15.0, 15.0);

    return child;
}

} // namespace Biomorph
