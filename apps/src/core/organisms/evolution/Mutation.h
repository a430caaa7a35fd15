#pragma once

#include <random>

namespace Biomorph {

struct Genome;

struct MutationStats {
    int pointMutations = 0;
    int grippersToggled = 0;
    int sensorsAdded = 0;
    int branchesAdded = 0;

    int structuralChanges() const { return grippersToggled + sensorsAdded + branchesAdded; }
    int totalChanges() const { return pointMutations + structuralChanges(); }
};

/**
 * Return a mutated copy of parent. Each numeric field is perturbed with
 * probability `rate` (or a fixed multiple of it) and clamped to its valid
 * range. Rare structural changes add a sensor or a branch segment and extend
 * sensorMotorWeights to match. The parent is never modified.
 */
Genome mutate(
    const Genome& parent, double rate, std::mt19937& rng, MutationStats* stats = nullptr);

} // namespace Biomorph
