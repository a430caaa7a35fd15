#include "core/organisms/evolution/Selection.h"
#include "core/organisms/genetics/Genome.h"

#include <gtest/gtest.h>

using namespace Biomorph;

class SelectionTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    std::vector<std::shared_ptr<Genome>> createPopulation(const std::vector<double>& fitness)
    {
        std::vector<std::shared_ptr<Genome>> pop;
        for (double value : fitness) {
            auto genome = std::make_shared<Genome>(Genome::random(rng));
            genome->fitness = value;
            pop.push_back(genome);
        }
        return pop;
    }
};

TEST_F(SelectionTest, TournamentIndexIsInRange)
{
    const std::vector<double> fitness = { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 };

    for (int i = 0; i < 100; i++) {
        EXPECT_LT(tournamentSelectIndex(fitness, 3, rng), fitness.size());
    }
}

TEST_F(SelectionTest, SingleCandidateAlwaysWins)
{
    const std::vector<double> fitness = { 0.0 };

    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(tournamentSelectIndex(fitness, 3, rng), 0u);
    }
}

TEST_F(SelectionTest, TournamentFavorsFitterIndividuals)
{
    const std::vector<double> fitness = { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 };
    std::vector<int> counts(fitness.size(), 0);

    const int trials = 10000;
    for (int i = 0; i < trials; i++) {
        counts[tournamentSelectIndex(fitness, 3, rng)]++;
    }

    // With replacement, P(best of 3 draws is index 9) = 1 - 0.9^3 = 0.271.
    EXPECT_NEAR(counts[9] / static_cast<double>(trials), 0.271, 0.02);
    // The weakest only wins when drawn three times: 0.001.
    EXPECT_LT(counts[0], trials / 100);
    EXPECT_GT(counts[9], counts[5]);
    EXPECT_GT(counts[5], counts[0]);
}

TEST_F(SelectionTest, TournamentSizeOneIsUniform)
{
    const std::vector<double> fitness = { 0.0, 100.0 };
    int low = 0;

    for (int i = 0; i < 2000; i++) {
        if (tournamentSelectIndex(fitness, 1, rng) == 0) {
            low++;
        }
    }

    EXPECT_NEAR(low / 2000.0, 0.5, 0.05);
}

TEST_F(SelectionTest, TournamentSelectReturnsPopulationMember)
{
    const auto population = createPopulation({ 5.0, 1.0, 3.0 });

    const auto selected = tournamentSelect(population, 3, rng);

    EXPECT_NE(std::find(population.begin(), population.end(), selected), population.end());
}

TEST_F(SelectionTest, RankByFitnessIsDescending)
{
    const auto population = createPopulation({ 10.0, 5.0, 30.0, 2.0 });

    const auto order = rankByFitness(population);

    EXPECT_EQ(order, (std::vector<size_t>{ 2, 0, 1, 3 }));
}

TEST_F(SelectionTest, RankByFitnessKeepsTiesInOrder)
{
    const auto population = createPopulation({ 1.0, 7.0, 1.0, 7.0 });

    const auto order = rankByFitness(population);

    EXPECT_EQ(order, (std::vector<size_t>{ 1, 3, 0, 2 }));
}
