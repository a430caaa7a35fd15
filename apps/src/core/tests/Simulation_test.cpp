#include "core/Simulation.h"
#include "core/organisms/genetics/GenomeSerializer.h"
#include "core/organisms/tests/CreatureTestUtils.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace Biomorph;

namespace {

class BirthSink : public EventSink {
public:
    void onBirth(
        CreatureId child, std::optional<CreatureId> parentA, std::optional<CreatureId> parentB)
        override
    {
        births.push_back({ child, parentA, parentB });
    }

    void onGenerationEnd(int finishedGeneration, double /*bestFitness*/) override
    {
        finishedGenerations.push_back(finishedGeneration);
    }

    struct Birth {
        CreatureId child;
        std::optional<CreatureId> parentA;
        std::optional<CreatureId> parentB;
    };
    std::vector<Birth> births;
    std::vector<int> finishedGenerations;
};

} // namespace

class SimulationTest : public ::testing::Test {
protected:
    SimulationConfig makeConfig(int populationSize = 6)
    {
        SimulationConfig config;
        config.seed = 42;
        config.evolution.populationSize = populationSize;
        config.evolution.eliteCount = 2;
        return config;
    }

    void makeMatingReady(Creature& creature)
    {
        creature.setAge(40.0);
        creature.setFood(60.0);
        creature.setHealth(60.0);
        creature.setLastReproductionTime(-60.0);
    }

    void killAllExcept(Simulation& sim, size_t survivors)
    {
        std::vector<Creature*> living = sim.getArena().getLivingCreatures();
        for (size_t i = survivors; i < living.size(); i++) {
            living[i]->die(nullptr, DeathCause::Combat);
        }
    }

    BirthSink sink;
};

TEST_F(SimulationTest, StartsPausedWithFullGeneration)
{
    Simulation sim(makeConfig(), &sink);

    EXPECT_FALSE(sim.isRunning());
    EXPECT_EQ(sim.getGeneration(), 0);
    EXPECT_EQ(sim.getArena().creatureCount(), 6u);
    EXPECT_EQ(sim.getArena().livingCount(), 6u);
    EXPECT_EQ(sim.getArena().getPowerUps().size(), 2u);
    EXPECT_EQ(sink.births.size(), 6u);
    EXPECT_FALSE(sink.births[0].parentA.has_value());
}

TEST_F(SimulationTest, PopulationSizeIsClamped)
{
    Simulation small(makeConfig(2));
    EXPECT_EQ(small.getArena().creatureCount(), 5u);

    Simulation large(makeConfig(500));
    EXPECT_EQ(large.getArena().creatureCount(), 50u);

    large.setPopulationSize(1);
    EXPECT_EQ(large.getConfig().evolution.populationSize, 5);
    EXPECT_EQ(large.getEvolution().getConfig().populationSize, 5);
}

TEST_F(SimulationTest, SpeedMultiplierIsClamped)
{
    Simulation sim(makeConfig());

    sim.setSpeedMultiplier(5000.0);
    EXPECT_EQ(sim.getSpeedMultiplier(), 1000.0);

    sim.setSpeedMultiplier(0.0);
    EXPECT_EQ(sim.getSpeedMultiplier(), 0.5);

    sim.setSpeedMultiplier(3.0);
    EXPECT_EQ(sim.getSpeedMultiplier(), 3.0);
}

TEST_F(SimulationTest, TickDoesNothingWhilePaused)
{
    Simulation sim(makeConfig());

    sim.tick(1.0 / 60.0);

    EXPECT_EQ(sim.getTotalTime(), 0.0);
}

TEST_F(SimulationTest, TickAdvancesSimulatedTime)
{
    Simulation sim(makeConfig());
    sim.start();

    sim.tick(1.0 / 60.0);
    EXPECT_NEAR(sim.getTotalTime(), 1.0 / 60.0, 1e-12);

    // Frames longer than maxFrameTime are cut to it.
    sim.tick(5.0);
    EXPECT_NEAR(sim.getTotalTime(), 1.0 / 60.0 + 0.1, 1e-12);
}

TEST_F(SimulationTest, SpeedScalesSimulatedTime)
{
    Simulation sim(makeConfig());
    sim.setSpeedMultiplier(4.0);
    sim.start();

    sim.tick(0.05);

    EXPECT_NEAR(sim.getTotalTime(), 0.2, 1e-12);
    for (const Creature* creature : sim.getArena().getCreatureViews()) {
        if (creature->isAlive()) {
            EXPECT_NEAR(creature->getAge(), 0.2, 1e-12);
        }
    }
}

TEST_F(SimulationTest, NearbyEligibleCreaturesReproduce)
{
    Simulation sim(makeConfig(), &sink);
    Creature& a = sim.spawnCreature(makeTwoSegmentGenome(), { 800.0, 500.0 });
    Creature& b = sim.spawnCreature(makeTwoSegmentGenome(), { 850.0, 500.0 });
    makeMatingReady(a);
    makeMatingReady(b);
    const size_t before = sim.getArena().creatureCount();
    sink.births.clear();

    sim.checkReproduction();

    EXPECT_EQ(sim.getArena().creatureCount(), before + 1);
    ASSERT_EQ(sink.births.size(), 1u);
    EXPECT_EQ(sink.births[0].parentA, a.getId());
    EXPECT_EQ(sink.births[0].parentB, b.getId());
    EXPECT_EQ(a.getLastReproductionTime(), sim.getTotalTime());
    EXPECT_EQ(b.getLastReproductionTime(), sim.getTotalTime());

    const Creature* child = sim.getArena().getCreature(sink.births[0].child);
    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->getGenome()->generation, sim.getGeneration());
    const Vector2d spawn = child->getSpawnPosition();
    EXPECT_NEAR(spawn.x, 825.0, 20.0);
    EXPECT_NEAR(spawn.y, 515.0, 20.0);
}

TEST_F(SimulationTest, CooldownBlocksImmediateRepeat)
{
    Simulation sim(makeConfig(), &sink);
    Creature& a = sim.spawnCreature(makeTwoSegmentGenome(), { 800.0, 500.0 });
    Creature& b = sim.spawnCreature(makeTwoSegmentGenome(), { 850.0, 500.0 });
    makeMatingReady(a);
    makeMatingReady(b);

    sim.checkReproduction();
    const size_t afterFirst = sim.getArena().creatureCount();
    sim.checkReproduction();

    EXPECT_EQ(sim.getArena().creatureCount(), afterFirst);
}

TEST_F(SimulationTest, DistantCreaturesDoNotReproduce)
{
    Simulation sim(makeConfig());
    Creature& a = sim.spawnCreature(makeTwoSegmentGenome(), { 200.0, 500.0 });
    Creature& b = sim.spawnCreature(makeTwoSegmentGenome(), { 1200.0, 500.0 });
    makeMatingReady(a);
    makeMatingReady(b);
    const size_t before = sim.getArena().creatureCount();

    sim.checkReproduction();

    EXPECT_EQ(sim.getArena().creatureCount(), before);
}

TEST_F(SimulationTest, YoungOrHungryCreaturesDoNotReproduce)
{
    Simulation sim(makeConfig());
    Creature& a = sim.spawnCreature(makeTwoSegmentGenome(), { 800.0, 500.0 });
    Creature& b = sim.spawnCreature(makeTwoSegmentGenome(), { 850.0, 500.0 });
    makeMatingReady(a);
    makeMatingReady(b);
    const size_t before = sim.getArena().creatureCount();

    a.setAge(10.0);
    sim.checkReproduction();
    EXPECT_EQ(sim.getArena().creatureCount(), before);

    a.setAge(40.0);
    b.setFood(20.0);
    sim.checkReproduction();
    EXPECT_EQ(sim.getArena().creatureCount(), before);
}

TEST_F(SimulationTest, ReproductionRespectsPopulationCap)
{
    SimulationConfig config = makeConfig();
    config.reproduction.maxPopulation = 8;
    Simulation sim(config);
    Creature& a = sim.spawnCreature(makeTwoSegmentGenome(), { 800.0, 500.0 });
    Creature& b = sim.spawnCreature(makeTwoSegmentGenome(), { 850.0, 500.0 });
    makeMatingReady(a);
    makeMatingReady(b);
    ASSERT_EQ(sim.getArena().livingCount(), 8u);

    sim.checkReproduction();

    EXPECT_EQ(sim.getArena().creatureCount(), 8u);
}

TEST_F(SimulationTest, EndGenerationKeepsElitesAlive)
{
    Simulation sim(makeConfig(), &sink);
    killAllExcept(sim, 2);
    std::vector<CreatureId> survivors;
    for (const Creature* creature : sim.getArena().getLivingCreatures()) {
        survivors.push_back(creature->getId());
    }
    ASSERT_EQ(survivors.size(), 2u);
    sim.getArena().getCreature(survivors[0])->setAge(123.0);

    sim.endGeneration();

    EXPECT_EQ(sim.getGeneration(), 1);
    EXPECT_EQ(sim.getArena().creatureCount(), 6u);
    EXPECT_EQ(sim.getArena().livingCount(), 6u);
    ASSERT_EQ(sink.finishedGenerations.size(), 1u);
    EXPECT_EQ(sink.finishedGenerations[0], 0);

    const auto& population = sim.getEvolution().getPopulation();
    for (const CreatureId id : survivors) {
        const Creature* creature = sim.getArena().getCreature(id);
        ASSERT_NE(creature, nullptr);
        EXPECT_TRUE(creature->isAlive());
        EXPECT_NE(
            std::find(population.begin(), population.end(), creature->getGenome()),
            population.end());
    }
    EXPECT_EQ(sim.getArena().getCreature(survivors[0])->getAge(), 123.0);

    // Every genome in the new population is embodied exactly once.
    std::set<const Genome*> embodied;
    for (const Creature* creature : sim.getArena().getCreatureViews()) {
        EXPECT_TRUE(embodied.insert(creature->getGenome().get()).second);
    }
    EXPECT_EQ(embodied.size(), population.size());
}

TEST_F(SimulationTest, TickTriggersGenerationEnd)
{
    Simulation sim(makeConfig());
    killAllExcept(sim, 1);
    sim.start();

    sim.tick(1.0 / 60.0);

    EXPECT_EQ(sim.getGeneration(), 1);
    EXPECT_GT(sim.getArena().livingCount(), 2u);
}

TEST_F(SimulationTest, ExportBestGenomeCarriesFitness)
{
    Simulation sim(makeConfig());

    const auto best = sim.exportBestGenome();

    ASSERT_TRUE(best.has_value());
    double highest = 0.0;
    for (const Creature* creature : sim.getArena().getCreatureViews()) {
        highest = std::max(highest, creature->calculateFitness());
    }
    EXPECT_DOUBLE_EQ(best->fitness, highest);
}

TEST_F(SimulationTest, InvalidImportLeavesSimulationUntouched)
{
    Simulation sim(makeConfig());
    const size_t before = sim.getArena().creatureCount();

    nlohmann::json doc = { { "segments", nlohmann::json::array() } };
    const auto result = sim.importGenome(doc);

    ASSERT_TRUE(result.isError());
    EXPECT_FALSE(sim.isRunning());
    EXPECT_EQ(sim.getGeneration(), 0);
    EXPECT_EQ(sim.getArena().creatureCount(), before);
}

TEST_F(SimulationTest, OversizedImportKeepsRunningPopulation)
{
    Simulation sim(makeConfig());
    sim.start();
    sim.tick(0.05);
    const auto populationBefore = sim.getEvolution().getPopulation();
    const size_t creaturesBefore = sim.getArena().creatureCount();

    std::mt19937 rng{ 7 };
    nlohmann::json doc = GenomeSerializer::toJson(Genome::random(rng));
    doc["memorySize"] = 2000000000;
    const auto result = sim.importGenome(doc);

    ASSERT_TRUE(result.isError());
    EXPECT_TRUE(sim.isRunning());
    EXPECT_EQ(sim.getGeneration(), 0);
    EXPECT_EQ(sim.getArena().creatureCount(), creaturesBefore);
    EXPECT_EQ(sim.getEvolution().getPopulation(), populationBefore);
}

TEST_F(SimulationTest, InvalidGenomeImportIsRejected)
{
    Simulation sim(makeConfig());
    const auto populationBefore = sim.getEvolution().getPopulation();

    std::mt19937 rng{ 7 };
    Genome genome = Genome::random(rng);
    genome.sensors.resize(Genome::MaxSensors + 1, genome.sensors.front());
    const auto result = sim.importGenome(genome);

    ASSERT_TRUE(result.isError());
    EXPECT_FALSE(sim.isRunning());
    EXPECT_EQ(sim.getEvolution().getPopulation(), populationBefore);
}

TEST_F(SimulationTest, ImportSeedsPopulationAndResumes)
{
    Simulation sim(makeConfig());
    std::mt19937 rng{ 7 };
    Genome genome = Genome::random(rng);
    genome.generation = 12;

    const auto result = sim.importGenome(GenomeSerializer::toJson(genome));

    ASSERT_TRUE(result.isValue()) << result.errorValue();
    EXPECT_TRUE(sim.isRunning());
    EXPECT_EQ(sim.getGeneration(), 12);
    EXPECT_EQ(sim.getArena().creatureCount(), 6u);
    EXPECT_EQ(*sim.getEvolution().getPopulation().front(), genome);
}

TEST_F(SimulationTest, ResetStartsOverButKeepsClock)
{
    Simulation sim(makeConfig());
    sim.start();
    sim.tick(0.05);
    killAllExcept(sim, 0);
    sim.endGeneration();
    ASSERT_EQ(sim.getGeneration(), 1);

    sim.reset();

    EXPECT_FALSE(sim.isRunning());
    EXPECT_EQ(sim.getGeneration(), 0);
    EXPECT_EQ(sim.getArena().creatureCount(), 6u);
    EXPECT_NEAR(sim.getTotalTime(), 0.05, 1e-12);
}

TEST_F(SimulationTest, StatsReportOldestLivingCreature)
{
    Simulation sim(makeConfig());
    Creature* oldest = sim.getArena().getLivingCreatures().back();
    oldest->setAge(500.0);

    const SimulationStats stats = sim.getStats();

    EXPECT_EQ(stats.aliveCount, 6);
    EXPECT_EQ(stats.creatureCount, 6);
    ASSERT_TRUE(stats.oldestCreatureId.has_value());
    EXPECT_EQ(*stats.oldestCreatureId, oldest->getId());
    EXPECT_EQ(stats.oldestCreatureAge, 500.0);
}
