#include "cli/HeadlessRunner.h"
#include "core/organisms/genetics/GenomeSerializer.h"

#include <filesystem>
#include <gtest/gtest.h>

using namespace Biomorph;
using namespace Biomorph::Client;

class HeadlessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        config.seed = 3;
        config.evolution.populationSize = 5;
        exportPath = std::filesystem::temp_directory_path() / "biomorph_runner_best.json";
        std::filesystem::remove(exportPath);
    }

    void TearDown() override { std::filesystem::remove(exportPath); }

    SimulationConfig config;
    std::filesystem::path exportPath;
};

TEST_F(HeadlessRunnerTest, StopsAfterFrameLimit)
{
    HeadlessRunner runner;
    RunOptions options;
    options.frames = 30;

    const RunResults results = runner.run(config, options);

    EXPECT_TRUE(results.completed);
    EXPECT_EQ(results.frames, 30);
    EXPECT_NEAR(results.simulatedSeconds, 0.5, 1e-9);
    EXPECT_GE(results.births, 5);
}

TEST_F(HeadlessRunnerTest, StopsAfterSimulatedTime)
{
    HeadlessRunner runner;
    RunOptions options;
    options.simulatedSeconds = 1.0;
    config.speedMultiplier = 10.0;

    const RunResults results = runner.run(config, options);

    EXPECT_TRUE(results.completed);
    EXPECT_GE(results.simulatedSeconds, 1.0);
    EXPECT_LT(results.frames, 60);
}

TEST_F(HeadlessRunnerTest, StopRequestEndsRunImmediately)
{
    HeadlessRunner runner;
    runner.requestStop();

    const RunResults results = runner.run(config, RunOptions{});

    EXPECT_TRUE(results.completed);
    EXPECT_EQ(results.frames, 0);
}

TEST_F(HeadlessRunnerTest, ExportWritesLoadableGenome)
{
    HeadlessRunner runner;
    RunOptions options;
    options.frames = 10;
    options.exportPath = exportPath.string();

    const RunResults results = runner.run(config, options);

    ASSERT_TRUE(results.completed) << results.errorMessage;
    const auto genome = GenomeSerializer::loadFile(exportPath);
    ASSERT_TRUE(genome.isValue()) << genome.errorValue();
    EXPECT_FALSE(genome.value().segments.empty());
}

TEST_F(HeadlessRunnerTest, ImportedGenomeSetsGeneration)
{
    std::mt19937 rng{ 11 };
    Genome genome = Genome::random(rng);
    genome.generation = 4;
    ASSERT_TRUE(GenomeSerializer::saveFile(genome, exportPath).isValue());

    HeadlessRunner runner;
    RunOptions options;
    options.frames = 5;
    options.importPath = exportPath.string();

    const RunResults results = runner.run(config, options);

    ASSERT_TRUE(results.completed) << results.errorMessage;
    EXPECT_GE(results.finalGeneration, 4);
}

TEST_F(HeadlessRunnerTest, MissingImportFileFails)
{
    HeadlessRunner runner;
    RunOptions options;
    options.frames = 5;
    options.importPath = "/nonexistent/biomorph/genome.json";

    const RunResults results = runner.run(config, options);

    EXPECT_FALSE(results.completed);
    EXPECT_EQ(results.frames, 0);
    EXPECT_FALSE(results.errorMessage.empty());
}
