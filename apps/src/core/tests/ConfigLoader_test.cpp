#include "core/ConfigLoader.h"
#include "core/SimulationConfig.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace Biomorph;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        testDir_ = std::filesystem::temp_directory_path() / "biomorph_config_loader_test";
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override
    {
        std::filesystem::remove_all(testDir_);
        ConfigLoader::clearConfigDir();
    }

    void writeConfigFile(const std::string& filename, const std::string& content)
    {
        std::ofstream file(testDir_ / filename);
        file << content;
    }

    std::filesystem::path testDir_;
};

TEST_F(ConfigLoaderTest, LoadReturnsErrorWhenFileNotFound)
{
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<SimulationConfig>("nonexistent.json");

    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("not found"), std::string::npos);
}

TEST_F(ConfigLoaderTest, MissingKeysKeepDefaults)
{
    writeConfigFile("biomorph.json", R"({"speedMultiplier": 4.0, "evolution": {"eliteCount": 3}})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<SimulationConfig>("biomorph.json");

    ASSERT_TRUE(result.isValue()) << result.errorValue();
    const SimulationConfig& config = result.value();
    EXPECT_EQ(config.speedMultiplier, 4.0);
    EXPECT_EQ(config.evolution.eliteCount, 3);
    EXPECT_EQ(config.evolution.populationSize, 20);
    EXPECT_EQ(config.arena.width, 1600.0);
    EXPECT_EQ(config.reproduction.cooldown, 60.0);
    EXPECT_FALSE(config.seed.has_value());
}

TEST_F(ConfigLoaderTest, OptionalSeedIsRead)
{
    writeConfigFile("biomorph.json", R"({"seed": 1234})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<SimulationConfig>("biomorph.json");

    ASSERT_TRUE(result.isValue()) << result.errorValue();
    ASSERT_TRUE(result.value().seed.has_value());
    EXPECT_EQ(*result.value().seed, 1234u);
}

TEST_F(ConfigLoaderTest, LocalFileTakesPrecedenceOverBase)
{
    writeConfigFile("biomorph.json", R"({"statsInterval": 5.0})");
    writeConfigFile("biomorph.json.local", R"({"statsInterval": 30.0})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<SimulationConfig>("biomorph.json");

    ASSERT_TRUE(result.isValue()) << result.errorValue();
    EXPECT_EQ(result.value().statsInterval, 30.0);
}

TEST_F(ConfigLoaderTest, ParseErrorIsReported)
{
    writeConfigFile("biomorph.json", "{ invalid json }");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<SimulationConfig>("biomorph.json");

    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Parse error"), std::string::npos);
}

TEST_F(ConfigLoaderTest, EmptyFileIsAnError)
{
    writeConfigFile("biomorph.json", "");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<SimulationConfig>("biomorph.json");

    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Empty"), std::string::npos);
}

TEST_F(ConfigLoaderTest, WrongTypeIsReportedWithOrigin)
{
    writeConfigFile("biomorph.json", R"({"speedMultiplier": "fast"})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<SimulationConfig>("biomorph.json");

    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("biomorph.json"), std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadFromPathBypassesSearch)
{
    writeConfigFile("custom.json", R"({"arena": {"width": 800.0, "height": 600.0}})");

    auto result = ConfigLoader::loadFromPath<SimulationConfig>(testDir_ / "custom.json");

    ASSERT_TRUE(result.isValue()) << result.errorValue();
    EXPECT_EQ(result.value().arena.width, 800.0);
    EXPECT_EQ(result.value().arena.height, 600.0);
}

TEST_F(ConfigLoaderTest, SearchPathsStartWithExplicitDir)
{
    ConfigLoader::setConfigDir(testDir_.string());

    const auto paths = ConfigLoader::getSearchPaths();

    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), testDir_);
    EXPECT_EQ(paths.back(), std::filesystem::path("/etc/biomorph"));
}

TEST_F(ConfigLoaderTest, ConfigRoundTripsThroughJson)
{
    SimulationConfig config;
    config.evolution.mutationRate = 0.25;
    config.seed = 9;

    const nlohmann::json j = config;
    const SimulationConfig parsed = j.get<SimulationConfig>();

    EXPECT_EQ(parsed.evolution.mutationRate, 0.25);
    EXPECT_EQ(parsed.seed, std::optional<uint32_t>(9));
    EXPECT_EQ(j["arena"]["wallThickness"], 200.0);
}
