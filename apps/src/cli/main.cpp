#include "HeadlessRunner.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/SimulationConfig.h"

#include <args.hxx>
#include <csignal>
#include <iostream>
#include <string>

using namespace Biomorph;

static Client::HeadlessRunner* g_runner = nullptr;

void signalHandler(int /*signum*/)
{
    if (g_runner) {
        g_runner->requestStop();
    }
}

namespace {

std::string getExamplesHelp()
{
    return "Examples:\n"
           "  biomorph --seconds 3600 --speed 50\n"
           "  biomorph --frames 6000 --seed 7 --export best.json\n"
           "  biomorph --import best.json --seconds 600 -C combat:debug\n";
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "Biomorph", "Headless artificial-life simulator.\n\n" + getExamplesHelp());
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<std::string> configFile(
        parser,
        "config",
        "Simulation config file (default: biomorph.json on the config search path)",
        { "config" });
    args::ValueFlag<std::string> configDir(
        parser, "config-dir", "Directory searched first for config files", { "config-dir" });
    args::ValueFlag<double> seconds(
        parser, "seconds", "Stop after this many simulated seconds", { "seconds" });
    args::ValueFlag<long> frames(parser, "frames", "Stop after this many frames", { "frames" });
    args::ValueFlag<double> speed(
        parser, "speed", "Speed multiplier, 0.5 to 1000 (default: from config)", { "speed" });
    args::ValueFlag<int> population(
        parser, "population", "Population size, 5 to 50 (default: from config)", { "population" });
    args::ValueFlag<uint32_t> seed(parser, "seed", "Random seed", { "seed" });
    args::ValueFlag<std::string> importPath(
        parser, "import", "Seed the population from a genome file", { "import" });
    args::ValueFlag<std::string> exportPath(
        parser, "export", "Write the best genome to this file on exit", { "export" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., combat:debug,*:off)",
        { 'C', "channels" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    LoggingChannels::initializeFromConfig(args::get(logConfig), "biomorph");
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        SLOG_INFO("Applied channel overrides: {}", args::get(logChannels));
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    SimulationConfig config;
    if (configFile) {
        auto loaded = ConfigLoader::loadFromPath<SimulationConfig>(args::get(configFile));
        if (loaded.isError()) {
            SLOG_ERROR("{}", loaded.errorValue());
            return 1;
        }
        config = loaded.value();
    }
    else {
        auto loaded = ConfigLoader::load<SimulationConfig>("biomorph.json");
        if (loaded.isValue()) {
            config = loaded.value();
        }
        else {
            SLOG_INFO("Using built-in defaults ({})", loaded.errorValue());
        }
    }

    if (speed) {
        config.speedMultiplier = args::get(speed);
    }
    if (population) {
        config.evolution.populationSize = args::get(population);
    }
    if (seed) {
        config.seed = args::get(seed);
    }

    Client::RunOptions options;
    if (seconds) {
        options.simulatedSeconds = args::get(seconds);
    }
    if (frames) {
        options.frames = args::get(frames);
    }
    if (importPath) {
        options.importPath = args::get(importPath);
    }
    if (exportPath) {
        options.exportPath = args::get(exportPath);
    }

    Client::HeadlessRunner runner;
    g_runner = &runner;
    auto oldHandler = std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const Client::RunResults results = runner.run(config, options);

    std::signal(SIGINT, oldHandler);
    g_runner = nullptr;

    if (!results.completed) {
        SLOG_ERROR("Run failed: {}", results.errorMessage);
        return 1;
    }

    std::cout << "Frames:          " << results.frames << "\n"
              << "Simulated time:  " << results.simulatedSeconds << " s\n"
              << "Generation:      " << results.finalGeneration << "\n"
              << "Alive:           " << results.aliveCount << "\n"
              << "Best fitness:    " << results.bestFitness << "\n"
              << "Average fitness: " << results.avgFitness << "\n"
              << "Births/deaths:   " << results.births << "/" << results.deaths << std::endl;
    return 0;
}
