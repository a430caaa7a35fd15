#include "HeadlessRunner.h"
#include "LoggingEventSink.h"

#include "core/LoggingChannels.h"
#include "core/Simulation.h"
#include "core/organisms/genetics/GenomeSerializer.h"

namespace Biomorph {
namespace Client {

RunResults HeadlessRunner::run(const SimulationConfig& config, const RunOptions& options)
{
    RunResults results;
    LoggingEventSink sink;
    Simulation simulation(config, &sink);

    if (options.importPath) {
        auto genome = GenomeSerializer::loadFile(*options.importPath);
        if (genome.isError()) {
            results.errorMessage = genome.errorValue();
            return results;
        }
        auto imported = simulation.importGenome(genome.value());
        if (imported.isError()) {
            results.errorMessage = imported.errorValue();
            return results;
        }
    }

    simulation.start();

    const bool unbounded = !options.simulatedSeconds && !options.frames;
    if (unbounded) {
        SLOG_INFO("No frame or time limit given, running until interrupted");
    }

    while (!stopRequested_) {
        if (options.frames && results.frames >= *options.frames) {
            break;
        }
        if (options.simulatedSeconds && simulation.getTotalTime() >= *options.simulatedSeconds) {
            break;
        }
        simulation.tick(options.frameTime);
        results.frames++;
    }

    const SimulationStats stats = simulation.getStats();
    results.simulatedSeconds = stats.totalTime;
    results.finalGeneration = stats.generation;
    results.aliveCount = stats.aliveCount;
    results.bestFitness = stats.bestFitness;
    results.avgFitness = stats.avgFitness;
    results.births = sink.births();
    results.deaths = sink.deaths();

    if (options.exportPath) {
        const auto best = simulation.exportBestGenome();
        if (!best) {
            results.errorMessage = "no creature to export";
            return results;
        }
        auto saved = GenomeSerializer::saveFile(*best, *options.exportPath);
        if (saved.isError()) {
            results.errorMessage = saved.errorValue();
            return results;
        }
    }

    results.completed = true;
    return results;
}

} // namespace Client
} // namespace Biomorph
