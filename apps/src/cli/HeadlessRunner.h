#pragma once

#include "core/SimulationConfig.h"

#include <atomic>
#include <optional>
#include <string>

namespace Biomorph {
namespace Client {

struct RunOptions {
    std::optional<double> simulatedSeconds;
    std::optional<long> frames;
    double frameTime = 1.0 / 60.0; // Real seconds fed to each tick.
    std::optional<std::string> importPath;
    std::optional<std::string> exportPath;
};

/**
 * Results from a completed headless run.
 */
struct RunResults {
    long frames = 0;
    double simulatedSeconds = 0.0;
    int finalGeneration = 0;
    int aliveCount = 0;
    double bestFitness = 0.0;
    double avgFitness = 0.0;
    int births = 0;
    int deaths = 0;
    bool completed = false;
    std::string errorMessage;
};

/**
 * Runs a Simulation without a display, ticking at a fixed frame time until a
 * frame or simulated-time limit is reached or a stop is requested.
 */
class HeadlessRunner {
public:
    RunResults run(const SimulationConfig& config, const RunOptions& options);

    // Safe to call from a signal handler.
    void requestStop() { stopRequested_ = true; }

private:
    std::atomic<bool> stopRequested_{ false };
};

} // namespace Client
} // namespace Biomorph
