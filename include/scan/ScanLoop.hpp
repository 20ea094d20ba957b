#pragma once

// Standard
#include <cstddef>
#include <filesystem>
#include <string>

// Internal
#include "AnalysisConfig.hpp"
#include "Dispatcher.hpp"
#include "DrainToken.hpp"
#include "PipelineRegistry.hpp"
#include "PostProcessor.hpp"
#include "ProcessExecutor.hpp"

namespace autorun::scan {

namespace fs = std::filesystem;

enum class ScanState { IDLE, SCANNING, DISPATCHING, SLEEPING };

auto scanStateName(ScanState state) -> std::string;

struct CycleSummary {
    size_t runsDiscovered = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t skipped = 0;
    bool drained = false;
    double durationSeconds = 0.0;
};

class ScanLoop {
   public:
    ScanLoop(fs::path configPath, dispatch::ProcessExecutor &executor,
             const pipelines::PipelineRegistry &registry, DrainToken &drainToken);

    /**
     * Runs one full pass: discovers the ready runs and processes every configured pipeline for
     * each of them in declaration order. Stops early, between two units of work, once a drain is
     * requested.
     *
     * @throws discovery::ScanError if the run directory cannot be enumerated.
     */
    auto runCycle(const config::AnalysisConfig &config) -> CycleSummary;

    /**
     * Reloads the configuration, runs a cycle and sleeps, until a drain is requested. The given
     * configuration is used whenever the configuration file cannot be loaded.
     *
     * @param initialConfig Configuration loaded at startup.
     * @param singleCycle Return after the first cycle.
     */
    void run(config::AnalysisConfig initialConfig, bool singleCycle = false);

    [[nodiscard]] auto getState() const -> ScanState { return state; }

   private:
    fs::path configPath;
    dispatch::ProcessExecutor &executor;
    const pipelines::PipelineRegistry &registry;
    DrainToken &drainToken;
    ScanState state = ScanState::IDLE;

    void processUnit(const config::AnalysisConfig &config,
                     const pipelines::PipelineDefinition &pipeline, const discovery::Run &run,
                     const dispatch::Dispatcher &dispatcher,
                     const postprocess::PostProcessor &postProcessor, CycleSummary &summary) const;

    void sleepFor(double seconds);
    void changeState(ScanState newState);
};

}  // namespace autorun::scan
