#include "ScanLoop.hpp"

// Standard
#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

// Boost
#include <boost/property_tree/ptree.hpp>

// Internal
#include "ConfigLoader.hpp"
#include "Constants.hpp"
#include "DependencyResolver.hpp"
#include "Logger.hpp"
#include "RunDiscovery.hpp"
#include "Utility.hpp"

namespace autorun::scan {

namespace pt = boost::property_tree;

auto scanStateName(ScanState state) -> std::string {
    switch (state) {
        case ScanState::IDLE:
            return "idle";
        case ScanState::SCANNING:
            return "scanning";
        case ScanState::DISPATCHING:
            return "dispatching";
        case ScanState::SLEEPING:
            return "sleeping";
    }
    return "idle";
}

ScanLoop::ScanLoop(fs::path configPath, dispatch::ProcessExecutor &executor,
                   const pipelines::PipelineRegistry &registry, DrainToken &drainToken)
    : configPath(std::move(configPath)),
      executor(executor),
      registry(registry),
      drainToken(drainToken) {}

auto ScanLoop::runCycle(const config::AnalysisConfig &config) -> CycleSummary {
    const helper::Timer timer;
    CycleSummary summary;

    changeState(ScanState::SCANNING);

    std::vector<discovery::Run> runs;
    try {
        runs = discovery::RunDiscovery::discoverRuns(
            config.fastqByRunDir, {.requireReadyMarker = config.requireReadyMarker,
                                   .reverseOrder = config.analyzeRunsInReverseOrder});
    } catch (const discovery::ScanError &) {
        changeState(ScanState::IDLE);
        throw;
    }
    summary.runsDiscovered = runs.size();

    changeState(ScanState::DISPATCHING);

    const dispatch::Dispatcher dispatcher(config, executor, registry);
    const postprocess::PostProcessor postProcessor(config, registry);

    for (const auto &run : runs) {
        for (const auto &pipeline : config.pipelines) {
            if (drainToken.isRequested()) {
                summary.drained = true;
                break;
            }
            processUnit(config, pipeline, run, dispatcher, postProcessor, summary);
        }
        if (summary.drained) {
            Logger::logEvent(LogLevel::INFO, "scan_drained");
            break;
        }
    }

    summary.durationSeconds = timer.elapsedSeconds();

    pt::ptree fields;
    fields.put("scan_duration_seconds", summary.durationSeconds);
    fields.put("runs_discovered", summary.runsDiscovered);
    fields.put("analyses_completed", summary.completed);
    fields.put("analyses_failed", summary.failed);
    fields.put("analyses_skipped", summary.skipped);
    Logger::logEvent(LogLevel::INFO, "scan_complete", fields);

    changeState(ScanState::IDLE);
    return summary;
}

void ScanLoop::run(config::AnalysisConfig initialConfig, bool singleCycle) {
    config::AnalysisConfig config = std::move(initialConfig);

    while (!drainToken.isRequested()) {
        config = config::ConfigLoader::reload(configPath, config);

        runCycle(config);

        if (singleCycle || drainToken.isRequested()) {
            break;
        }

        sleepFor(config.scanIntervalSeconds);
    }

    Logger::logEvent(LogLevel::INFO, "scan_loop_stopped");
}

void ScanLoop::processUnit(const config::AnalysisConfig &config,
                           const pipelines::PipelineDefinition &pipeline,
                           const discovery::Run &run, const dispatch::Dispatcher &dispatcher,
                           const postprocess::PostProcessor &postProcessor,
                           CycleSummary &summary) const {
    if (!pipelines::DependencyResolver::dependenciesComplete(pipeline, run,
                                                             config.analysisOutputDir)) {
        pt::ptree conditions;
        conditions.put("pipeline_dependencies_met", false);

        pt::ptree fields;
        fields.put("sequencing_run_id", run.runID);
        fields.put("pipeline_name", pipeline.name);
        fields.put("pipeline_version", pipeline.version);
        fields.add_child("conditions_checked", conditions);
        Logger::logEvent(LogLevel::WARNING, "analysis_skipped", fields);

        ++summary.skipped;
        return;
    }

    const auto invocation = dispatcher.dispatch(pipeline, run);

    if (invocation.completed()) {
        ++summary.completed;
        postProcessor.postProcess(pipeline, run);
    } else if (invocation.skipped()) {
        ++summary.skipped;
    } else {
        ++summary.failed;
    }
}

void ScanLoop::sleepFor(double seconds) {
    changeState(ScanState::SLEEPING);

    using Seconds = std::chrono::duration<double>;
    const auto wakeTime = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                              Seconds(seconds));

    // Sleep in slices so a drain request does not wait for the full interval
    while (!drainToken.isRequested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= wakeTime) {
            break;
        }
        const auto slice = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            Seconds(constants::scan::sleepSliceSeconds));
        std::this_thread::sleep_for(std::min(slice, wakeTime - now));
    }

    changeState(ScanState::IDLE);
}

void ScanLoop::changeState(ScanState newState) {
    Logger::log(LogLevel::DEBUG, "Scan loop state: ", scanStateName(state), " -> ",
                scanStateName(newState));
    state = newState;
}

}  // namespace autorun::scan
