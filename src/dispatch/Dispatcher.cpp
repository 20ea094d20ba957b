#include "Dispatcher.hpp"

// Standard
#include <algorithm>
#include <chrono>
#include <system_error>
#include <utility>

// Boost
#include <boost/property_tree/ptree.hpp>

// Internal
#include "CompletionMarker.hpp"
#include "Constants.hpp"
#include "DependencyResolver.hpp"
#include "Logger.hpp"
#include "Utility.hpp"

namespace autorun::dispatch {

namespace pt = boost::property_tree;

Dispatcher::Dispatcher(config::AnalysisConfig config, ProcessExecutor &executor,
                       const pipelines::PipelineRegistry &registry)
    : config(std::move(config)), executor(executor), registry(registry) {}

auto Dispatcher::dispatch(const pipelines::PipelineDefinition &pipeline,
                          const discovery::Run &run) const -> AnalysisInvocation {
    AnalysisInvocation invocation{.runID = run.runID,
                                  .pipelineName = pipeline.name,
                                  .pipelineVersion = pipeline.version,
                                  .startTime = std::chrono::system_clock::now()};

    pt::ptree fields;
    fields.put("sequencing_run_id", run.runID);
    fields.put("pipeline_name", pipeline.name);
    fields.put("pipeline_version", pipeline.version);

    try {
        const auto paths = pipelines::PathPlanner::plan(
            run.runID, pipeline.getShortName(), pipeline.getMinorVersion(),
            config.analysisOutputDir, config.analysisWorkDir, invocation.startTime);
        invocation.workDir = paths.workDir;
        invocation.outputDir = paths.outputDir;

        std::error_code errorCode;
        const bool analysisNotAlreadyStarted = !fs::exists(paths.outputDir, errorCode);
        if (errorCode) {
            // An unknown state must not count as not started
            invocation.outcome = InvocationOutcome::FAILED;
            fields.put("analysis_output_dir_path", paths.outputDir.string());
            fields.put("error", errorCode.message());
            Logger::logEvent(LogLevel::ERROR, "check_analysis_output_dir_failed", fields);
            return invocation;
        }

        const auto dependencyStatuses = pipelines::DependencyResolver::checkDependencies(
            pipeline, run, config.analysisOutputDir);
        const bool dependenciesMet =
            std::all_of(dependencyStatuses.begin(), dependencyStatuses.end(),
                        [](const pipelines::DependencyStatus &status) { return status.complete; });

        if (!analysisNotAlreadyStarted || !dependenciesMet) {
            invocation.outcome = analysisNotAlreadyStarted
                                     ? InvocationOutcome::SKIPPED_DEPENDENCIES_INCOMPLETE
                                     : InvocationOutcome::SKIPPED_ALREADY_STARTED;

            pt::ptree conditions;
            conditions.put("pipeline_dependencies_met", dependenciesMet);
            conditions.put("analysis_not_already_started", analysisNotAlreadyStarted);
            fields.add_child("conditions_checked", conditions);
            Logger::logEvent(LogLevel::WARNING, "analysis_skipped", fields);
            return invocation;
        }

        const auto preparedPipeline = prepare(pipeline, run, paths);
        invocation.command = buildCommand(config, preparedPipeline, run, paths);

        fs::create_directories(paths.workDir, errorCode);
        if (errorCode) {
            invocation.outcome = InvocationOutcome::WORK_DIR_FAILED;
            fields.put("analysis_work_dir_path", paths.workDir.string());
            fields.put("error", errorCode.message());
            Logger::logEvent(LogLevel::ERROR, "create_analysis_work_dir_failed", fields);
            return invocation;
        }

        execute(invocation, paths);
    } catch (const config::ConfigurationError &e) {
        invocation.outcome = InvocationOutcome::CONFIGURATION_ERROR;
        fields.put("error", e.what());
        Logger::logEvent(LogLevel::ERROR, "prepare_analysis_failed", fields);
    } catch (const std::exception &e) {
        invocation.outcome = InvocationOutcome::FAILED;
        invocation.completionTime.reset();
        fields.put("error", e.what());
        Logger::logEvent(LogLevel::ERROR, "analysis_failed", fields);
    }

    return invocation;
}

auto Dispatcher::buildCommand(const config::AnalysisConfig &config,
                              const pipelines::PipelineDefinition &pipeline,
                              const discovery::Run &run, const pipelines::AnalysisPaths &paths)
    -> std::vector<std::string> {
    std::vector<std::string> command{config.pipelineExecutable,
                                     "-log",
                                     paths.logPath.string(),
                                     "run",
                                     pipeline.name,
                                     "-r",
                                     pipeline.version,
                                     "-profile",
                                     config.pipelineProfile,
                                     "--cache",
                                     config.pipelineCacheDir.string(),
                                     "-work-dir",
                                     paths.workDir.string(),
                                     "-with-report",
                                     paths.reportPath.string(),
                                     "-with-trace",
                                     paths.tracePath.string(),
                                     "-with-timeline",
                                     paths.timelinePath.string()};

    for (const auto &[flag, value] : pipeline.parameters) {
        command.push_back("--" + flag);
        command.push_back(resolveParameter(flag, value, pipeline, run));
    }

    return command;
}

auto Dispatcher::prepare(const pipelines::PipelineDefinition &pipeline, const discovery::Run &run,
                         const pipelines::AnalysisPaths &paths) const
    -> pipelines::PipelineDefinition {
    pipelines::PipelineDefinition preparedPipeline = pipeline;
    preparedPipeline.setParameter(constants::pipelines::OUTDIR_PARAMETER,
                                  paths.outputDir.string());

    const auto *hooks = registry.find(pipeline.name);
    if (hooks == nullptr) {
        pt::ptree fields;
        fields.put("sequencing_run_id", run.runID);
        fields.put("pipeline_name", pipeline.name);
        Logger::logEvent(LogLevel::INFO, "pre_analysis_not_registered", fields);
        return preparedPipeline;
    }

    hooks->prepare(preparedPipeline, run, paths);
    return preparedPipeline;
}

void Dispatcher::execute(AnalysisInvocation &invocation,
                         const pipelines::AnalysisPaths &paths) const {
    pt::ptree fields;
    fields.put("sequencing_run_id", invocation.runID);
    fields.put("pipeline_name", invocation.pipelineName);
    fields.put("pipeline_version", invocation.pipelineVersion);
    fields.add_child("pipeline_command", helper::toPtreeArray(invocation.command));
    Logger::logEvent(LogLevel::INFO, "analysis_started", fields);

    std::optional<std::chrono::milliseconds> timeout;
    if (config.pipelineTimeoutSeconds.has_value()) {
        timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration<double>(config.pipelineTimeoutSeconds.value()));
    }

    const ProcessResult result =
        executor.execute(invocation.command, paths.workDir,
                         paths.workDir / constants::dispatch::PROCESS_OUTPUT_LOG, timeout);
    invocation.exitCode = result.exitCode;
    invocation.diagnosticOutput = result.output;

    if (!result.succeeded()) {
        invocation.outcome = InvocationOutcome::FAILED;
        fields.put("exit_code", result.exitCode);
        fields.put("timed_out", result.timedOut);
        fields.put("analysis_work_dir_path", paths.workDir.string());
        fields.put("output", result.output);
        Logger::logEvent(LogLevel::ERROR, "analysis_failed", fields);
        return;
    }

    const auto completionTime = std::chrono::system_clock::now();
    fs::create_directories(paths.outputDir);
    CompletionMarker::write(paths.completionMarkerPath, invocation.startTime, completionTime);

    invocation.completionTime = completionTime;
    invocation.outcome = InvocationOutcome::COMPLETED;
    fields.put("analysis_complete_path", paths.completionMarkerPath.string());
    Logger::logEvent(LogLevel::INFO, "analysis_complete", fields);
}

auto Dispatcher::resolveParameter(const std::string &flag,
                                  const std::optional<std::string> &value,
                                  const pipelines::PipelineDefinition &pipeline,
                                  const discovery::Run &run) -> std::string {
    if (value.has_value()) {
        return value.value();
    }

    const auto runParameter = run.analysisParameters.find(flag);
    if (runParameter == run.analysisParameters.end() || !runParameter->second.has_value()) {
        throw config::ConfigurationError("Parameter '" + flag + "' of pipeline " + pipeline.name +
                                         " has no value and run " + run.runID +
                                         " does not provide one");
    }
    return runParameter->second.value();
}

}  // namespace autorun::dispatch
