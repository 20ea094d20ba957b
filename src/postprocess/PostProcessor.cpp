#include "PostProcessor.hpp"

// Standard
#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>
#include <vector>

// Boost
#include <boost/property_tree/ptree.hpp>

// Internal
#include "Constants.hpp"
#include "Logger.hpp"
#include "PathPlanner.hpp"
#include "Utility.hpp"

namespace autorun::postprocess {

namespace pt = boost::property_tree;

namespace {
auto isWorkDirTimestamp(const std::string &suffix) -> bool {
    return suffix.size() == constants::pipelines::workDirTimestampLength &&
           std::all_of(suffix.begin(), suffix.end(),
                       [](unsigned char character) { return std::isdigit(character) != 0; });
}
}  // namespace

PostProcessor::PostProcessor(config::AnalysisConfig config,
                             const pipelines::PipelineRegistry &registry)
    : config(std::move(config)), registry(registry) {}

void PostProcessor::postProcess(const pipelines::PipelineDefinition &pipeline,
                                const discovery::Run &run) const {
    try {
        cleanWorkDir(pipeline, run);
        finalize(pipeline, run);
    } catch (const std::exception &e) {
        pt::ptree fields;
        fields.put("sequencing_run_id", run.runID);
        fields.put("pipeline_name", pipeline.name);
        fields.put("error", e.what());
        Logger::logEvent(LogLevel::ERROR, "post_analysis_failed", fields);
    }
}

auto PostProcessor::findLatestWorkDir(const fs::path &workRoot, const std::string &runID,
                                      const std::string &shortName) -> std::optional<fs::path> {
    const std::string prefix = pipelines::PathPlanner::workDirPrefix(runID, shortName);

    std::error_code errorCode;
    fs::directory_iterator iterator(workRoot, errorCode);
    if (errorCode) {
        return std::nullopt;
    }

    std::vector<fs::path> workDirs;
    for (const auto &entry : iterator) {
        const std::string name = entry.path().filename().string();
        if (entry.is_directory(errorCode) && helper::hasPrefix(name, prefix) &&
            isWorkDirTimestamp(name.substr(prefix.size()))) {
            workDirs.push_back(entry.path());
        }
    }

    if (workDirs.empty()) {
        return std::nullopt;
    }

    return *std::max_element(workDirs.begin(), workDirs.end(),
                             [](const fs::path &lhs, const fs::path &rhs) {
                                 return lhs.filename().string() < rhs.filename().string();
                             });
}

void PostProcessor::cleanWorkDir(const pipelines::PipelineDefinition &pipeline,
                                 const discovery::Run &run) const {
    pt::ptree fields;
    fields.put("sequencing_run_id", run.runID);
    fields.put("pipeline_name", pipeline.name);

    const auto workDir =
        findLatestWorkDir(config.analysisWorkDir, run.runID, pipeline.getShortName());

    if (!workDir.has_value()) {
        const fs::path workDirPattern =
            config.analysisWorkDir /
            (pipelines::PathPlanner::workDirPrefix(run.runID, pipeline.getShortName()) + "*");
        fields.put("analysis_work_dir_glob", workDirPattern.string());
        Logger::logEvent(LogLevel::WARNING, "analysis_work_dir_not_found", fields);
        return;
    }

    fields.put("analysis_work_dir_path", workDir->string());

    if (!pipeline.deleteWorkDir) {
        Logger::logEvent(LogLevel::INFO, "skipped_deletion_of_analysis_work_dir", fields);
        return;
    }

    std::error_code errorCode;
    fs::remove_all(workDir.value(), errorCode);
    if (errorCode) {
        fields.put("error", errorCode.message());
        Logger::logEvent(LogLevel::ERROR, "delete_analysis_work_dir_failed", fields);
        return;
    }

    Logger::logEvent(LogLevel::INFO, "analysis_work_dir_deleted", fields);
}

void PostProcessor::finalize(const pipelines::PipelineDefinition &pipeline,
                             const discovery::Run &run) const {
    const auto *hooks = registry.find(pipeline.name);
    if (hooks == nullptr) {
        pt::ptree fields;
        fields.put("sequencing_run_id", run.runID);
        fields.put("pipeline_name", pipeline.name);
        Logger::logEvent(LogLevel::INFO, "post_analysis_not_registered", fields);
        return;
    }

    hooks->finalize(pipeline, run, config.analysisOutputDir);
}

}  // namespace autorun::postprocess
