#include "PathPlanner.hpp"

// Internal
#include "Constants.hpp"
#include "Utility.hpp"

namespace autorun::pipelines {

using namespace constants::pipelines;

auto PathPlanner::plan(const std::string &runID, const std::string &shortName,
                       const std::string &minorVersion, const fs::path &outputRoot,
                       const fs::path &workRoot, std::chrono::system_clock::time_point now)
    -> AnalysisPaths {
    const fs::path pipelineOutputDir = outputDir(outputRoot, runID, shortName, minorVersion);
    const std::string artifactPrefix = runID + "_" + shortName;

    return AnalysisPaths{
        .workDir = fs::absolute(workRoot / (workDirPrefix(runID, shortName) +
                                            helper::compactTimestamp(now))),
        .outputDir = pipelineOutputDir,
        .completionMarkerPath = pipelineOutputDir / COMPLETION_MARKER,
        .reportPath = pipelineOutputDir / (artifactPrefix + REPORT_SUFFIX),
        .tracePath = pipelineOutputDir / (artifactPrefix + TRACE_SUFFIX),
        .timelinePath = pipelineOutputDir / (artifactPrefix + TIMELINE_SUFFIX),
        .logPath = pipelineOutputDir / (artifactPrefix + LOG_SUFFIX)};
}

auto PathPlanner::outputDir(const fs::path &outputRoot, const std::string &runID,
                            const std::string &shortName, const std::string &minorVersion)
    -> fs::path {
    const std::string dirName = shortName + "-" + minorVersion + "-" + OUTPUT_DIR_SUFFIX;
    return fs::absolute(outputRoot / runID / dirName);
}

auto PathPlanner::completionMarkerPath(const fs::path &outputRoot, const std::string &runID,
                                       const std::string &shortName,
                                       const std::string &minorVersion) -> fs::path {
    return outputDir(outputRoot, runID, shortName, minorVersion) / COMPLETION_MARKER;
}

auto PathPlanner::workDirPrefix(const std::string &runID, const std::string &shortName)
    -> std::string {
    return WORK_DIR_PREFIX + runID + "_" + shortName + "_";
}

}  // namespace autorun::pipelines
