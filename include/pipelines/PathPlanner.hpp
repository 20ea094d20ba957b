#pragma once

// Standard
#include <chrono>
#include <filesystem>
#include <string>

namespace autorun::pipelines {

namespace fs = std::filesystem;

struct AnalysisPaths {
    fs::path workDir;
    fs::path outputDir;
    fs::path completionMarkerPath;
    fs::path reportPath;
    fs::path tracePath;
    fs::path timelinePath;
    fs::path logPath;
};

class PathPlanner {
   public:
    PathPlanner() = delete;

    /**
     * Derives every path of one invocation. The output directory only depends on the run and the
     * pipeline, the work directory additionally carries the timestamp.
     *
     * @param runID Sequencing run identifier.
     * @param shortName Pipeline name without its namespace.
     * @param minorVersion Pipeline version without its patch component.
     * @param outputRoot Base directory of all analysis outputs.
     * @param workRoot Base directory of all work directories.
     * @param now Time used for the work directory suffix.
     * @return Absolute paths for this invocation.
     */
    static auto plan(const std::string &runID, const std::string &shortName,
                     const std::string &minorVersion, const fs::path &outputRoot,
                     const fs::path &workRoot, std::chrono::system_clock::time_point now)
        -> AnalysisPaths;

    static auto outputDir(const fs::path &outputRoot, const std::string &runID,
                          const std::string &shortName, const std::string &minorVersion)
        -> fs::path;

    static auto completionMarkerPath(const fs::path &outputRoot, const std::string &runID,
                                     const std::string &shortName,
                                     const std::string &minorVersion) -> fs::path;

    // Common prefix of all work directory names of this run and pipeline
    static auto workDirPrefix(const std::string &runID, const std::string &shortName)
        -> std::string;
};

}  // namespace autorun::pipelines
