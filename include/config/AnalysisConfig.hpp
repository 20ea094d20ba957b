#pragma once

// Standard
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Internal
#include "Constants.hpp"
#include "PipelineDefinition.hpp"

namespace autorun::config {

namespace fs = std::filesystem;

// Raised for unreadable or invalid configuration and for parameters that cannot be resolved
class ConfigurationError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

struct AnalysisConfig {
    fs::path fastqByRunDir;
    fs::path analysisOutputDir;
    fs::path analysisWorkDir;

    double scanIntervalSeconds = constants::scan::defaultScanIntervalSeconds;
    bool analyzeRunsInReverseOrder = false;
    bool requireReadyMarker = true;

    std::string pipelineExecutable = constants::dispatch::DEFAULT_EXECUTABLE;
    std::string pipelineProfile = constants::dispatch::DEFAULT_PROFILE;
    fs::path pipelineCacheDir;
    std::optional<double> pipelineTimeoutSeconds;

    std::vector<pipelines::PipelineDefinition> pipelines;
};

}  // namespace autorun::config
