#pragma once

// Standard
#include <filesystem>
#include <string>
#include <vector>

// Internal
#include "PipelineDefinition.hpp"
#include "Run.hpp"

namespace autorun::pipelines {

namespace fs = std::filesystem;

struct DependencyStatus {
    std::string pipelineName;
    std::string pipelineVersion;
    fs::path completionMarkerPath;
    bool complete = false;
};

class DependencyResolver {
   public:
    DependencyResolver() = delete;

    // True if every declared dependency has written its completion marker for this run
    static auto dependenciesComplete(const PipelineDefinition &pipeline,
                                     const discovery::Run &run, const fs::path &outputRoot)
        -> bool;

    static auto checkDependencies(const PipelineDefinition &pipeline, const discovery::Run &run,
                                  const fs::path &outputRoot) -> std::vector<DependencyStatus>;
};

}  // namespace autorun::pipelines
