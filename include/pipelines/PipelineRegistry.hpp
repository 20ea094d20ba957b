#pragma once

// Standard
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

// Internal
#include "PathPlanner.hpp"
#include "PipelineDefinition.hpp"
#include "Run.hpp"

namespace autorun::pipelines {

namespace fs = std::filesystem;

// Pipeline-specific steps around an invocation
class PipelineHooks {
   public:
    PipelineHooks() = default;
    PipelineHooks(const PipelineHooks &) = delete;
    PipelineHooks(PipelineHooks &&) = delete;
    auto operator=(const PipelineHooks &) -> PipelineHooks & = delete;
    auto operator=(PipelineHooks &&) -> PipelineHooks & = delete;
    virtual ~PipelineHooks() = default;

    // Adjusts the working copy of the pipeline before its command is built
    virtual void prepare(PipelineDefinition &pipeline, const discovery::Run &run,
                         const AnalysisPaths &paths) const = 0;

    // Runs after a successful invocation and cleanup of its work directory
    virtual void finalize(const PipelineDefinition &pipeline, const discovery::Run &run,
                          const fs::path &outputRoot) const = 0;
};

class PipelineRegistry {
   public:
    void registerHooks(const std::string &pipelineName, std::unique_ptr<PipelineHooks> hooks);

    // Hooks registered for the qualified pipeline name, nullptr if there are none
    [[nodiscard]] auto find(const std::string &pipelineName) const -> const PipelineHooks *;

    // Registry with the hooks of all pipelines that ship with AutoRun
    static auto withDefaultHooks() -> PipelineRegistry;

   private:
    std::unordered_map<std::string, std::unique_ptr<PipelineHooks>> registeredHooks;
};

}  // namespace autorun::pipelines
