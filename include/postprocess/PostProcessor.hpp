#pragma once

// Standard
#include <filesystem>
#include <optional>
#include <string>

// Internal
#include "AnalysisConfig.hpp"
#include "PipelineDefinition.hpp"
#include "PipelineRegistry.hpp"
#include "Run.hpp"

namespace autorun::postprocess {

namespace fs = std::filesystem;

class PostProcessor {
   public:
    PostProcessor(config::AnalysisConfig config, const pipelines::PipelineRegistry &registry);

    /**
     * Cleans up after a successful invocation: removes the most recent work directory of the run
     * and pipeline unless the pipeline keeps it, then runs the pipeline's registered finalize
     * step. Failures are logged, never thrown.
     */
    void postProcess(const pipelines::PipelineDefinition &pipeline,
                     const discovery::Run &run) const;

    // Most recent work-<run>_<pipeline>_<timestamp> directory below workRoot
    static auto findLatestWorkDir(const fs::path &workRoot, const std::string &runID,
                                  const std::string &shortName) -> std::optional<fs::path>;

   private:
    config::AnalysisConfig config;
    const pipelines::PipelineRegistry &registry;

    void cleanWorkDir(const pipelines::PipelineDefinition &pipeline,
                      const discovery::Run &run) const;
    void finalize(const pipelines::PipelineDefinition &pipeline, const discovery::Run &run) const;
};

}  // namespace autorun::postprocess
