#pragma once

// Standard
#include <filesystem>
#include <string>

// Internal
#include "PipelineRegistry.hpp"

namespace autorun::pipelines {

static const std::string fluviewerPipelineName = "BCCDC-PHL/fluviewer-nf";

class FluviewerHooks : public PipelineHooks {
   public:
    void prepare(PipelineDefinition &pipeline, const discovery::Run &run,
                 const AnalysisPaths &paths) const override;

    void finalize(const PipelineDefinition &pipeline, const discovery::Run &run,
                  const fs::path &outputRoot) const override;
};

}  // namespace autorun::pipelines
