#pragma once

// Standard
#include <optional>
#include <string>
#include <vector>

// Internal
#include "AnalysisConfig.hpp"
#include "AnalysisInvocation.hpp"
#include "PathPlanner.hpp"
#include "PipelineDefinition.hpp"
#include "PipelineRegistry.hpp"
#include "ProcessExecutor.hpp"
#include "Run.hpp"

namespace autorun::dispatch {

class Dispatcher {
   public:
    Dispatcher(config::AnalysisConfig config, ProcessExecutor &executor,
               const pipelines::PipelineRegistry &registry);

    /**
     * Runs one pipeline against one run unless its output directory already exists or one of its
     * dependencies is incomplete. Every failure is reported through the returned invocation.
     *
     * @param pipeline Pipeline as loaded from the configuration, left untouched.
     * @param run Run to analyze.
     * @return Record of the invocation, including its outcome.
     */
    auto dispatch(const pipelines::PipelineDefinition &pipeline, const discovery::Run &run) const
        -> AnalysisInvocation;

    /**
     * Builds the external command line of an invocation.
     *
     * @throws config::ConfigurationError if a parameter without value has no counterpart among
     * the run's analysis parameters.
     */
    static auto buildCommand(const config::AnalysisConfig &config,
                             const pipelines::PipelineDefinition &pipeline,
                             const discovery::Run &run, const pipelines::AnalysisPaths &paths)
        -> std::vector<std::string>;

   private:
    config::AnalysisConfig config;
    ProcessExecutor &executor;
    const pipelines::PipelineRegistry &registry;

    auto prepare(const pipelines::PipelineDefinition &pipeline, const discovery::Run &run,
                 const pipelines::AnalysisPaths &paths) const -> pipelines::PipelineDefinition;

    void execute(AnalysisInvocation &invocation, const pipelines::AnalysisPaths &paths) const;

    static auto resolveParameter(const std::string &flag,
                                 const std::optional<std::string> &value,
                                 const pipelines::PipelineDefinition &pipeline,
                                 const discovery::Run &run) -> std::string;
};

}  // namespace autorun::dispatch
