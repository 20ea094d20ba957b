#include "FluviewerHooks.hpp"

// Boost
#include <boost/property_tree/ptree.hpp>

// Internal
#include "Constants.hpp"
#include "Logger.hpp"

namespace autorun::pipelines {

namespace pt = boost::property_tree;

void FluviewerHooks::prepare(PipelineDefinition &pipeline, const discovery::Run &run,
                             const AnalysisPaths &paths) const {
    const auto fastqInput =
        run.analysisParameters.find(constants::discovery::FASTQ_INPUT_PARAMETER);
    const std::string fastqDirectory = fastqInput != run.analysisParameters.end() &&
                                               fastqInput->second.has_value()
                                           ? fastqInput->second.value()
                                           : run.fastqDirectory.string();

    pipeline.setParameter(constants::discovery::FASTQ_INPUT_PARAMETER, fastqDirectory);
    pipeline.setParameter(constants::pipelines::OUTDIR_PARAMETER, paths.outputDir.string());
}

void FluviewerHooks::finalize(const PipelineDefinition &pipeline, const discovery::Run &run,
                              const fs::path &outputRoot) const {
    pt::ptree fields;
    fields.put("sequencing_run_id", run.runID);
    fields.put("pipeline_name", pipeline.name);
    fields.put("pipeline_version", pipeline.version);
    fields.put("analysis_run_output_dir", fs::absolute(outputRoot / run.runID).string());
    Logger::logEvent(LogLevel::INFO, "post_analysis_started", fields);
}

}  // namespace autorun::pipelines
