#include "DependencyResolver.hpp"

// Standard
#include <algorithm>
#include <system_error>

// Boost
#include <boost/property_tree/ptree.hpp>

// Internal
#include "Logger.hpp"
#include "PathPlanner.hpp"

namespace autorun::pipelines {

namespace pt = boost::property_tree;

auto DependencyResolver::dependenciesComplete(const PipelineDefinition &pipeline,
                                              const discovery::Run &run,
                                              const fs::path &outputRoot) -> bool {
    if (pipeline.dependencies.empty()) {
        return true;
    }

    const auto statuses = checkDependencies(pipeline, run, outputRoot);
    const bool allComplete =
        std::all_of(statuses.begin(), statuses.end(),
                    [](const DependencyStatus &status) { return status.complete; });

    pt::ptree dependencies;
    for (const auto &status : statuses) {
        pt::ptree dependency;
        dependency.put("pipeline_name", status.pipelineName);
        dependency.put("pipeline_version", status.pipelineVersion);
        dependency.put("analysis_complete_path", status.completionMarkerPath.string());
        dependency.put("analysis_complete", status.complete);
        dependencies.push_back(std::make_pair("", dependency));
    }

    pt::ptree fields;
    fields.put("sequencing_run_id", run.runID);
    fields.put("pipeline_name", pipeline.name);
    fields.put("all_analysis_dependencies_complete", allComplete);
    fields.add_child("analysis_dependencies", dependencies);
    Logger::logEvent(LogLevel::INFO, "checked_analysis_dependencies", fields);

    return allComplete;
}

auto DependencyResolver::checkDependencies(const PipelineDefinition &pipeline,
                                           const discovery::Run &run, const fs::path &outputRoot)
    -> std::vector<DependencyStatus> {
    std::vector<DependencyStatus> statuses;
    statuses.reserve(pipeline.dependencies.size());

    for (const auto &dependency : pipeline.dependencies) {
        const fs::path markerPath =
            PathPlanner::completionMarkerPath(outputRoot, run.runID, shortName(dependency.name),
                                              minorVersion(dependency.version));

        std::error_code errorCode;
        statuses.push_back({.pipelineName = dependency.name,
                            .pipelineVersion = dependency.version,
                            .completionMarkerPath = markerPath,
                            .complete = fs::exists(markerPath, errorCode)});
    }

    return statuses;
}

}  // namespace autorun::pipelines
