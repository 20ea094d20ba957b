#include "ConfigLoader.hpp"

// Standard
#include <cstdlib>
#include <fstream>

// Boost
#include <boost/property_tree/json_parser.hpp>

// Internal
#include "Logger.hpp"

namespace autorun::config {

namespace {
// Boost.PropertyTree stores JSON null as this literal
const std::string jsonNull = "null";
}  // namespace

auto ConfigLoader::load(const fs::path &configPath) -> AnalysisConfig {
    std::ifstream configIn{configPath};
    if (!configIn) {
        throw ConfigurationError("Configuration file could not be opened: " + configPath.string());
    }

    pt::ptree tree;
    try {
        pt::read_json(configIn, tree);
    } catch (const pt::json_parser_error &e) {
        throw ConfigurationError("Configuration file " + configPath.string() +
                                 " is not valid JSON: " + e.what());
    }

    return fromPropertyTree(tree);
}

auto ConfigLoader::reload(const fs::path &configPath, const AnalysisConfig &lastGood)
    -> AnalysisConfig {
    pt::ptree fields;
    fields.put("config_file", fs::absolute(configPath).string());
    Logger::logEvent(LogLevel::INFO, "load_config_start", fields);

    try {
        return load(configPath);
    } catch (const ConfigurationError &e) {
        fields.put("error", e.what());
        Logger::logEvent(LogLevel::ERROR, "load_config_failed", fields);
        return lastGood;
    }
}

auto ConfigLoader::fromPropertyTree(const pt::ptree &tree) -> AnalysisConfig {
    AnalysisConfig config;

    config.fastqByRunDir = requireString(tree, "fastq_by_run_dir");
    config.analysisOutputDir = requireString(tree, "analysis_output_dir");
    config.analysisWorkDir = requireString(tree, "analysis_work_dir");

    config.scanIntervalSeconds = parseScanInterval(tree);
    config.analyzeRunsInReverseOrder = parseBool(tree, "analyze_runs_in_reverse_order", false);
    config.requireReadyMarker = parseBool(tree, "require_symlinks_complete", true);

    config.pipelineExecutable = optionalValue(tree, "pipeline_executable")
                                    .value_or(constants::dispatch::DEFAULT_EXECUTABLE);
    config.pipelineProfile =
        optionalValue(tree, "pipeline_profile").value_or(constants::dispatch::DEFAULT_PROFILE);

    const auto cacheDir = optionalValue(tree, "pipeline_cache_dir");
    config.pipelineCacheDir = cacheDir ? fs::path(cacheDir.value()) : defaultCacheDir();

    if (optionalValue(tree, "pipeline_timeout_seconds")) {
        const auto timeout = tree.get_optional<double>("pipeline_timeout_seconds");
        if (!timeout || timeout.value() <= 0.0) {
            throw ConfigurationError("pipeline_timeout_seconds must be a positive number");
        }
        config.pipelineTimeoutSeconds = timeout.value();
    }

    const auto pipelinesNode = tree.get_child_optional("pipelines");
    if (!pipelinesNode || pipelinesNode->empty()) {
        Logger::log(LogLevel::WARNING, "No pipelines configured");
        return config;
    }

    for (const auto &[key, pipelineNode] : pipelinesNode.get()) {
        config.pipelines.push_back(parsePipeline(pipelineNode));
    }

    return config;
}

auto ConfigLoader::parsePipeline(const pt::ptree &node) -> pipelines::PipelineDefinition {
    pipelines::PipelineDefinition pipeline;
    pipeline.name = requireString(node, "pipeline_name");
    pipeline.version = requireString(node, "pipeline_version");
    pipeline.deleteWorkDir = parseBool(node, "delete_work_dir", true);

    if (const auto dependencies = node.get_child_optional("dependencies")) {
        pipeline.dependencies = parseDependencies(dependencies.get());
    }
    if (const auto parameters = node.get_child_optional("pipeline_parameters")) {
        pipeline.parameters = parseParameters(parameters.get());
    }

    return pipeline;
}

auto ConfigLoader::parseDependencies(const pt::ptree &node)
    -> std::vector<pipelines::PipelineDependency> {
    std::vector<pipelines::PipelineDependency> dependencies;
    for (const auto &[key, dependencyNode] : node) {
        dependencies.push_back({.name = requireString(dependencyNode, "name"),
                                .version = requireString(dependencyNode, "version")});
    }
    return dependencies;
}

auto ConfigLoader::parseParameters(const pt::ptree &node) -> pipelines::PipelineParameters {
    pipelines::PipelineParameters parameters;
    for (const auto &[flag, valueNode] : node) {
        if (!valueNode.empty()) {
            throw ConfigurationError("Pipeline parameter '" + flag + "' must be a scalar value");
        }
        const std::string &value = valueNode.data();
        parameters.emplace_back(flag, value == jsonNull ? std::nullopt
                                                        : std::optional<std::string>(value));
    }
    return parameters;
}

auto ConfigLoader::requireString(const pt::ptree &tree, const std::string &key) -> std::string {
    const auto value = optionalValue(tree, key);
    if (!value || value->empty()) {
        throw ConfigurationError("Missing required configuration key: " + key);
    }
    return value.value();
}

auto ConfigLoader::optionalValue(const pt::ptree &tree, const std::string &key)
    -> std::optional<std::string> {
    const auto value = tree.get_optional<std::string>(key);
    if (!value || value.value() == jsonNull) {
        return std::nullopt;
    }
    return value.value();
}

auto ConfigLoader::parseBool(const pt::ptree &tree, const std::string &key, bool defaultValue)
    -> bool {
    if (!optionalValue(tree, key)) {
        return defaultValue;
    }

    const auto value = tree.get_optional<bool>(key);
    if (!value) {
        throw ConfigurationError("Configuration key " + key + " must be true or false");
    }
    return value.value();
}

auto ConfigLoader::parseScanInterval(const pt::ptree &tree) -> double {
    if (!optionalValue(tree, "scan_interval_seconds")) {
        return constants::scan::defaultScanIntervalSeconds;
    }

    const auto interval = tree.get_optional<double>("scan_interval_seconds");
    if (!interval || interval.value() <= 0.0) {
        Logger::log(LogLevel::WARNING, "Invalid scan_interval_seconds, using default of ",
                    constants::scan::defaultScanIntervalSeconds, " seconds");
        return constants::scan::defaultScanIntervalSeconds;
    }
    return interval.value();
}

auto ConfigLoader::defaultCacheDir() -> fs::path {
    const char *home = std::getenv("HOME");
    if (home == nullptr) {
        return fs::path(constants::dispatch::DEFAULT_CACHE_SUBDIR);
    }
    return fs::path(home) / constants::dispatch::DEFAULT_CACHE_SUBDIR;
}

}  // namespace autorun::config
