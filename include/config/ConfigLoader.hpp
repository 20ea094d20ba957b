#pragma once

// Standard
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Boost
#include <boost/property_tree/ptree.hpp>

// Internal
#include "AnalysisConfig.hpp"

namespace autorun::config {

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

class ConfigLoader {
   public:
    ConfigLoader() = delete;

    /**
     * Reads and validates a JSON configuration file.
     *
     * @throws ConfigurationError if the file cannot be read, is not valid JSON or lacks a
     * required key.
     */
    static auto load(const fs::path &configPath) -> AnalysisConfig;

    /**
     * Reads the configuration again, falling back to lastGood if the file is currently unreadable
     * or malformed.
     */
    static auto reload(const fs::path &configPath, const AnalysisConfig &lastGood)
        -> AnalysisConfig;

    static auto fromPropertyTree(const pt::ptree &tree) -> AnalysisConfig;

   private:
    static auto parsePipeline(const pt::ptree &node) -> pipelines::PipelineDefinition;
    static auto parseDependencies(const pt::ptree &node)
        -> std::vector<pipelines::PipelineDependency>;
    static auto parseParameters(const pt::ptree &node) -> pipelines::PipelineParameters;

    static auto requireString(const pt::ptree &tree, const std::string &key) -> std::string;
    static auto optionalValue(const pt::ptree &tree, const std::string &key)
        -> std::optional<std::string>;
    static auto parseBool(const pt::ptree &tree, const std::string &key, bool defaultValue) -> bool;
    static auto parseScanInterval(const pt::ptree &tree) -> double;
    static auto defaultCacheDir() -> fs::path;
};

}  // namespace autorun::config
