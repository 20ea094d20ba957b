#pragma once

// Standard
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace autorun::pipelines {

// Ordered flag -> value pairs. A missing value is filled from the run at dispatch time.
using PipelineParameters = std::vector<std::pair<std::string, std::optional<std::string>>>;

struct PipelineDependency {
    std::string name;
    std::string version;
};

/**
 * Returns the part of a qualified pipeline name after the last '/', e.g.
 * "BCCDC-PHL/fluviewer-nf" -> "fluviewer-nf". Names without a namespace are returned unchanged.
 */
inline auto shortName(const std::string &qualifiedName) -> std::string {
    const auto slashPos = qualifiedName.find_last_of('/');
    if (slashPos == std::string::npos) {
        return qualifiedName;
    }
    return qualifiedName.substr(slashPos + 1);
}

/**
 * Drops the last dot-separated component of a version, e.g. "1.2.3" -> "1.2". Versions without
 * a dot are returned unchanged.
 */
inline auto minorVersion(const std::string &version) -> std::string {
    const auto dotPos = version.find_last_of('.');
    if (dotPos == std::string::npos) {
        return version;
    }
    return version.substr(0, dotPos);
}

struct PipelineDefinition {
    std::string name;
    std::string version;
    std::vector<PipelineDependency> dependencies;
    PipelineParameters parameters;
    bool deleteWorkDir = true;

    [[nodiscard]] auto getShortName() const -> std::string { return shortName(name); }
    [[nodiscard]] auto getMinorVersion() const -> std::string { return minorVersion(version); }

    // Replaces the value of an existing parameter or appends a new one
    void setParameter(const std::string &flag, const std::optional<std::string> &value) {
        for (auto &[existingFlag, existingValue] : parameters) {
            if (existingFlag == flag) {
                existingValue = value;
                return;
            }
        }
        parameters.emplace_back(flag, value);
    }
};

}  // namespace autorun::pipelines
