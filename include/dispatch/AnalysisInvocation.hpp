#pragma once

// Standard
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace autorun::dispatch {

namespace fs = std::filesystem;

enum class InvocationOutcome {
    COMPLETED,
    FAILED,
    SKIPPED_ALREADY_STARTED,
    SKIPPED_DEPENDENCIES_INCOMPLETE,
    CONFIGURATION_ERROR,
    WORK_DIR_FAILED
};

inline auto outcomeName(InvocationOutcome outcome) -> std::string {
    switch (outcome) {
        case InvocationOutcome::COMPLETED:
            return "completed";
        case InvocationOutcome::FAILED:
            return "failed";
        case InvocationOutcome::SKIPPED_ALREADY_STARTED:
            return "skipped_already_started";
        case InvocationOutcome::SKIPPED_DEPENDENCIES_INCOMPLETE:
            return "skipped_dependencies_incomplete";
        case InvocationOutcome::CONFIGURATION_ERROR:
            return "configuration_error";
        case InvocationOutcome::WORK_DIR_FAILED:
            return "work_dir_failed";
    }
    return "failed";
}

struct AnalysisInvocation {
    std::string runID;
    std::string pipelineName;
    std::string pipelineVersion;
    std::vector<std::string> command;
    fs::path workDir;
    fs::path outputDir;
    std::chrono::system_clock::time_point startTime;
    std::optional<std::chrono::system_clock::time_point> completionTime;
    std::optional<int> exitCode;
    std::string diagnosticOutput;
    InvocationOutcome outcome = InvocationOutcome::FAILED;

    [[nodiscard]] auto completed() const -> bool {
        return outcome == InvocationOutcome::COMPLETED;
    }
    [[nodiscard]] auto skipped() const -> bool {
        return outcome == InvocationOutcome::SKIPPED_ALREADY_STARTED ||
               outcome == InvocationOutcome::SKIPPED_DEPENDENCIES_INCOMPLETE;
    }
};

}  // namespace autorun::dispatch
