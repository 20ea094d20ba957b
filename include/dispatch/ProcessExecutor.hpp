#pragma once

// Standard
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace autorun::dispatch {

namespace fs = std::filesystem;

struct ProcessResult {
    int exitCode = 0;
    bool timedOut = false;
    std::string output;

    [[nodiscard]] auto succeeded() const -> bool { return exitCode == 0 && !timedOut; }
};

// Runs one external command to completion
class ProcessExecutor {
   public:
    ProcessExecutor() = default;
    ProcessExecutor(const ProcessExecutor &) = delete;
    ProcessExecutor(ProcessExecutor &&) = delete;
    auto operator=(const ProcessExecutor &) -> ProcessExecutor & = delete;
    auto operator=(ProcessExecutor &&) -> ProcessExecutor & = delete;
    virtual ~ProcessExecutor() = default;

    /**
     * Runs command (program followed by its arguments) in workingDir and blocks until it exits.
     *
     * @param command Program and arguments.
     * @param workingDir Working directory of the process, must exist.
     * @param outputLogPath File receiving the combined stdout and stderr of the process.
     * @param timeout Terminates the process once exceeded, no limit if empty.
     * @return Exit status and the tail of the captured output.
     */
    virtual auto execute(const std::vector<std::string> &command, const fs::path &workingDir,
                         const fs::path &outputLogPath,
                         std::optional<std::chrono::milliseconds> timeout) -> ProcessResult = 0;
};

class BoostProcessExecutor : public ProcessExecutor {
   public:
    auto execute(const std::vector<std::string> &command, const fs::path &workingDir,
                 const fs::path &outputLogPath, std::optional<std::chrono::milliseconds> timeout)
        -> ProcessResult override;
};

}  // namespace autorun::dispatch
