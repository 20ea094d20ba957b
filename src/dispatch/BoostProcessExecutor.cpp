#include "ProcessExecutor.hpp"

// Standard
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

// Boost
#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <boost/process/extend.hpp>

// Internal
#include "Constants.hpp"
#include "Logger.hpp"
#include "Utility.hpp"

namespace autorun::dispatch {

namespace bp = boost::process;

namespace {
auto resolveExecutable(const std::string &program) -> boost::filesystem::path {
    if (program.find('/') != std::string::npos) {
        return boost::filesystem::path(program);
    }
    return bp::search_path(program);
}
}  // namespace

auto BoostProcessExecutor::execute(const std::vector<std::string> &command,
                                   const fs::path &workingDir, const fs::path &outputLogPath,
                                   std::optional<std::chrono::milliseconds> timeout)
    -> ProcessResult {
    if (command.empty()) {
        throw std::invalid_argument("Cannot execute an empty command");
    }

    const boost::filesystem::path executable = resolveExecutable(command.front());
    if (executable.empty()) {
        return ProcessResult{.exitCode = constants::dispatch::launchFailureExitCode,
                             .timedOut = false,
                             .output = "Executable not found: " + command.front()};
    }

    const std::vector<std::string> arguments(command.begin() + 1, command.end());

    std::error_code errorCode;
    bp::child child(bp::exe = executable, bp::args = arguments,
                    bp::start_dir = workingDir.string(),
                    (bp::std_out & bp::std_err) > boost::filesystem::path(outputLogPath.string()),
                    bp::std_in < bp::null,
                    // own process group, so a terminal interrupt only reaches the daemon
                    bp::extend::on_exec_setup =
                        [](auto &executor) {
                            if (::setpgid(0, 0) != 0) {
                                executor.set_error(
                                    std::error_code(errno, std::system_category()), "setpgid");
                            }
                        },
                    errorCode);
    if (errorCode) {
        return ProcessResult{.exitCode = constants::dispatch::launchFailureExitCode,
                             .timedOut = false,
                             .output = "Failed to launch " + executable.string() + ": " +
                                       errorCode.message()};
    }

    Logger::log(LogLevel::DEBUG, "Started process ", child.id(), " in ", workingDir);

    bool timedOut = false;
    if (timeout.has_value()) {
        if (!child.wait_for(timeout.value(), errorCode) && !errorCode) {
            Logger::log(LogLevel::WARNING, "Process ", child.id(), " exceeded its timeout of ",
                        timeout->count(), " ms, terminating");
            child.terminate(errorCode);
            timedOut = true;
        }
    } else {
        child.wait(errorCode);
    }

    if (errorCode) {
        return ProcessResult{
            .exitCode = constants::dispatch::launchFailureExitCode,
            .timedOut = timedOut,
            .output = "Failed to wait for " + executable.string() + ": " + errorCode.message()};
    }

    return ProcessResult{
        .exitCode = child.exit_code(),
        .timedOut = timedOut,
        .output = helper::readTail(outputLogPath, constants::dispatch::diagnosticOutputBytes)};
}

}  // namespace autorun::dispatch
