#include "Utility.hpp"

// Standard
#include <execinfo.h>
#include <unistd.h>

#include <array>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace helper {

void crashHandler(int sig) {
    constexpr size_t MAX_FRAMES = 10;
    std::array<void*, MAX_FRAMES> array{};
    int size = backtrace(array.data(), MAX_FRAMES);

    // print out all the frames to stderr
    std::cerr << "Error: signal " << sig << ":" << '\n';
    backtrace_symbols_fd(array.data(), size, STDERR_FILENO);
    exit(1);
}

auto isoTimestamp(std::chrono::system_clock::time_point timePoint) -> std::string {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timePoint);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                            timePoint.time_since_epoch()) %
                        std::chrono::seconds(1);

    std::ostringstream timeStream;
    timeStream << std::put_time(std::localtime(&seconds), "%Y-%m-%dT%H:%M:%S") << "."
               << std::setfill('0') << std::setw(6) << micros.count();

    return timeStream.str();
}

auto compactTimestamp(std::chrono::system_clock::time_point timePoint) -> std::string {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timePoint);

    std::ostringstream timeStream;
    timeStream << std::put_time(std::localtime(&seconds), "%Y%m%d%H%M%S");

    return timeStream.str();
}

auto readTail(const fs::path& path, size_t maxBytes) -> std::string {
    std::ifstream inStream(path, std::ios::binary | std::ios::ate);
    if (!inStream) {
        return {};
    }

    const std::streamoff size = inStream.tellg();
    const std::streamoff offset =
        size > static_cast<std::streamoff>(maxBytes) ? size - static_cast<std::streamoff>(maxBytes)
                                                     : 0;
    inStream.seekg(offset);

    std::ostringstream tail;
    tail << inStream.rdbuf();
    return tail.str();
}

auto toPtreeArray(const std::vector<std::string>& values) -> pt::ptree {
    pt::ptree array;
    for (const auto& value : values) {
        array.push_back(std::make_pair("", pt::ptree(value)));
    }
    return array;
}

auto Timer::elapsedSeconds() const -> double {
    const auto end = std::chrono::steady_clock::now();
    const std::chrono::duration<double> elapsed = end - start;
    return elapsed.count();
}

}  // namespace helper
