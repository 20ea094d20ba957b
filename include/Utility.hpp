#pragma once

// Standard
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Boost
#include <boost/property_tree/ptree.hpp>

// Internal
#include "Logger.hpp"

namespace helper {

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

void crashHandler(int sig);

inline auto hasPrefix(const std::string &fullString, const std::string &prefix) -> bool {
    if (fullString.length() >= prefix.length()) {
        return (0 == fullString.compare(0, prefix.length(), prefix));
    }
    return false;
};

/** Formats a time point as local ISO-8601 with microseconds, e.g. 2024-01-01T12:00:00.000042. */
auto isoTimestamp(std::chrono::system_clock::time_point timePoint) -> std::string;

/** Formats a time point as local YYYYmmddHHMMSS. */
auto compactTimestamp(std::chrono::system_clock::time_point timePoint) -> std::string;

// Returns at most maxBytes from the end of a file, empty if the file cannot be read
auto readTail(const fs::path &path, size_t maxBytes) -> std::string;

auto toPtreeArray(const std::vector<std::string> &values) -> pt::ptree;

class Timer {
   public:
    Timer() : start(std::chrono::steady_clock::now()) {}

    [[nodiscard]] auto elapsedSeconds() const -> double;

   private:
    std::chrono::time_point<std::chrono::steady_clock> start;
};
}  // namespace helper
