#pragma once

// Standard
#include <filesystem>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Internal
#include "Run.hpp"

namespace autorun::discovery {

namespace fs = std::filesystem;

// Raised when the root scan directory cannot be enumerated
class ScanError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

struct DiscoveryOptions {
    bool requireReadyMarker = true;
    bool reverseOrder = false;
};

class RunDiscovery {
   public:
    RunDiscovery() = delete;

    /**
     * Scans the direct subdirectories of rootDir and returns every directory that is named like a
     * sequencing run and, if requested, carries the readiness marker. Each skipped entry is
     * reported as a debug event.
     *
     * @param rootDir Directory containing one subdirectory per sequencing run.
     * @param options Readiness marker requirement and visiting order.
     * @return The ready runs, in visiting order.
     * @throws ScanError if rootDir cannot be enumerated.
     */
    static auto discoverRuns(const fs::path &rootDir, const DiscoveryOptions &options)
        -> std::vector<Run>;

    // Instrument whose pattern fully matches runID, UNKNOWN if none or more than one match
    static auto classifyRunID(const std::string &runID) -> InstrumentType;

    static auto instrumentPatterns() -> const std::vector<std::pair<InstrumentType, std::regex>> &;

   private:
    static auto listEntries(const fs::path &rootDir, bool reverseOrder)
        -> std::vector<fs::directory_entry>;
};

}  // namespace autorun::discovery
