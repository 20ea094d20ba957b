#pragma once

// Standard
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace autorun::dispatch {

namespace fs = std::filesystem;

struct CompletionRecord {
    std::string timestampAnalysisStart;
    std::string timestampAnalysisComplete;
};

class CompletionMarker {
   public:
    CompletionMarker() = delete;

    /**
     * Writes the completion marker of an invocation. The JSON document is written to a temporary
     * file next to markerPath and renamed over it, so readers never see a partial marker.
     *
     * @throws std::runtime_error if the marker cannot be written.
     */
    static void write(const fs::path &markerPath, std::chrono::system_clock::time_point start,
                      std::chrono::system_clock::time_point complete);

    // Parsed marker, std::nullopt if it is missing or not a valid marker document
    static auto read(const fs::path &markerPath) -> std::optional<CompletionRecord>;

   private:
    static auto temporaryPath(const fs::path &markerPath) -> fs::path;
};

}  // namespace autorun::dispatch
