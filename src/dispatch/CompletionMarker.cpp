#include "CompletionMarker.hpp"

// Standard
#include <fstream>
#include <stdexcept>
#include <system_error>

// Boost
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

// Internal
#include "Constants.hpp"
#include "Utility.hpp"

namespace autorun::dispatch {

namespace pt = boost::property_tree;

void CompletionMarker::write(const fs::path &markerPath,
                             std::chrono::system_clock::time_point start,
                             std::chrono::system_clock::time_point complete) {
    pt::ptree marker;
    marker.put(constants::pipelines::TIMESTAMP_ANALYSIS_START, helper::isoTimestamp(start));
    marker.put(constants::pipelines::TIMESTAMP_ANALYSIS_COMPLETE, helper::isoTimestamp(complete));

    const fs::path tmpPath = temporaryPath(markerPath);
    {
        std::ofstream markerOut(tmpPath);
        if (!markerOut) {
            throw std::runtime_error("Failed to open temporary marker file " + tmpPath.string());
        }
        pt::write_json(markerOut, marker, true);
        markerOut.flush();
        if (!markerOut) {
            throw std::runtime_error("Failed while writing temporary marker file " +
                                     tmpPath.string());
        }
    }

    std::error_code errorCode;
    fs::rename(tmpPath, markerPath, errorCode);
    if (errorCode) {
        fs::remove(tmpPath, errorCode);
        throw std::runtime_error("Failed to move completion marker into place at " +
                                 markerPath.string());
    }
}

auto CompletionMarker::read(const fs::path &markerPath) -> std::optional<CompletionRecord> {
    std::ifstream markerIn(markerPath);
    if (!markerIn) {
        return std::nullopt;
    }

    pt::ptree marker;
    try {
        pt::read_json(markerIn, marker);
    } catch (const pt::json_parser_error &) {
        return std::nullopt;
    }

    const auto start =
        marker.get_optional<std::string>(constants::pipelines::TIMESTAMP_ANALYSIS_START);
    const auto complete =
        marker.get_optional<std::string>(constants::pipelines::TIMESTAMP_ANALYSIS_COMPLETE);
    if (!start || !complete) {
        return std::nullopt;
    }

    return CompletionRecord{.timestampAnalysisStart = start.value(),
                            .timestampAnalysisComplete = complete.value()};
}

auto CompletionMarker::temporaryPath(const fs::path &markerPath) -> fs::path {
    fs::path tmpPath = markerPath;
    tmpPath += ".tmp";
    return tmpPath;
}

}  // namespace autorun::dispatch
