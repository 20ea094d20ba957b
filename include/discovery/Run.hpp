#pragma once

// Standard
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace autorun::discovery {

namespace fs = std::filesystem;

enum class InstrumentType { MISEQ, NEXTSEQ, GRIDION, UNKNOWN };

inline auto instrumentTypeName(InstrumentType instrumentType) -> std::string {
    switch (instrumentType) {
        case InstrumentType::MISEQ:
            return "miseq";
        case InstrumentType::NEXTSEQ:
            return "nextseq";
        case InstrumentType::GRIDION:
            return "gridion";
        case InstrumentType::UNKNOWN:
            return "unknown";
    }
    return "unknown";
}

using AnalysisParameters = std::map<std::string, std::optional<std::string>>;

struct Run {
    std::string runID;
    fs::path fastqDirectory;
    InstrumentType instrumentType = InstrumentType::UNKNOWN;
    AnalysisParameters analysisParameters;
};

}  // namespace autorun::discovery
