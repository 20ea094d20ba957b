#include "RunDiscovery.hpp"

// Standard
#include <algorithm>
#include <system_error>

// Boost
#include <boost/property_tree/ptree.hpp>

// Internal
#include "Constants.hpp"
#include "Logger.hpp"

namespace autorun::discovery {

namespace pt = boost::property_tree;

auto RunDiscovery::instrumentPatterns()
    -> const std::vector<std::pair<InstrumentType, std::regex>> & {
    static const std::vector<std::pair<InstrumentType, std::regex>> patterns{
        {InstrumentType::MISEQ, std::regex(R"(\d{6}_M\d{5}_\d+_\d{9}-[A-Z0-9]{5})")},
        {InstrumentType::NEXTSEQ, std::regex(R"(\d{6}_VH\d{5}_\d+_[A-Z0-9]{9})")},
        {InstrumentType::GRIDION, std::regex(R"(\d{8}_\d{4}_X[1-5]_[A-Z0-9]+_[a-z0-9]{8})")}};
    return patterns;
}

auto RunDiscovery::classifyRunID(const std::string &runID) -> InstrumentType {
    InstrumentType matchedType = InstrumentType::UNKNOWN;
    size_t matchCount = 0;

    for (const auto &[instrumentType, pattern] : instrumentPatterns()) {
        if (std::regex_match(runID, pattern)) {
            matchedType = instrumentType;
            ++matchCount;
        }
    }

    return matchCount == 1 ? matchedType : InstrumentType::UNKNOWN;
}

auto RunDiscovery::discoverRuns(const fs::path &rootDir, const DiscoveryOptions &options)
    -> std::vector<Run> {
    Logger::logEvent(LogLevel::INFO, "scan_start");

    std::vector<Run> runs;

    for (const auto &entry : listEntries(rootDir, options.reverseOrder)) {
        std::error_code errorCode;
        const std::string runID = entry.path().filename().string();
        const fs::path runDirectory = fs::absolute(entry.path(), errorCode);

        const bool isDirectory = entry.is_directory(errorCode);
        const InstrumentType instrumentType = classifyRunID(runID);
        const bool matchesRunIDFormat = instrumentType != InstrumentType::UNKNOWN;
        const bool readyToAnalyze =
            !options.requireReadyMarker ||
            fs::exists(entry.path() / constants::discovery::READINESS_MARKER, errorCode);

        if (!isDirectory || !matchesRunIDFormat || !readyToAnalyze) {
            pt::ptree conditions;
            conditions.put("is_directory", isDirectory);
            conditions.put("matches_run_id_format", matchesRunIDFormat);
            conditions.put("ready_to_analyze", readyToAnalyze);

            pt::ptree fields;
            fields.put("fastq_directory", runDirectory.string());
            fields.add_child("conditions_checked", conditions);
            Logger::logEvent(LogLevel::DEBUG, "directory_skipped", fields);
            continue;
        }

        Run run{.runID = runID,
                .fastqDirectory = runDirectory,
                .instrumentType = instrumentType,
                .analysisParameters = {
                    {constants::discovery::FASTQ_INPUT_PARAMETER, runDirectory.string()}}};

        pt::ptree fields;
        fields.put("sequencing_run_id", run.runID);
        fields.put("instrument_type", instrumentTypeName(run.instrumentType));
        fields.put("fastq_directory_path", run.fastqDirectory.string());
        Logger::logEvent(LogLevel::INFO, "fastq_directory_found", fields);

        runs.push_back(std::move(run));
    }

    return runs;
}

auto RunDiscovery::listEntries(const fs::path &rootDir, bool reverseOrder)
    -> std::vector<fs::directory_entry> {
    std::error_code errorCode;
    fs::directory_iterator iterator(rootDir, errorCode);
    if (errorCode) {
        const std::string message =
            "Cannot enumerate run directory " + rootDir.string() + ": " + errorCode.message();
        Logger::log(LogLevel::ERROR, message);
        throw ScanError(message);
    }

    std::vector<fs::directory_entry> entries;
    while (iterator != fs::directory_iterator()) {
        entries.push_back(*iterator);

        iterator.increment(errorCode);
        if (errorCode) {
            const std::string message =
                "Failed while enumerating " + rootDir.string() + ": " + errorCode.message();
            Logger::log(LogLevel::ERROR, message);
            throw ScanError(message);
        }
    }

    if (reverseOrder) {
        std::sort(entries.begin(), entries.end(),
                  [](const fs::directory_entry &lhs, const fs::directory_entry &rhs) {
                      return lhs.path().filename().string() > rhs.path().filename().string();
                  });
    }

    return entries;
}

}  // namespace autorun::discovery
