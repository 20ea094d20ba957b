#pragma once
// Standard
#include <cstddef>
#include <string>

namespace constants::discovery {
const std::string READINESS_MARKER = "symlinks_complete.json";
const std::string FASTQ_INPUT_PARAMETER = "fastq_input";
}  // namespace constants::discovery

namespace constants::pipelines {
const std::string COMPLETION_MARKER = "analysis_complete.json";
const std::string OUTPUT_DIR_SUFFIX = "output";
const std::string WORK_DIR_PREFIX = "work-";
const std::string OUTDIR_PARAMETER = "outdir";

const std::string REPORT_SUFFIX = "_report.html";
const std::string TRACE_SUFFIX = "_trace.tsv";
const std::string TIMELINE_SUFFIX = "_timeline.html";
const std::string LOG_SUFFIX = "_nextflow.log";

const std::string TIMESTAMP_ANALYSIS_START = "timestamp_analysis_start";
const std::string TIMESTAMP_ANALYSIS_COMPLETE = "timestamp_analysis_complete";

// Length of the YYYYmmddHHMMSS suffix of a work directory
constexpr size_t workDirTimestampLength = 14;
}  // namespace constants::pipelines

namespace constants::dispatch {
const std::string DEFAULT_EXECUTABLE = "nextflow";
const std::string DEFAULT_PROFILE = "conda";
const std::string DEFAULT_CACHE_SUBDIR = ".conda/envs";
const std::string PROCESS_OUTPUT_LOG = "pipeline_output.log";

constexpr int launchFailureExitCode = 127;
constexpr size_t diagnosticOutputBytes = 4096;
}  // namespace constants::dispatch

namespace constants::scan {
constexpr double defaultScanIntervalSeconds = 3600.0;
constexpr double sleepSliceSeconds = 1.0;
}  // namespace constants::scan

namespace constants::cli {
const std::string GENERAL_DESCRIPTION =
    "AutoRun scans a directory of sequencing runs and launches the configured analysis "
    "pipelines on every run that is ready.\n\nMinimum call: autorun -c <config-file>\n\nGeneral "
    "Options";
const std::string DEFAULT_LOG_LEVEL = "info";
}  // namespace constants::cli
