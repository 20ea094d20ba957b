#include <gtest/gtest.h>

// Standard
#include <filesystem>
#include <string>

// Internal
#include "ConfigLoader.hpp"
#include "Constants.hpp"
#include "TestUtilities.hpp"

using namespace autorun::config;

class ConfigLoaderTest : public testing::Test {
   protected:
    auto writeConfig(const std::string& json) -> std::filesystem::path {
        return testutils::writeFile(tempDir.get() / "config.json", json);
    }

    testutils::TemporaryDirectory tempDir;
};

namespace {
const std::string minimalConfig = R"({
    "fastq_by_run_dir": "/data/fastq_symlinks_by_run",
    "analysis_output_dir": "/data/analysis_by_run",
    "analysis_work_dir": "/scratch/work"
})";
}  // namespace

TEST_F(ConfigLoaderTest, LoadsPipelines) {
    const auto config = ConfigLoader::load(writeConfig(R"({
        "fastq_by_run_dir": "/data/fastq_symlinks_by_run",
        "analysis_output_dir": "/data/analysis_by_run",
        "analysis_work_dir": "/scratch/work",
        "scan_interval_seconds": 60,
        "analyze_runs_in_reverse_order": true,
        "pipelines": [
            {
                "pipeline_name": "org/tool",
                "pipeline_version": "1.0.0",
                "pipeline_parameters": {"fastq_input": null, "min_depth": "10"}
            },
            {
                "pipeline_name": "org/downstream",
                "pipeline_version": "0.3.1",
                "delete_work_dir": false,
                "dependencies": [{"name": "org/tool", "version": "1.0.0"}]
            }
        ]
    })"));

    EXPECT_EQ(config.fastqByRunDir, std::filesystem::path("/data/fastq_symlinks_by_run"));
    EXPECT_EQ(config.analysisOutputDir, std::filesystem::path("/data/analysis_by_run"));
    EXPECT_EQ(config.analysisWorkDir, std::filesystem::path("/scratch/work"));
    EXPECT_DOUBLE_EQ(config.scanIntervalSeconds, 60.0);
    EXPECT_TRUE(config.analyzeRunsInReverseOrder);

    ASSERT_EQ(config.pipelines.size(), 2ul);

    const auto& tool = config.pipelines.at(0);
    EXPECT_EQ(tool.name, "org/tool");
    EXPECT_EQ(tool.version, "1.0.0");
    EXPECT_TRUE(tool.deleteWorkDir);
    EXPECT_TRUE(tool.dependencies.empty());
    ASSERT_EQ(tool.parameters.size(), 2ul);
    EXPECT_EQ(tool.parameters.at(0).first, "fastq_input");
    EXPECT_FALSE(tool.parameters.at(0).second.has_value());
    EXPECT_EQ(tool.parameters.at(1).first, "min_depth");
    EXPECT_EQ(tool.parameters.at(1).second, "10");

    const auto& downstream = config.pipelines.at(1);
    EXPECT_FALSE(downstream.deleteWorkDir);
    ASSERT_EQ(downstream.dependencies.size(), 1ul);
    EXPECT_EQ(downstream.dependencies.front().name, "org/tool");
    EXPECT_EQ(downstream.dependencies.front().version, "1.0.0");
}

TEST_F(ConfigLoaderTest, AppliesDefaults) {
    const auto config = ConfigLoader::load(writeConfig(minimalConfig));

    EXPECT_DOUBLE_EQ(config.scanIntervalSeconds, constants::scan::defaultScanIntervalSeconds);
    EXPECT_FALSE(config.analyzeRunsInReverseOrder);
    EXPECT_TRUE(config.requireReadyMarker);
    EXPECT_EQ(config.pipelineExecutable, constants::dispatch::DEFAULT_EXECUTABLE);
    EXPECT_EQ(config.pipelineProfile, constants::dispatch::DEFAULT_PROFILE);
    EXPECT_FALSE(config.pipelineTimeoutSeconds.has_value());
    EXPECT_TRUE(config.pipelines.empty());
}

TEST_F(ConfigLoaderTest, ReadsExecutionSettings) {
    const auto config = ConfigLoader::load(writeConfig(R"({
        "fastq_by_run_dir": "/data/fastq",
        "analysis_output_dir": "/data/analysis",
        "analysis_work_dir": "/scratch/work",
        "require_symlinks_complete": false,
        "pipeline_executable": "/opt/bin/nextflow",
        "pipeline_profile": "docker",
        "pipeline_cache_dir": "/opt/envs",
        "pipeline_timeout_seconds": 7200
    })"));

    EXPECT_FALSE(config.requireReadyMarker);
    EXPECT_EQ(config.pipelineExecutable, "/opt/bin/nextflow");
    EXPECT_EQ(config.pipelineProfile, "docker");
    EXPECT_EQ(config.pipelineCacheDir, std::filesystem::path("/opt/envs"));
    ASSERT_TRUE(config.pipelineTimeoutSeconds.has_value());
    EXPECT_DOUBLE_EQ(config.pipelineTimeoutSeconds.value(), 7200.0);
}

TEST_F(ConfigLoaderTest, InvalidScanIntervalFallsBackToDefault) {
    const auto negative = ConfigLoader::load(writeConfig(R"({
        "fastq_by_run_dir": "/a", "analysis_output_dir": "/b", "analysis_work_dir": "/c",
        "scan_interval_seconds": -5
    })"));
    EXPECT_DOUBLE_EQ(negative.scanIntervalSeconds, constants::scan::defaultScanIntervalSeconds);

    const auto text = ConfigLoader::load(writeConfig(R"({
        "fastq_by_run_dir": "/a", "analysis_output_dir": "/b", "analysis_work_dir": "/c",
        "scan_interval_seconds": "hourly"
    })"));
    EXPECT_DOUBLE_EQ(text.scanIntervalSeconds, constants::scan::defaultScanIntervalSeconds);
}

TEST_F(ConfigLoaderTest, MissingRequiredKeyThrows) {
    EXPECT_THROW(ConfigLoader::load(writeConfig(R"({
        "fastq_by_run_dir": "/a", "analysis_output_dir": "/b"
    })")),
                 ConfigurationError);
}

TEST_F(ConfigLoaderTest, PipelineWithoutVersionThrows) {
    EXPECT_THROW(ConfigLoader::load(writeConfig(R"({
        "fastq_by_run_dir": "/a", "analysis_output_dir": "/b", "analysis_work_dir": "/c",
        "pipelines": [{"pipeline_name": "org/tool"}]
    })")),
                 ConfigurationError);
}

TEST_F(ConfigLoaderTest, NestedParameterValueThrows) {
    EXPECT_THROW(ConfigLoader::load(writeConfig(R"({
        "fastq_by_run_dir": "/a", "analysis_output_dir": "/b", "analysis_work_dir": "/c",
        "pipelines": [{
            "pipeline_name": "org/tool", "pipeline_version": "1.0.0",
            "pipeline_parameters": {"nested": {"key": "value"}}
        }]
    })")),
                 ConfigurationError);
}

TEST_F(ConfigLoaderTest, NonBooleanFlagThrows) {
    EXPECT_THROW(ConfigLoader::load(writeConfig(R"({
        "fastq_by_run_dir": "/a", "analysis_output_dir": "/b", "analysis_work_dir": "/c",
        "analyze_runs_in_reverse_order": "sometimes"
    })")),
                 ConfigurationError);
}

TEST_F(ConfigLoaderTest, NonPositiveTimeoutThrows) {
    EXPECT_THROW(ConfigLoader::load(writeConfig(R"({
        "fastq_by_run_dir": "/a", "analysis_output_dir": "/b", "analysis_work_dir": "/c",
        "pipeline_timeout_seconds": 0
    })")),
                 ConfigurationError);
}

TEST_F(ConfigLoaderTest, MalformedFileThrows) {
    EXPECT_THROW(ConfigLoader::load(writeConfig("{\"fastq_by_run_dir\": ")), ConfigurationError);
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW(ConfigLoader::load(tempDir.get() / "missing.json"), ConfigurationError);
}

TEST_F(ConfigLoaderTest, ReloadKeepsLastGoodConfigOnError) {
    const auto configPath = writeConfig(minimalConfig);
    const auto lastGood = ConfigLoader::load(configPath);

    writeConfig("{ not json");
    const auto reloaded = ConfigLoader::reload(configPath, lastGood);

    EXPECT_EQ(reloaded.fastqByRunDir, lastGood.fastqByRunDir);
    EXPECT_EQ(reloaded.analysisWorkDir, lastGood.analysisWorkDir);
}

TEST_F(ConfigLoaderTest, ReloadPicksUpChanges) {
    const auto configPath = writeConfig(minimalConfig);
    const auto lastGood = ConfigLoader::load(configPath);

    writeConfig(R"({
        "fastq_by_run_dir": "/other/fastq", "analysis_output_dir": "/b", "analysis_work_dir": "/c"
    })");
    const auto reloaded = ConfigLoader::reload(configPath, lastGood);

    EXPECT_EQ(reloaded.fastqByRunDir, std::filesystem::path("/other/fastq"));
}
