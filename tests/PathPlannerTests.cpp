#include <gtest/gtest.h>

// Standard
#include <chrono>
#include <filesystem>
#include <string>

// Internal
#include "Constants.hpp"
#include "PathPlanner.hpp"
#include "PipelineDefinition.hpp"
#include "Utility.hpp"

using namespace autorun::pipelines;

TEST(PipelineNameTest, ShortNameDropsNamespace) {
    EXPECT_EQ(shortName("BCCDC-PHL/fluviewer-nf"), "fluviewer-nf");
    EXPECT_EQ(shortName("a/b/tool"), "tool");
    EXPECT_EQ(shortName("tool"), "tool");
}

TEST(PipelineNameTest, MinorVersionDropsPatch) {
    EXPECT_EQ(minorVersion("1.2.3"), "1.2");
    EXPECT_EQ(minorVersion("1.2"), "1");
    EXPECT_EQ(minorVersion("7"), "7");
}

TEST(PipelineDefinitionTest, SetParameterReplacesOrAppends) {
    PipelineDefinition pipeline{.name = "org/tool", .version = "1.0.0"};
    pipeline.parameters = {{"a", "1"}, {"b", std::nullopt}};

    pipeline.setParameter("b", "2");
    pipeline.setParameter("c", "3");

    ASSERT_EQ(pipeline.parameters.size(), 3ul);
    EXPECT_EQ(pipeline.parameters.at(1).first, "b");
    EXPECT_EQ(pipeline.parameters.at(1).second, "2");
    EXPECT_EQ(pipeline.parameters.at(2).first, "c");
}

TEST(PathPlannerTest, OutputDirIsKeyedByShortNameAndMinorVersion) {
    const auto outputDir = PathPlanner::outputDir("/data/analysis", "RUN", "tool", "1.0");

    EXPECT_EQ(outputDir, std::filesystem::path("/data/analysis/RUN/tool-1.0-output"));
    EXPECT_EQ(PathPlanner::completionMarkerPath("/data/analysis", "RUN", "tool", "1.0"),
              outputDir / constants::pipelines::COMPLETION_MARKER);
}

TEST(PathPlannerTest, PlanPlacesArtifactsInOutputDir) {
    const auto now = std::chrono::system_clock::now();
    const auto paths = PathPlanner::plan("RUN", "tool", "1.0", "/out", "/work", now);

    const std::filesystem::path outputDir("/out/RUN/tool-1.0-output");
    EXPECT_EQ(paths.outputDir, outputDir);
    EXPECT_EQ(paths.reportPath, outputDir / "RUN_tool_report.html");
    EXPECT_EQ(paths.tracePath, outputDir / "RUN_tool_trace.tsv");
    EXPECT_EQ(paths.timelinePath, outputDir / "RUN_tool_timeline.html");
    EXPECT_EQ(paths.logPath, outputDir / "RUN_tool_nextflow.log");
    EXPECT_EQ(paths.workDir,
              std::filesystem::path("/work/work-RUN_tool_" + helper::compactTimestamp(now)));
}

TEST(PathPlannerTest, WorkDirCarriesTimestampSuffix) {
    const auto paths =
        PathPlanner::plan("RUN", "tool", "1.0", "/out", "/work", std::chrono::system_clock::now());

    const std::string name = paths.workDir.filename().string();
    const std::string prefix = PathPlanner::workDirPrefix("RUN", "tool");
    ASSERT_TRUE(helper::hasPrefix(name, prefix));
    EXPECT_EQ(name.size() - prefix.size(), constants::pipelines::workDirTimestampLength);
}

TEST(PathPlannerTest, RelativeRootsAreMadeAbsolute) {
    const auto paths = PathPlanner::plan("RUN", "tool", "1.0", "out", "work",
                                         std::chrono::system_clock::now());

    EXPECT_TRUE(paths.outputDir.is_absolute());
    EXPECT_TRUE(paths.workDir.is_absolute());
}
