#include <gtest/gtest.h>

// Standard
#include <string>

// Boost
#include <boost/property_tree/ptree.hpp>

// Internal
#include "Logger.hpp"

class LoggerTest : public testing::Test {
   protected:
    void TearDown() override { Logger::setLogLevel(LogLevel::INFO); }
};

TEST_F(LoggerTest, EventIsSingleLineJsonWithTypeFirst) {
    boost::property_tree::ptree fields;
    fields.put("sequencing_run_id", "RUN");
    fields.put("pipeline_version", "1.0.0");

    testing::internal::CaptureStderr();
    Logger::logEvent(LogLevel::INFO, "analysis_started", fields);
    const std::string output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("[INFO]"), std::string::npos);
    EXPECT_NE(output.find(R"({"event_type":"analysis_started","sequencing_run_id":"RUN",)"
                          R"("pipeline_version":"1.0.0"})"),
              std::string::npos);
    EXPECT_EQ(output.find('\n'), output.size() - 1);
}

TEST_F(LoggerTest, ScalarFieldsAreWrittenAsStrings) {
    boost::property_tree::ptree fields;
    fields.put("analysis_complete", true);
    fields.put("scan_duration_seconds", 1.5);

    testing::internal::CaptureStderr();
    Logger::logEvent(LogLevel::INFO, "scan_complete", fields);
    const std::string output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find(R"("analysis_complete":"true")"), std::string::npos);
    EXPECT_NE(output.find(R"("scan_duration_seconds":"1.5")"), std::string::npos);
}

TEST_F(LoggerTest, EventsBelowLevelAreDropped) {
    Logger::setLogLevel(LogLevel::WARNING);

    testing::internal::CaptureStderr();
    Logger::logEvent(LogLevel::INFO, "scan_start");
    Logger::log(LogLevel::DEBUG, "not shown");
    const std::string output = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(output.empty());
}

TEST_F(LoggerTest, LevelCanBeSetByName) {
    Logger::setLogLevel("error");

    testing::internal::CaptureStderr();
    Logger::log(LogLevel::WARNING, "hidden");
    Logger::log(LogLevel::ERROR, "shown");
    const std::string output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(output.find("hidden"), std::string::npos);
    EXPECT_NE(output.find("[ERROR]"), std::string::npos);
}
