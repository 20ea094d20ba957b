#include <gtest/gtest.h>

// Standard
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Internal
#include "Constants.hpp"
#include "ProcessExecutor.hpp"
#include "TestUtilities.hpp"

using namespace autorun::dispatch;

class BoostProcessExecutorTest : public testing::Test {
   protected:
    auto runShell(const std::string& script,
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> ProcessResult {
        return executor.execute({"/bin/sh", "-c", script}, tempDir.get(), outputLogPath(),
                                timeout);
    }

    [[nodiscard]] auto outputLogPath() const -> std::filesystem::path {
        return tempDir.get() / constants::dispatch::PROCESS_OUTPUT_LOG;
    }

    testutils::TemporaryDirectory tempDir;
    BoostProcessExecutor executor;
};

TEST_F(BoostProcessExecutorTest, CapturesOutputOfSuccessfulCommand) {
    const auto result = runShell("echo hello");

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_NE(result.output.find("hello"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(outputLogPath()));
}

TEST_F(BoostProcessExecutorTest, ReportsNonZeroExitCode) {
    const auto result = runShell("echo oops 1>&2; exit 3");

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_FALSE(result.timedOut);
    EXPECT_NE(result.output.find("oops"), std::string::npos);
}

TEST_F(BoostProcessExecutorTest, RunsInWorkingDirectory) {
    const auto result = runShell("pwd");

    ASSERT_TRUE(result.succeeded());
    EXPECT_NE(result.output.find(std::filesystem::canonical(tempDir.get()).string()),
              std::string::npos);
}

TEST_F(BoostProcessExecutorTest, ResolvesProgramOnSearchPath) {
    const auto result =
        executor.execute({"sh", "-c", "exit 0"}, tempDir.get(), outputLogPath(), std::nullopt);

    EXPECT_TRUE(result.succeeded());
}

TEST_F(BoostProcessExecutorTest, TerminatesCommandAfterTimeout) {
    const auto start = std::chrono::steady_clock::now();
    const auto result = runShell("sleep 10", std::chrono::milliseconds(200));

    EXPECT_TRUE(result.timedOut);
    EXPECT_FALSE(result.succeeded());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST_F(BoostProcessExecutorTest, MissingExecutableIsLaunchFailure) {
    const auto result = executor.execute({"autorun-no-such-program"}, tempDir.get(),
                                         outputLogPath(), std::nullopt);

    EXPECT_EQ(result.exitCode, constants::dispatch::launchFailureExitCode);
    EXPECT_FALSE(result.succeeded());
}

TEST_F(BoostProcessExecutorTest, EmptyCommandThrows) {
    EXPECT_THROW(executor.execute({}, tempDir.get(), outputLogPath(), std::nullopt),
                 std::invalid_argument);
}

TEST_F(BoostProcessExecutorTest, InterruptOfDaemonGroupDoesNotReachCommand) {
    // Signal only this test process and its children, never the process that started it
    const pid_t originalGroup = getpgrp();
    if (originalGroup != getpid()) {
        ASSERT_EQ(setpgid(0, 0), 0);
    }
    const auto previousHandler = std::signal(SIGINT, [](int /*sig*/) {});

    std::thread interrupter([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        kill(0, SIGINT);
    });
    const auto result = runShell("sleep 1; echo finished; exit 0");
    interrupter.join();

    std::signal(SIGINT, previousHandler);
    if (originalGroup != getpid()) {
        setpgid(0, originalGroup);
    }

    EXPECT_EQ(result.exitCode, 0);
    EXPECT_NE(result.output.find("finished"), std::string::npos);
}
