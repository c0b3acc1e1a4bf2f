#include "gtest/gtest.h"
#include "core/process/ProcessRunner.h"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <thread>

namespace planrunner::core::process {

using namespace std::chrono_literals;

TEST(ProcessRunnerTest, CapturesStdoutStderrAndExitCode) {
    auto result = ProcessRunner::runShell("echo out; echo err >&2; exit 3");

    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(result.stdoutText, "out\n");
    EXPECT_EQ(result.stderrText, "err\n");
    EXPECT_EQ(result.errorMessage, "exited with code 3");
}

TEST(ProcessRunnerTest, PipesStdinData) {
    ProcessOptions options;
    options.argv = {"cat"};
    options.stdinData = std::string("prompt text\nsecond line");

    auto result = ProcessRunner::run(options);

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdoutText, "prompt text\nsecond line");
}

TEST(ProcessRunnerTest, StdinDefaultsToDevNull) {
    ProcessOptions options;
    options.argv = {"cat"};
    auto result = ProcessRunner::run(options);
    EXPECT_TRUE(result.success());
    EXPECT_TRUE(result.stdoutText.empty());
}

TEST(ProcessRunnerTest, AddsEnvironmentAndWorkingDirectory) {
    ProcessOptions options;
    options.env["PLANRUNNER_TEST_VALUE"] = "42";
    options.workingDirectory = std::filesystem::temp_directory_path();

    auto result = ProcessRunner::runShell("printf '%s ' \"$PLANRUNNER_TEST_VALUE\"; pwd -P", options);

    ASSERT_TRUE(result.success()) << result.errorMessage;
    const auto expectedDir = std::filesystem::canonical(std::filesystem::temp_directory_path()).string();
    EXPECT_EQ(result.stdoutText, "42 " + expectedDir + "\n");
}

TEST(ProcessRunnerTest, MissingBinaryIsSpawnFailure) {
    ProcessOptions options;
    options.argv = {"planrunner-no-such-binary"};

    auto result = ProcessRunner::run(options);

    EXPECT_TRUE(result.spawnFailed);
    EXPECT_FALSE(result.success());
    EXPECT_NE(result.errorMessage.find("planrunner-no-such-binary"), std::string::npos);
}

TEST(ProcessRunnerTest, MissingWorkingDirectoryIsSpawnFailure) {
    ProcessOptions options;
    options.argv = {"true"};
    options.workingDirectory = "/nonexistent/planrunner/dir";

    auto result = ProcessRunner::run(options);

    EXPECT_TRUE(result.spawnFailed);
    EXPECT_NE(result.errorMessage.find("/nonexistent/planrunner/dir"), std::string::npos);
}

TEST(ProcessRunnerTest, EmptyCommandLineIsRejected) {
    auto result = ProcessRunner::run(ProcessOptions{});
    EXPECT_TRUE(result.spawnFailed);
    EXPECT_EQ(result.errorMessage, "empty command line");
}

TEST(ProcessRunnerTest, InactivityTimeoutTerminatesSilentChild) {
    ProcessOptions options;
    options.inactivityTimeout = 200ms;
    options.terminateGrace = 200ms;

    const auto start = std::chrono::steady_clock::now();
    auto result = ProcessRunner::runShell("sleep 10", options);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timedOut);
    EXPECT_FALSE(result.success());
    EXPECT_NE(result.errorMessage.find("terminated after inactivity"), std::string::npos);
    EXPECT_LT(elapsed, 5s);
}

TEST(ProcessRunnerTest, CancellationTerminatesChild) {
    ProcessOptions options;
    options.cancellation = executor::CancellationToken::create();
    options.terminateGrace = 200ms;

    std::thread canceller([token = options.cancellation] {
        std::this_thread::sleep_for(150ms);
        token->cancel();
    });
    auto result = ProcessRunner::runShell("sleep 10", options);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timedOut);
    EXPECT_EQ(result.errorMessage, "cancelled");
    EXPECT_EQ(result.termSignal, SIGTERM);
}

TEST(ProcessRunnerTest, OutputKeepsInactivityWatchdogQuiet) {
    ProcessOptions options;
    options.inactivityTimeout = 400ms;

    auto result = ProcessRunner::runShell("for i in 1 2 3 4; do echo $i; sleep 0.15; done", options);

    EXPECT_TRUE(result.success()) << result.errorMessage;
    EXPECT_EQ(result.stdoutText, "1\n2\n3\n4\n");
}

} // namespace planrunner::core::process
