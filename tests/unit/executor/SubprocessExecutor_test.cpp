#include "gtest/gtest.h"
#include "planrunner/executor/SubprocessExecutor.hpp"
#include "core/util/FileUtils.h"
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace planrunner {
namespace executor {

using core::util::FileUtils;

class SubprocessExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string pattern = (fs::temp_directory_path() / "planrunner_executor_XXXXXX").string();
        ASSERT_NE(mkdtemp(pattern.data()), nullptr);
        testDir = pattern;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    // Executor whose "agent" is a shell script
    static SubprocessExecutor shellExecutor(ExecutorKind kind, const std::string& script) {
        config::ExecutorSettings settings;
        settings.command = "/bin/sh";
        settings.args = {"-c", script};
        return SubprocessExecutor(kind, settings);
    }

    fs::path testDir;
};

TEST_F(SubprocessExecutorTest, CapabilitiesDifferPerExecutor) {
    auto claude = SubprocessExecutor::capabilitiesFor(ExecutorKind::CLAUDE_CODE);
    auto codex = SubprocessExecutor::capabilitiesFor(ExecutorKind::CODEX_CLI);

    EXPECT_TRUE(claude.supportsTerminalInput);
    EXPECT_FALSE(claude.requiresPrompt);
    EXPECT_FALSE(codex.supportsTerminalInput);
    EXPECT_TRUE(codex.requiresPrompt);
    EXPECT_TRUE(claude.supportsBatch);
    EXPECT_TRUE(codex.supportsBatch);
}

TEST_F(SubprocessExecutorTest, CommandLineDependsOnInteractivity) {
    config::ExecutorSettings settings;
    settings.command = "claude";
    settings.args = {"--print", "--output-format", "json"};
    settings.model = "opus";
    SubprocessExecutor executor(ExecutorKind::CLAUDE_CODE, settings);

    EXPECT_EQ(executor.buildCommandLine(std::string("do it"), false),
              (std::vector<std::string>{"claude", "--print", "--output-format", "json", "--model", "opus"}));
    EXPECT_EQ(executor.buildCommandLine(std::string("do it"), true),
              (std::vector<std::string>{"claude", "--model", "opus", "do it"}));
    EXPECT_EQ(executor.buildCommandLine(std::nullopt, true), (std::vector<std::string>{"claude", "--model", "opus"}));
}

TEST_F(SubprocessExecutorTest, MissingPromptFailsForPromptOnlyExecutor) {
    auto executor = shellExecutor(ExecutorKind::CODEX_CLI, "exit 0");

    auto result = executor.execute(std::nullopt, ExecutionContext{});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "prompt required: codex-cli cannot start without a prompt");
}

TEST_F(SubprocessExecutorTest, PipesPromptAndExportsContext) {
    auto executor = shellExecutor(
        ExecutorKind::CODEX_CLI,
        "prompt=$(cat); pwd -P > where.txt; "
        "printf 'working...\\n{\"prompt\":\"%s\",\"mode\":\"%s\",\"plan\":\"%s\",\"batch\":\"%s\"}\\n' "
        "\"$prompt\" \"$PLANRUNNER_EXECUTION_MODE\" \"$PLANRUNNER_PLAN_ID\" \"$PLANRUNNER_BATCH_MODE\"");

    ExecutionContext context;
    context.planId = 12;
    context.workspacePath = testDir.string();
    context.batchMode = true;
    auto result = executor.execute(std::string("finish the tasks"), context);

    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(result.exitCode, 0);
    ASSERT_TRUE(result.structuredOutput.has_value());
    EXPECT_EQ((*result.structuredOutput)["prompt"], "finish the tasks");
    EXPECT_EQ((*result.structuredOutput)["mode"], "normal");
    EXPECT_EQ((*result.structuredOutput)["plan"], "12");
    EXPECT_EQ((*result.structuredOutput)["batch"], "1");
    EXPECT_EQ(FileUtils::readFile(testDir / "where.txt"), fs::canonical(testDir).string() + "\n");
}

TEST_F(SubprocessExecutorTest, UnwrapsResultEnvelope) {
    FileUtils::writeFileAtomic(testDir / "reply.json",
                               R"({"type":"result","subtype":"success","result":"Findings:\n{\"issues\":[]}"})");
    auto executor = shellExecutor(ExecutorKind::CLAUDE_CODE, "cat > /dev/null; cat reply.json");

    ExecutionContext context;
    context.workspacePath = testDir.string();
    context.mode = ExecutionMode::REVIEW;
    auto result = executor.execute(std::string("review"), context);

    ASSERT_TRUE(result.success) << result.errorMessage;
    ASSERT_TRUE(result.structuredOutput.has_value());
    EXPECT_TRUE(result.structuredOutput->contains("issues"));
    EXPECT_FALSE(result.structuredOutput->contains("type"));
}

TEST_F(SubprocessExecutorTest, NonZeroExitCarriesStderr) {
    auto executor = shellExecutor(ExecutorKind::CODEX_CLI, "cat > /dev/null; echo boom >&2; exit 5");

    auto result = executor.execute(std::string("go"), ExecutionContext{});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exitCode, 5);
    EXPECT_NE(result.errorMessage.find("exited with code 5"), std::string::npos);
    EXPECT_NE(result.errorMessage.find("boom"), std::string::npos);
    EXPECT_FALSE(result.structuredOutput.has_value());
}

TEST_F(SubprocessExecutorTest, InactivityTimeoutFromContext) {
    auto executor = shellExecutor(ExecutorKind::CODEX_CLI, "cat > /dev/null; sleep 10");

    ExecutionContext context;
    context.inactivityTimeout = std::chrono::milliseconds(200);
    auto result = executor.execute(std::string("go"), context);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.timedOut);
    EXPECT_NE(result.errorMessage.find("terminated after inactivity"), std::string::npos);
}

} // namespace executor
} // namespace planrunner
