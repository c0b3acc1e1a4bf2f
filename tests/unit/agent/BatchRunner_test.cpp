#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "mocks/MockExecutor.h"
#include "mocks/TempPlanDirectory.h"
#include "core/agent/core/BatchRunner.h"
#include "core/error/Exceptions.h"
#include "core/util/FileUtils.h"

namespace planrunner::core::agent {

using executor::test::failedResult;
using executor::test::MockExecutor;
using executor::test::structuredResult;
using nlohmann::json;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

json report(std::vector<int> indices) {
    return {{"completedTaskIndices", indices}};
}

executor::ExecutionResult textResult(const std::string& output) {
    executor::ExecutionResult result;
    result.success = true;
    result.exitCode = 0;
    result.output = output;
    return result;
}

} // namespace

class BatchRunnerTest : public test::TempPlanDirectory {
protected:
    void SetUp() override {
        test::TempPlanDirectory::SetUp();
        store = std::make_shared<plan::PlanStore>(tasksDir);
        machine = std::make_shared<task::TaskStateMachine>(store);
        mockExecutor = std::make_shared<NiceMock<MockExecutor>>();
        ON_CALL(*mockExecutor, name()).WillByDefault(Return("claude-code"));

        plan::Plan plan = makePlan(7, "Batch plan", plan::PlanStatus::IN_PROGRESS);
        plan.tasks = {makeTask("parser"), makeTask("lexer"), makeTask("docs")};
        writePlan(plan);
    }

    std::shared_ptr<plan::PlanStore> store;
    std::shared_ptr<task::TaskStateMachine> machine;
    std::shared_ptr<NiceMock<MockExecutor>> mockExecutor;
};

TEST(BatchReportTest, ParsesStructuredAndTextReports) {
    EXPECT_EQ(BatchRunner::parseCompletedTaskIndices(structuredResult(report({0, 2}))),
              (std::optional<std::vector<size_t>>{{0, 2}}));
    EXPECT_EQ(BatchRunner::parseCompletedTaskIndices(textResult("Done.\n{\"completedTaskIndices\":[1]}\n")),
              (std::optional<std::vector<size_t>>{{1}}));
    EXPECT_FALSE(BatchRunner::parseCompletedTaskIndices(textResult("no report here")).has_value());
    EXPECT_FALSE(BatchRunner::parseCompletedTaskIndices(textResult("{\"other\":1}")).has_value());
}

TEST(BatchReportTest, RejectsMalformedReports) {
    EXPECT_THROW(BatchRunner::parseCompletedTaskIndices(structuredResult({{"completedTaskIndices", "all"}})),
                 ValidationException);
    EXPECT_THROW(BatchRunner::parseCompletedTaskIndices(structuredResult(report({1, -1}))), ValidationException);
    EXPECT_THROW(BatchRunner::parseCompletedTaskIndices(structuredResult({{"completedTaskIndices", {"one"}}})),
                 ValidationException);
}

TEST_F(BatchRunnerTest, RoundsRepeatUntilPlanIsComplete) {
    // Given
    EXPECT_CALL(*mockExecutor, execute(_, _))
        .WillOnce([](const std::optional<std::string>& prompt, const executor::ExecutionContext& context) {
            EXPECT_TRUE(context.batchMode);
            EXPECT_EQ(context.mode, executor::ExecutionMode::NORMAL);
            EXPECT_THAT(prompt.value_or(""), HasSubstr("### Task 2: docs"));
            return structuredResult(report({0, 2}));
        })
        .WillOnce([](const std::optional<std::string>& prompt, const executor::ExecutionContext&) {
            EXPECT_THAT(prompt.value_or(""), ::testing::Not(HasSubstr("parser")));
            return structuredResult(report({1}));
        });

    // When
    BatchRunner runner(store, machine, mockExecutor);
    auto summary = runner.run(7);

    // Then
    EXPECT_EQ(summary.rounds, 2);
    EXPECT_EQ(summary.completedTasks, (std::vector<size_t>{0, 2, 1}));
    EXPECT_TRUE(summary.planComplete);
    EXPECT_EQ(store->load(7).status, plan::PlanStatus::DONE);
}

TEST_F(BatchRunnerTest, CompletePlanNeedsNoRound) {
    plan::Plan plan = makePlan(8, "Done already", plan::PlanStatus::DONE);
    plan.tasks = {makeTask("only", true)};
    writePlan(plan);
    EXPECT_CALL(*mockExecutor, execute(_, _)).Times(0);

    auto summary = BatchRunner(store, machine, mockExecutor).run(8);

    EXPECT_EQ(summary.rounds, 0);
    EXPECT_TRUE(summary.planComplete);
}

TEST_F(BatchRunnerTest, StopsAfterConsecutiveRoundsWithoutProgress) {
    // Reporting an already finished task is not progress
    EXPECT_CALL(*mockExecutor, execute(_, _))
        .WillOnce(Return(structuredResult(report({0}))))
        .WillOnce(Return(structuredResult(report({0}))))
        .WillOnce(Return(textResult("I could not finish anything")));

    BatchRunner runner(store, machine, mockExecutor);
    try {
        runner.run(7);
        FAIL() << "expected BatchNoProgressException";
    } catch (const BatchNoProgressException& e) {
        EXPECT_EQ(e.planId(), 7);
        EXPECT_THAT(std::string(e.what()), HasSubstr("2 consecutive"));
    }
    EXPECT_TRUE(store->load(7).tasks[0].done);
    EXPECT_FALSE(store->load(7).tasks[1].done);
}

TEST_F(BatchRunnerTest, MalformedReportIsExecutorFailure) {
    ON_CALL(*mockExecutor, execute(_, _))
        .WillByDefault(Return(structuredResult({{"completedTaskIndices", "everything"}})));

    try {
        BatchRunner(store, machine, mockExecutor).run(7);
        FAIL() << "expected ExecutorFailureException";
    } catch (const ExecutorFailureException& e) {
        EXPECT_EQ(e.executorName(), "claude-code");
        EXPECT_THAT(std::string(e.what()), HasSubstr("malformed batch report"));
    }
}

TEST_F(BatchRunnerTest, UnknownTaskIndexIsRejected) {
    ON_CALL(*mockExecutor, execute(_, _)).WillByDefault(Return(structuredResult(report({0, 9}))));

    EXPECT_THROW(BatchRunner(store, machine, mockExecutor).run(7), ValidationException);
    EXPECT_FALSE(store->load(7).tasks[0].done);
}

TEST_F(BatchRunnerTest, ExecutorErrorStopsTheRun) {
    ON_CALL(*mockExecutor, execute(_, _)).WillByDefault(Return(failedResult("exited with code 1")));

    EXPECT_THROW(BatchRunner(store, machine, mockExecutor).run(7), ExecutorFailureException);
}

TEST_F(BatchRunnerTest, PostApplyCommandsRunAfterEveryRound) {
    config::PostCommand record;
    record.title = "record";
    record.command = "printf '%s\\n' \"$PLANRUNNER_PLAN_ID\" >> applied.txt";
    EXPECT_CALL(*mockExecutor, execute(_, _))
        .WillOnce(Return(structuredResult(report({0}))))
        .WillOnce(Return(structuredResult(report({1, 2}))));

    BatchRunOptions options;
    options.workspacePath = rootDir.string();
    auto summary = BatchRunner(store, machine, mockExecutor, {record}).run(7, options);

    EXPECT_TRUE(summary.planComplete);
    EXPECT_EQ(util::FileUtils::readFile(rootDir / "applied.txt"), "7\n7\n");
}

TEST_F(BatchRunnerTest, FailingPostApplyCommandStopsTheRun) {
    config::PostCommand check;
    check.title = "check";
    check.command = "exit 1";
    EXPECT_CALL(*mockExecutor, execute(_, _)).WillOnce(Return(structuredResult(report({0}))));

    BatchRunOptions options;
    options.workspacePath = rootDir.string();
    try {
        BatchRunner(store, machine, mockExecutor, {check}).run(7, options);
        FAIL() << "expected PlanRunnerException";
    } catch (const PlanRunnerException& e) {
        EXPECT_THAT(std::string(e.what()), HasSubstr("post-apply command failed"));
    }
}

} // namespace planrunner::core::agent
