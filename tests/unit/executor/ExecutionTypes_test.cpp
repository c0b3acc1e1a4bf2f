#include "gtest/gtest.h"
#include "planrunner/executor/ExecutionTypes.hpp"
#include <stdexcept>

namespace planrunner {
namespace executor {

TEST(ExecutionTypesTest, ReviewSelectionNames) {
    EXPECT_EQ(parseReviewExecutorSelection("both"),
              (std::vector<ExecutorKind>{ExecutorKind::CLAUDE_CODE, ExecutorKind::CODEX_CLI}));
    EXPECT_EQ(parseReviewExecutorSelection("claude-code"), (std::vector<ExecutorKind>{ExecutorKind::CLAUDE_CODE}));
    EXPECT_EQ(parseReviewExecutorSelection("codex-cli"), (std::vector<ExecutorKind>{ExecutorKind::CODEX_CLI}));
    EXPECT_THROW(parseReviewExecutorSelection("gemini"), std::invalid_argument);
    EXPECT_THROW(parseReviewExecutorSelection(""), std::invalid_argument);
}

TEST(ExecutionTypesTest, ExecutorKindNames) {
    EXPECT_EQ(executorKindToString(ExecutorKind::CODEX_CLI), "codex-cli");
    EXPECT_EQ(executorKindFromString("claude"), ExecutorKind::CLAUDE_CODE);
    EXPECT_EQ(executorKindFromString("codex-cli"), ExecutorKind::CODEX_CLI);
    EXPECT_FALSE(executorKindFromString("other").has_value());
}

TEST(ExecutionTypesTest, ExtractsWholeJsonDocument) {
    auto json = extractLastJsonObject("  {\"issues\": []}\n");
    ASSERT_TRUE(json.has_value());
    EXPECT_TRUE((*json)["issues"].is_array());
}

TEST(ExecutionTypesTest, ExtractsLastObjectFromProse) {
    const std::string text =
        "I'll look at the code first. {\"draft\": true}\n"
        "Here's the final report:\n"
        "{\"completedTaskIndices\": [0, 2], \"note\": \"braces } inside strings\"}\n"
        "Done.";

    auto json = extractLastJsonObject(text);

    ASSERT_TRUE(json.has_value());
    EXPECT_EQ((*json)["completedTaskIndices"], nlohmann::json::array({0, 2}));
}

TEST(ExecutionTypesTest, SkipsTrailingInvalidSpan) {
    auto json = extractLastJsonObject("{\"ok\": 1} and then {not json}");
    ASSERT_TRUE(json.has_value());
    EXPECT_EQ((*json)["ok"], 1);
}

TEST(ExecutionTypesTest, NoObjectYieldsNothing) {
    EXPECT_FALSE(extractLastJsonObject("").has_value());
    EXPECT_FALSE(extractLastJsonObject("no json here").has_value());
    EXPECT_FALSE(extractLastJsonObject("[1, 2, 3]").has_value());
}

} // namespace executor
} // namespace planrunner
