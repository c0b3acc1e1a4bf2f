#include "gtest/gtest.h"
#include "core/error/Exceptions.h"
#include "core/review/util/ReviewOutputParser.h"

namespace planrunner::core::review {

using nlohmann::json;

TEST(ReviewOutputParserTest, ParsesIssuesAndLists) {
    json output = {
        {"issues", json::array({
            {{"severity", "major"}, {"category", "bug"}, {"content", "off by one"},
             {"file", "src/a.cpp"}, {"line", 12}, {"suggestion", "use <"}},
            {{"severity", "info"}, {"category", "style"}, {"content", "naming"}, {"file", ""}, {"line", nullptr}},
        })},
        {"recommendations", {"add tests"}},
        {"actionItems", json::array()},
    };

    auto parsed = ReviewOutputParser::parse(output, "codex-cli");

    ASSERT_EQ(parsed.issues.size(), 2u);
    EXPECT_EQ(parsed.issues[0].severity, ReviewSeverity::MAJOR);
    EXPECT_EQ(parsed.issues[0].category, ReviewCategory::BUG);
    EXPECT_EQ(parsed.issues[0].file, std::optional<std::string>("src/a.cpp"));
    EXPECT_EQ(parsed.issues[0].line, std::optional<int>(12));
    EXPECT_EQ(parsed.issues[0].executor, "codex-cli");
    // An empty file name counts as no file
    EXPECT_FALSE(parsed.issues[1].file.has_value());
    EXPECT_FALSE(parsed.issues[1].line.has_value());
    EXPECT_EQ(parsed.recommendations, (std::vector<std::string>{"add tests"}));
    EXPECT_TRUE(parsed.actionItems.empty());
}

TEST(ReviewOutputParserTest, RejectsSchemaViolations) {
    const json validIssue = {{"severity", "minor"}, {"category", "testing"}, {"content", "x"}};
    auto withIssue = [&](json issue) { return json{{"issues", json::array({issue})}}; };

    std::vector<json> invalid = {
        json::array(),
        json::object(),
        json{{"issues", "none"}},
        json{{"issues", json::array()}, {"verdict", "ok"}},
        json{{"issues", json::array()}, {"recommendations", {1, 2}}},
        withIssue("text"),
        withIssue({{"category", "bug"}, {"content", "x"}}),
        withIssue({{"severity", "blocker"}, {"category", "bug"}, {"content", "x"}}),
        withIssue({{"severity", "minor"}, {"category", "docs"}, {"content", "x"}}),
        withIssue({{"severity", "minor"}, {"category", "bug"}}),
        withIssue({{"severity", "minor"}, {"category", "bug"}, {"content", "x"}, {"line", -1}}),
        withIssue({{"severity", "minor"}, {"category", "bug"}, {"content", "x"}, {"line", "12"}}),
        withIssue({{"severity", "minor"}, {"category", "bug"}, {"content", "x"}, {"extra", true}}),
    };

    EXPECT_NO_THROW(ReviewOutputParser::parse(withIssue(validIssue), "claude-code"));
    for (const auto& output : invalid) {
        EXPECT_THROW(ReviewOutputParser::parse(output, "claude-code"), ValidationException) << output.dump();
    }
}

TEST(ReviewOutputParserTest, ErrorNamesExecutorAndIssue) {
    json output = {{"issues", json::array({{{"severity", "urgent"}, {"category", "bug"}, {"content", "x"}}})}};
    try {
        ReviewOutputParser::parse(output, "codex-cli");
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_NE(std::string(e.what()).find("codex-cli issue 0"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("urgent"), std::string::npos);
    }
}

} // namespace planrunner::core::review
