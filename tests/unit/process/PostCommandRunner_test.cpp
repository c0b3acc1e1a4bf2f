#include "gtest/gtest.h"
#include "core/process/PostCommandRunner.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace planrunner::core::process {

class PostCommandRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string pattern = (fs::temp_directory_path() / "planrunner_postcmd_XXXXXX").string();
        ASSERT_NE(mkdtemp(pattern.data()), nullptr);
        baseDir = pattern;
        fs::create_directories(baseDir / "sub");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(baseDir, ec);
    }

    static config::PostCommand command(const std::string& title, const std::string& shell) {
        config::PostCommand cmd;
        cmd.title = title;
        cmd.command = shell;
        return cmd;
    }

    fs::path baseDir;
};

TEST_F(PostCommandRunnerTest, RunsInOrderWithEnvironment) {
    auto first = command("first", "echo \"$PLANRUNNER_PLAN_ID:$STEP\" >> log.txt");
    first.env["STEP"] = "one";
    auto second = command("second", "echo \"$PLANRUNNER_PLAN_ID:$STEP\" >> ../log.txt");
    second.workingDirectory = "sub";
    second.env["STEP"] = "two";

    std::vector<PostCommandOutcome> outcomes;
    bool ok = PostCommandRunner::runAll({first, second}, baseDir, {{"PLANRUNNER_PLAN_ID", "7"}}, &outcomes);

    ASSERT_TRUE(ok);
    ASSERT_EQ(outcomes.size(), 2u);
    std::ifstream in(baseDir / "log.txt");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "7:one\n7:two\n");
}

TEST_F(PostCommandRunnerTest, AllowedFailureContinues) {
    auto flaky = command("flaky", "echo broken; exit 4");
    flaky.allowFailure = true;
    auto after = command("after", "touch after.txt");

    std::vector<PostCommandOutcome> outcomes;
    bool ok = PostCommandRunner::runAll({flaky, after}, baseDir, {}, &outcomes);

    EXPECT_TRUE(ok);
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_FALSE(outcomes[0].success);
    EXPECT_TRUE(outcomes[0].allowedFailure);
    EXPECT_EQ(outcomes[0].exitCode, 4);
    EXPECT_EQ(outcomes[0].output, "broken\n");
    EXPECT_TRUE(fs::exists(baseDir / "after.txt"));
}

TEST_F(PostCommandRunnerTest, FatalFailureStopsSequence) {
    std::vector<PostCommandOutcome> outcomes;
    bool ok = PostCommandRunner::runAll({command("fails", "exit 1"), command("never", "touch never.txt")},
                                        baseDir, {}, &outcomes);

    EXPECT_FALSE(ok);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_FALSE(outcomes[0].allowedFailure);
    EXPECT_FALSE(fs::exists(baseDir / "never.txt"));
}

TEST_F(PostCommandRunnerTest, EmptyListSucceeds) {
    EXPECT_TRUE(PostCommandRunner::runAll({}, baseDir, {}));
}

} // namespace planrunner::core::process
