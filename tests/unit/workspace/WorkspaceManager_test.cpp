#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "mocks/MockVcsClient.h"
#include "core/util/FileUtils.h"
#include "core/workspace/core/WorkspaceManager.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace planrunner::core::workspace {

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using util::FileUtils;

class WorkspaceManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string pattern = (fs::temp_directory_path() / "planrunner_wsmgr_XXXXXX").string();
        ASSERT_NE(mkdtemp(pattern.data()), nullptr);
        testDir = FileUtils::normalizePath(pattern);
        repoRoot = testDir / "repo";
        fs::create_directories(repoRoot / "tasks");
        planFile = repoRoot / "tasks" / "5.plan.md";
        FileUtils::writeFileAtomic(planFile, "---\nid: 5\n---\n");

        vcs = std::make_shared<NiceMock<vcs::test::MockVcsClient>>();
        ON_CALL(*vcs, repositoryRoot(_)).WillByDefault(Return(repoRoot));
        ON_CALL(*vcs, remoteUrl(_, _)).WillByDefault(Return(std::string("git@github.com:acme/app.git")));
        ON_CALL(*vcs, clone(_, _)).WillByDefault(Invoke([](const std::string&, const fs::path& target) {
            fs::create_directories(target);
        }));

        registry = std::make_shared<WorkspaceRegistry>(testDir / "workspaces.json", nullptr);
        locks = std::make_shared<WorkspaceLockManager>(
            testDir / "locks", [this](pid_t pid) { return alive.count(pid) > 0; }, 100, std::string("host"));

        config.cloneLocation = testDir / "clones";
        config.repositoryUrl = "https://github.com/acme/app.git";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    std::unique_ptr<WorkspaceManager> makeManager() {
        return std::make_unique<WorkspaceManager>(config, repoRoot, vcs, registry, locks);
    }

    std::string writeScript(const std::string& body) {
        auto script = testDir / "make-workspace.sh";
        FileUtils::writeFileAtomic(script, "#!/bin/sh\n" + body);
        fs::permissions(script, fs::perms::owner_all);
        return script.string();
    }

    fs::path testDir;
    fs::path repoRoot;
    fs::path planFile;
    std::set<pid_t> alive{100};
    std::shared_ptr<NiceMock<vcs::test::MockVcsClient>> vcs;
    std::shared_ptr<WorkspaceRegistry> registry;
    std::shared_ptr<WorkspaceLockManager> locks;
    config::WorkspaceCreationConfig config;
};

TEST_F(WorkspaceManagerTest, ScriptStrategyRegistersPrintedPath) {
    // Given a script that creates a directory named after the task
    config.scriptPath = writeScript(
        "dir=\"" + testDir.string() + "/ws-$PLANRUNNER_TASK_ID\"\n"
        "mkdir -p \"$dir\"\n"
        "basename \"$PLANRUNNER_PLAN_FILE_PATH\" > \"$dir/plan-name\"\n"
        "echo 'creating workspace'\n"
        "echo \"$dir\"\n");

    // When
    CreateWorkspaceOptions options;
    options.taskId = "task-7";
    options.planFilePath = planFile;
    options.planId = 5;
    auto workspace = makeManager()->create(options);

    // Then
    ASSERT_TRUE(workspace.has_value());
    EXPECT_EQ(workspace->path, (testDir / "ws-task-7").string());
    EXPECT_EQ(FileUtils::readFile(testDir / "ws-task-7" / "plan-name"), "5.plan.md\n");

    auto entry = registry->get(workspace->path);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->taskId, std::optional<std::string>("task-7"));
    EXPECT_EQ(entry->planId, std::optional<int>(5));
    EXPECT_EQ(entry->repositoryId, std::optional<std::string>("github.com/acme/app"));
    EXPECT_EQ(entry->originalPlanFilePath, std::optional<std::string>(FileUtils::normalizePath(planFile)));
    EXPECT_TRUE(entry->createdAt.has_value());
}

TEST_F(WorkspaceManagerTest, ScriptReturningTrackedWorkspaceKeepsItsMetadata) {
    // Given a workspace already tracked with a name and an issue
    const fs::path existing = testDir / "ws-shared";
    fs::create_directories(existing);
    WorkspaceMetadataPatch naming;
    naming.name = FieldPatch<std::string>::set("shared checkout");
    naming.issueUrls = FieldPatch<std::vector<std::string>>::set({"https://example.com/issues/1"});
    registry->patchMetadata(existing.string(), naming);
    config.scriptPath = writeScript("echo \"" + existing.string() + "\"\n");

    // When
    CreateWorkspaceOptions options;
    options.taskId = "task-8";
    auto workspace = makeManager()->create(options);

    // Then
    ASSERT_TRUE(workspace.has_value());
    auto entry = registry->get(existing.string());
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, std::optional<std::string>("shared checkout"));
    EXPECT_EQ(entry->issueUrls, (std::vector<std::string>{"https://example.com/issues/1"}));
    EXPECT_EQ(entry->taskId, std::optional<std::string>("task-8"));
    EXPECT_FALSE(entry->createdAt.has_value());
}

TEST_F(WorkspaceManagerTest, ScriptFailuresReturnNothing) {
    CreateWorkspaceOptions options;
    options.taskId = "task-7";

    config.scriptPath = writeScript("echo relative/path\n");
    EXPECT_FALSE(makeManager()->create(options).has_value());

    config.scriptPath = writeScript("echo /nonexistent/planrunner/ws\n");
    EXPECT_FALSE(makeManager()->create(options).has_value());

    config.scriptPath = writeScript("exit 3\n");
    EXPECT_FALSE(makeManager()->create(options).has_value());

    EXPECT_TRUE(registry->readAll().empty());
}

TEST_F(WorkspaceManagerTest, EmptyTaskIdIsRejected) {
    EXPECT_FALSE(makeManager()->create(CreateWorkspaceOptions{}).has_value());
}

TEST_F(WorkspaceManagerTest, ManagedStrategyClonesBranchesAndCopiesPlan) {
    config::PostCommand marker;
    marker.title = "marker";
    marker.command = "echo \"$PLANRUNNER_TASK_ID\" > marker.txt";
    config.postCloneCommands = {marker};

    const fs::path expectedTarget = testDir / "clones" / "app-task-9";
    EXPECT_CALL(*vcs, clone("https://github.com/acme/app.git", expectedTarget));
    EXPECT_CALL(*vcs, createBranch(expectedTarget, "planrunner/task-9"));

    CreateWorkspaceOptions options;
    options.taskId = "task-9";
    options.planFilePath = planFile;
    options.lockAfterCreate = true;
    auto workspace = makeManager()->create(options);

    ASSERT_TRUE(workspace.has_value());
    EXPECT_EQ(workspace->path, expectedTarget.string());
    EXPECT_EQ(workspace->branch, std::optional<std::string>("planrunner/task-9"));
    EXPECT_EQ(workspace->planFilePathInWorkspace,
              std::optional<std::string>((expectedTarget / "tasks" / "5.plan.md").string()));
    EXPECT_TRUE(fs::exists(expectedTarget / "tasks" / "5.plan.md"));
    EXPECT_EQ(FileUtils::readFile(expectedTarget / "marker.txt"), "task-9\n");
    ASSERT_TRUE(workspace->lock.has_value());
    EXPECT_TRUE(locks->isLocked(workspace->path));
    EXPECT_TRUE(registry->get(workspace->path).has_value());
}

TEST_F(WorkspaceManagerTest, FailedPostCloneCommandRemovesClone) {
    config::PostCommand failing;
    failing.title = "install";
    failing.command = "exit 1";
    config.postCloneCommands = {failing};

    CreateWorkspaceOptions options;
    options.taskId = "task-9";
    auto workspace = makeManager()->create(options);

    EXPECT_FALSE(workspace.has_value());
    EXPECT_FALSE(fs::exists(testDir / "clones" / "app-task-9"));
    EXPECT_TRUE(registry->readAll().empty());
}

TEST_F(WorkspaceManagerTest, PostCloneCommandsRunRelativeToClone) {
    config::PostCommand prepare;
    prepare.title = "prepare";
    prepare.command = "mkdir sub";
    config::PostCommand optional;
    optional.title = "optional";
    optional.command = "exit 5";
    optional.allowFailure = true;
    config::PostCommand where;
    where.title = "where";
    where.command = "pwd -P > out";
    where.workingDirectory = "sub";
    config.postCloneCommands = {prepare, optional, where};

    CreateWorkspaceOptions options;
    options.taskId = "task-9";
    auto workspace = makeManager()->create(options);

    // The allowed failure keeps the clone and the relative directory is inside it
    ASSERT_TRUE(workspace.has_value());
    const fs::path clone = testDir / "clones" / "app-task-9";
    EXPECT_EQ(FileUtils::readFile(clone / "sub" / "out"), fs::canonical(clone / "sub").string() + "\n");
    EXPECT_FALSE(fs::exists(repoRoot / "sub"));
    EXPECT_TRUE(registry->get(workspace->path).has_value());
}

TEST_F(WorkspaceManagerTest, UnlockableCloneIsRemovedAndNotRegistered) {
    // Given another live process already holding the target path
    const fs::path target = testDir / "clones" / "app-task-9";
    alive.insert(200);
    WorkspaceLockManager other(testDir / "locks", [this](pid_t pid) { return alive.count(pid) > 0; }, 200,
                               std::string("host"));
    other.acquire(target.string());

    CreateWorkspaceOptions options;
    options.taskId = "task-9";
    options.lockAfterCreate = true;
    auto workspace = makeManager()->create(options);

    EXPECT_FALSE(workspace.has_value());
    EXPECT_FALSE(fs::exists(target));
    EXPECT_TRUE(registry->readAll().empty());
    EXPECT_EQ(locks->getLockInfo(target.string())->pid, 200);
}

TEST_F(WorkspaceManagerTest, ExistingTargetIsNotOverwritten) {
    fs::create_directories(testDir / "clones" / "app-task-9");
    EXPECT_CALL(*vcs, clone(_, _)).Times(0);

    CreateWorkspaceOptions options;
    options.taskId = "task-9";
    EXPECT_FALSE(makeManager()->create(options).has_value());
}

class WorkspaceAutoSelectorTest : public WorkspaceManagerTest {
protected:
    // Writes the registry directly so updatedAt values are controlled
    std::string addWorkspace(const std::string& name, const std::string& repositoryId,
                             const std::string& updatedAt, std::optional<int> planId = std::nullopt) {
        auto dir = testDir / name;
        fs::create_directories(dir);
        WorkspaceEntry entry;
        entry.workspacePath = FileUtils::normalizePath(dir);
        entry.repositoryId = repositoryId;
        entry.updatedAt = updatedAt;
        entry.planId = planId;
        entries[entry.workspacePath] = entry;

        nlohmann::json root = nlohmann::json::object();
        for (const auto& [path, value] : entries) {
            root[path] = value;
        }
        FileUtils::writeFileAtomic(registry->trackingFile(), root.dump(2));
        return entry.workspacePath;
    }

    std::map<std::string, WorkspaceEntry> entries;
};

TEST_F(WorkspaceAutoSelectorTest, PicksLeastRecentlyUpdatedUnlockedWorkspace) {
    const auto newest = addWorkspace("ws-new", "github.com/acme/app", "2026-03-01T00:00:00.000Z");
    const auto oldest = addWorkspace("ws-old", "github.com/acme/app", "2026-01-01T00:00:00.000Z");
    const auto middle = addWorkspace("ws-mid", "github.com/acme/app", "2026-02-01T00:00:00.000Z");
    addWorkspace("ws-other", "github.com/acme/other", "2025-01-01T00:00:00.000Z");

    WorkspaceAutoSelector selector(registry, locks);

    auto chosen = selector.select("github.com/acme/app");
    ASSERT_TRUE(chosen.has_value());
    EXPECT_EQ(chosen->workspacePath, oldest);

    // A live lock takes the workspace out of the pool
    locks->acquire(oldest);
    chosen = selector.select("github.com/acme/app");
    ASSERT_TRUE(chosen.has_value());
    EXPECT_EQ(chosen->workspacePath, middle);

    locks->acquire(middle);
    locks->acquire(newest);
    EXPECT_FALSE(selector.select("github.com/acme/app").has_value());
}

TEST_F(WorkspaceAutoSelectorTest, PrefersWorkspaceOfSamePlan) {
    addWorkspace("ws-old", "repo", "2026-01-01T00:00:00.000Z", 3);
    const auto planned = addWorkspace("ws-planned", "repo", "2026-02-01T00:00:00.000Z", 8);

    WorkspaceAutoSelector selector(registry, locks);
    auto chosen = selector.select("repo", 8);

    ASSERT_TRUE(chosen.has_value());
    EXPECT_EQ(chosen->workspacePath, planned);
}

TEST_F(WorkspaceAutoSelectorTest, StaleLockIsClearedDuringSelection) {
    const auto only = addWorkspace("ws", "repo", "2026-01-01T00:00:00.000Z");

    // Lock taken by a process that has since exited
    WorkspaceLockManager deadOwner(testDir / "locks", [](pid_t) { return false; }, 555, std::string("host"));
    deadOwner.acquire(only);

    WorkspaceAutoSelector selector(registry, locks);
    auto chosen = selector.select("repo");

    ASSERT_TRUE(chosen.has_value());
    EXPECT_EQ(chosen->workspacePath, only);
    EXPECT_FALSE(locks->getLockInfo(only).has_value());
}

} // namespace planrunner::core::workspace
