#include "gtest/gtest.h"
#include "core/error/Exceptions.h"
#include "core/util/FileUtils.h"
#include "core/util/TimeUtils.h"
#include "core/workspace/core/WorkspaceLockManager.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <unistd.h>

namespace fs = std::filesystem;

namespace planrunner::core::workspace {

using util::FileUtils;
using util::TimeUtils;

class WorkspaceLockManagerTest : public ::testing::Test {
protected:
    static constexpr pid_t kOwnPid = 4242;

    void SetUp() override {
        std::string pattern = (fs::temp_directory_path() / "planrunner_locks_XXXXXX").string();
        ASSERT_NE(mkdtemp(pattern.data()), nullptr);
        lockDir = pattern;
        manager = makeManager(kOwnPid);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(lockDir, ec);
    }

    // Only pids in `alive` exist
    std::unique_ptr<WorkspaceLockManager> makeManager(pid_t pid) {
        return std::make_unique<WorkspaceLockManager>(
            lockDir, [this](pid_t candidate) { return alive.count(candidate) > 0; }, pid, std::string("host-a"));
    }

    void writeForeignLock(const std::string& workspace, pid_t pid, const std::string& host,
                          const std::string& startedAt, const std::string& type = "pid") {
        nlohmann::json j = {
            {"workspacePath", workspace}, {"type", type},         {"pid", pid},
            {"command", "other"},         {"hostname", host},     {"startedAt", startedAt},
            {"version", 2},
        };
        FileUtils::writeFileAtomic(manager->lockFilePath(workspace), j.dump());
    }

    fs::path lockDir;
    std::set<pid_t> alive{kOwnPid};
    std::unique_ptr<WorkspaceLockManager> manager;
};

TEST_F(WorkspaceLockManagerTest, LockFileNameIsStablePerPath) {
    auto a = manager->lockFilePath("/ws/project");
    EXPECT_EQ(a, manager->lockFilePath("/ws/project/"));
    EXPECT_NE(a, manager->lockFilePath("/other/project"));
    EXPECT_EQ(a.parent_path(), lockDir);
    EXPECT_EQ(a.filename().string().rfind("project-", 0), 0u);
}

TEST_F(WorkspaceLockManagerTest, AcquireAndRelease) {
    LockInfo info = manager->acquire("/ws/a", LockType::PID, "agent 12");

    EXPECT_EQ(info.pid, kOwnPid);
    EXPECT_EQ(info.hostname, "host-a");
    EXPECT_TRUE(manager->isLocked("/ws/a"));
    auto stored = manager->getLockInfo("/ws/a");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->command, "agent 12");

    // Re-acquiring our own PID lock is a no-op success
    EXPECT_TRUE(manager->tryAcquire("/ws/a").acquired);

    EXPECT_TRUE(manager->release("/ws/a"));
    EXPECT_FALSE(manager->isLocked("/ws/a"));
    EXPECT_FALSE(manager->release("/ws/a"));
}

TEST_F(WorkspaceLockManagerTest, LiveHolderCausesConflict) {
    alive.insert(777);
    writeForeignLock("/ws/a", 777, "host-a", TimeUtils::nowIso8601());

    auto result = manager->tryAcquire("/ws/a");
    EXPECT_FALSE(result.acquired);
    ASSERT_TRUE(result.holder.has_value());
    EXPECT_EQ(result.holder->pid, 777);

    try {
        manager->acquire("/ws/a");
        FAIL() << "expected LockConflictException";
    } catch (const LockConflictException& e) {
        EXPECT_EQ(e.holder().pid, 777);
        EXPECT_NE(std::string(e.what()).find("pid 777"), std::string::npos);
    }

    // Someone else's lock is not released without force
    EXPECT_FALSE(manager->release("/ws/a"));
    EXPECT_TRUE(manager->release("/ws/a", true));
}

TEST_F(WorkspaceLockManagerTest, DeadOwnerLockIsReclaimed) {
    // Given a lock held by pid 9999, which does not exist on this host
    writeForeignLock("/ws/a", 9999, "host-a", TimeUtils::nowIso8601());
    ASSERT_FALSE(manager->isLocked("/ws/a"));

    // When
    auto result = manager->tryAcquire("/ws/a");

    // Then
    EXPECT_TRUE(result.acquired);
    EXPECT_TRUE(result.reclaimedStale);
    EXPECT_EQ(manager->getLockInfo("/ws/a")->pid, kOwnPid);
}

TEST_F(WorkspaceLockManagerTest, OtherHostLockExpiresOnlyByAge) {
    writeForeignLock("/ws/a", 9999, "host-b", TimeUtils::nowIso8601());
    EXPECT_FALSE(manager->tryAcquire("/ws/a").acquired);

    auto old = std::chrono::system_clock::now() - std::chrono::hours(25);
    writeForeignLock("/ws/b", 9999, "host-b", TimeUtils::toIso8601(old));
    EXPECT_TRUE(manager->tryAcquire("/ws/b").acquired);
}

TEST_F(WorkspaceLockManagerTest, PersistentLockNeverGoesStale) {
    writeForeignLock("/ws/a", 9999, "host-a", TimeUtils::nowIso8601(), "persistent");

    EXPECT_TRUE(manager->isLocked("/ws/a"));
    EXPECT_FALSE(manager->tryAcquire("/ws/a").acquired);
    EXPECT_FALSE(manager->clearStaleLock("/ws/a"));
}

TEST_F(WorkspaceLockManagerTest, PersistentLockOutlivesItsCreatorUntilReleased) {
    // Given a persistent lock taken by a process that has since exited
    auto cli = makeManager(7659);
    cli->acquire("/ws/a", LockType::PERSISTENT, "planrunner workspace lock");

    // Then another process can neither reclaim it nor acquire the workspace
    auto next = makeManager(7660);
    EXPECT_TRUE(next->isLocked("/ws/a"));
    EXPECT_THROW(next->acquire("/ws/a"), LockConflictException);

    // And a plain release from any process removes it
    EXPECT_TRUE(next->release("/ws/a"));
    EXPECT_FALSE(next->isLocked("/ws/a"));
}

TEST_F(WorkspaceLockManagerTest, StalePidLockIsReleasedWithoutForce) {
    writeForeignLock("/ws/a", 9999, "host-a", TimeUtils::nowIso8601());

    EXPECT_TRUE(manager->release("/ws/a"));
    EXPECT_FALSE(manager->getLockInfo("/ws/a").has_value());
}

TEST_F(WorkspaceLockManagerTest, UnreadableLockFileIsStale) {
    FileUtils::writeFileAtomic(manager->lockFilePath("/ws/a"), "{not json");

    EXPECT_FALSE(manager->isLocked("/ws/a"));
    EXPECT_TRUE(manager->tryAcquire("/ws/a").acquired);
}

TEST_F(WorkspaceLockManagerTest, LocksAreExclusiveBetweenManagers) {
    alive.insert(5151);
    auto other = makeManager(5151);

    ASSERT_TRUE(manager->tryAcquire("/ws/a").acquired);
    EXPECT_FALSE(other->tryAcquire("/ws/a").acquired);
    EXPECT_TRUE(other->tryAcquire("/ws/b").acquired);
}

TEST_F(WorkspaceLockManagerTest, ScopedLockReleasesOnExit) {
    {
        ScopedWorkspaceLock scoped(*manager, "/ws/a", manager->acquire("/ws/a"));
        EXPECT_TRUE(manager->isLocked("/ws/a"));
    }
    EXPECT_FALSE(manager->isLocked("/ws/a"));

    {
        ScopedWorkspaceLock scoped(*manager, "/ws/b", manager->acquire("/ws/b"));
        scoped.dismiss();
    }
    EXPECT_TRUE(manager->isLocked("/ws/b"));
}

TEST(WorkspaceLockManagerProbeTest, OwnProcessIsAlive) {
    EXPECT_TRUE(WorkspaceLockManager::isProcessAlive(::getpid()));
    EXPECT_FALSE(WorkspaceLockManager::isProcessAlive(0));
}

} // namespace planrunner::core::workspace
