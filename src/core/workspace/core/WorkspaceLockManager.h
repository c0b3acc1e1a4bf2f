#ifndef PLANRUNNER_CORE_WORKSPACE_WORKSPACE_LOCK_MANAGER_H
#define PLANRUNNER_CORE_WORKSPACE_WORKSPACE_LOCK_MANAGER_H

#include "core/workspace/dto/LockInfo.h"
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>

namespace planrunner::core::workspace {

/**
 * @brief Outcome of tryAcquire()
 */
struct AcquireResult {
    bool acquired{false};
    LockInfo lock;                    // the lock now held, when acquired
    std::optional<LockInfo> holder;   // the live holder, when not acquired
    bool reclaimedStale{false};
};

/**
 * @brief Exclusive per-workspace locks stored as JSON lock files
 *
 * The lock file name is derived from the normalized workspace path. The
 * lock directory is injected and independent of the registry location.
 * Exclusivity comes from O_CREAT|O_EXCL plus an owner pid check, not from
 * OS advisory locks.
 *
 * A PID lock is stale when it is older than 24 hours, or when it was taken
 * on this host and its process is gone. Stale locks are reclaimed silently.
 * PERSISTENT locks never go stale and stay until explicitly released.
 */
class WorkspaceLockManager {
public:
    using ProcessProbe = std::function<bool(pid_t)>;

    static constexpr int LOCK_VERSION = 2;
    static constexpr std::chrono::hours STALE_AFTER{24};

    /**
     * @param probe liveness check, defaults to kill(pid, 0)
     * @param ownPid pid recorded in new locks, defaults to getpid()
     * @param hostname host recorded in new locks, defaults to gethostname()
     */
    explicit WorkspaceLockManager(std::filesystem::path lockDirectory,
                                  ProcessProbe probe = {},
                                  std::optional<pid_t> ownPid = std::nullopt,
                                  std::optional<std::string> hostname = std::nullopt);

    WorkspaceLockManager(const WorkspaceLockManager&) = delete;
    WorkspaceLockManager& operator=(const WorkspaceLockManager&) = delete;

    std::filesystem::path lockFilePath(const std::string& workspacePath) const;

    /**
     * @brief Current lock record, stale or not
     */
    std::optional<LockInfo> getLockInfo(const std::string& workspacePath) const;

    bool isStale(const LockInfo& info) const;

    /**
     * @brief Locked by a live holder
     */
    bool isLocked(const std::string& workspacePath) const;

    AcquireResult tryAcquire(const std::string& workspacePath,
                             LockType type = LockType::PID,
                             const std::string& command = "");

    /**
     * @throws LockConflictException naming the live holder
     */
    LockInfo acquire(const std::string& workspacePath,
                     LockType type = LockType::PID,
                     const std::string& command = "");

    /**
     * @brief Remove the lock
     *
     * Without force a live PID lock is removed only by the process holding
     * it. Persistent and stale locks are always removed.
     *
     * @return false if there was no lock or a live process holds it
     */
    bool release(const std::string& workspacePath, bool force = false);

    /**
     * @brief Remove the lock file if its holder is stale
     * @return true if a stale lock was removed
     */
    bool clearStaleLock(const std::string& workspacePath);

    pid_t ownPid() const { return ownPid_; }
    const std::string& hostname() const { return hostname_; }
    const std::filesystem::path& lockDirectory() const { return lockDirectory_; }

    static bool isProcessAlive(pid_t pid);
    static std::string currentHostname();

private:
    std::optional<LockInfo> readLockFile(const std::filesystem::path& file) const;
    bool createLockFile(const std::filesystem::path& file, const LockInfo& info) const;

    std::filesystem::path lockDirectory_;
    ProcessProbe probe_;
    pid_t ownPid_;
    std::string hostname_;
    mutable std::mutex mutex_;
};

/**
 * @brief Releases a PID lock when it goes out of scope
 */
class ScopedWorkspaceLock {
public:
    ScopedWorkspaceLock(WorkspaceLockManager& manager, std::string workspacePath, LockInfo info);
    ~ScopedWorkspaceLock();

    ScopedWorkspaceLock(const ScopedWorkspaceLock&) = delete;
    ScopedWorkspaceLock& operator=(const ScopedWorkspaceLock&) = delete;

    const LockInfo& info() const { return info_; }

    /**
     * @brief Keep the lock file after destruction
     */
    void dismiss() { active_ = false; }

private:
    WorkspaceLockManager& manager_;
    std::string workspacePath_;
    LockInfo info_;
    bool active_{true};
};

} // namespace planrunner::core::workspace

#endif // PLANRUNNER_CORE_WORKSPACE_WORKSPACE_LOCK_MANAGER_H
