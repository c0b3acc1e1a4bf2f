#include "core/workspace/core/WorkspaceLockManager.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"
#include "core/util/FileUtils.h"
#include "core/util/HashUtils.h"
#include "core/util/TimeUtils.h"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace planrunner::core::workspace {

using logging::Logger;
using util::FileUtils;
using util::TimeUtils;

namespace {

nlohmann::json lockToJson(const LockInfo& info) {
    return {
        {"workspacePath", info.workspacePath},
        {"type", lockTypeToString(info.type)},
        {"pid", info.pid},
        {"command", info.command},
        {"hostname", info.hostname},
        {"startedAt", info.startedAt},
        {"version", info.version},
    };
}

} // namespace

WorkspaceLockManager::WorkspaceLockManager(fs::path lockDirectory, ProcessProbe probe,
                                           std::optional<pid_t> ownPid, std::optional<std::string> hostname)
    : lockDirectory_(std::move(lockDirectory)),
      probe_(probe ? std::move(probe) : ProcessProbe(&WorkspaceLockManager::isProcessAlive)),
      ownPid_(ownPid ? *ownPid : ::getpid()),
      hostname_(hostname ? *hostname : currentHostname()) {}

bool WorkspaceLockManager::isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    // EPERM: the process exists but belongs to another user
    return errno == EPERM;
}

std::string WorkspaceLockManager::currentHostname() {
    char buffer[HOST_NAME_MAX + 1] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "";
    }
    return buffer;
}

fs::path WorkspaceLockManager::lockFilePath(const std::string& workspacePath) const {
    const std::string normalized = FileUtils::normalizePath(workspacePath);
    std::string base = fs::path(normalized).filename().string();
    if (base.empty()) {
        base = "root";
    }

    return lockDirectory_ / (base + "-" + util::fnv1a64Hex(normalized) + ".lock");
}

std::optional<LockInfo> WorkspaceLockManager::readLockFile(const fs::path& file) const {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return std::nullopt;
    }

    try {
        auto j = nlohmann::json::parse(FileUtils::readFile(file));
        LockInfo info;
        info.workspacePath = j.value("workspacePath", std::string());
        info.type = j.value("type", std::string("pid")) == "persistent" ? LockType::PERSISTENT : LockType::PID;
        info.pid = j.value("pid", 0);
        info.command = j.value("command", std::string());
        info.hostname = j.value("hostname", std::string());
        info.startedAt = j.value("startedAt", std::string());
        info.version = j.value("version", 1);
        return info;
    } catch (const std::exception& e) {
        // An unreadable lock file is treated as an expired lock of unknown origin
        Logger::get("workspace")->warn("[WorkspaceLock] Unreadable lock file {}: {}", file.string(), e.what());
        LockInfo info;
        info.startedAt = "";
        info.version = 0;
        return info;
    }
}

bool WorkspaceLockManager::createLockFile(const fs::path& file, const LockInfo& info) const {
    std::error_code ec;
    fs::create_directories(file.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Failed to create lock directory " + file.parent_path().string() + ": " +
                                 ec.message());
    }

    int fd = ::open(file.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return false;
        }
        throw std::runtime_error("Failed to create lock file " + file.string() + ": " + std::strerror(errno));
    }

    const std::string text = lockToJson(info).dump(2) + "\n";
    ssize_t written = ::write(fd, text.data(), text.size());
    int writeErrno = errno;
    ::close(fd);
    if (written != static_cast<ssize_t>(text.size())) {
        ::unlink(file.c_str());
        throw std::runtime_error("Failed to write lock file " + file.string() + ": " + std::strerror(writeErrno));
    }
    return true;
}

std::optional<LockInfo> WorkspaceLockManager::getLockInfo(const std::string& workspacePath) const {
    return readLockFile(lockFilePath(workspacePath));
}

bool WorkspaceLockManager::isStale(const LockInfo& info) const {
    if (info.type == LockType::PERSISTENT) {
        return false;
    }

    auto startedAt = TimeUtils::parseIso8601(info.startedAt);
    if (!startedAt || std::chrono::system_clock::now() - *startedAt > STALE_AFTER) {
        return true;
    }

    bool sameHost = info.hostname.empty() || info.hostname == hostname_;
    return sameHost && !probe_(info.pid);
}

bool WorkspaceLockManager::isLocked(const std::string& workspacePath) const {
    auto info = getLockInfo(workspacePath);
    return info && !isStale(*info);
}

AcquireResult WorkspaceLockManager::tryAcquire(const std::string& workspacePath, LockType type,
                                               const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);

    const fs::path file = lockFilePath(workspacePath);
    LockInfo mine;
    mine.workspacePath = FileUtils::normalizePath(workspacePath);
    mine.type = type;
    mine.pid = ownPid_;
    mine.command = command;
    mine.hostname = hostname_;
    mine.startedAt = TimeUtils::nowIso8601();
    mine.version = LOCK_VERSION;

    AcquireResult result;
    // A competing process may recreate the file between our unlink and open
    for (int attempt = 0; attempt < 3; ++attempt) {
        if (createLockFile(file, mine)) {
            result.acquired = true;
            result.lock = mine;
            Logger::get("workspace")->info("[WorkspaceLock] ACQUIRE - {} ({}, pid {})", mine.workspacePath,
                                           lockTypeToString(type), ownPid_);
            return result;
        }

        auto holder = readLockFile(file);
        if (!holder) {
            continue;
        }

        if (holder->type == LockType::PID && holder->pid == ownPid_ && holder->hostname == hostname_ &&
            type == LockType::PID) {
            result.acquired = true;
            result.lock = *holder;
            return result;
        }

        if (!isStale(*holder)) {
            result.holder = holder;
            Logger::get("workspace")->info("[WorkspaceLock] BUSY - {} held by {}", mine.workspacePath,
                                           describeLockHolder(*holder));
            return result;
        }

        Logger::get("workspace")->info("[WorkspaceLock] Reclaiming stale lock on {} ({})", mine.workspacePath,
                                       describeLockHolder(*holder));
        if (::unlink(file.c_str()) != 0 && errno != ENOENT) {
            throw std::runtime_error("Failed to remove stale lock file " + file.string() + ": " +
                                     std::strerror(errno));
        }
        result.reclaimedStale = true;
    }

    result.holder = readLockFile(file);
    return result;
}

LockInfo WorkspaceLockManager::acquire(const std::string& workspacePath, LockType type, const std::string& command) {
    auto result = tryAcquire(workspacePath, type, command);
    if (!result.acquired) {
        LockInfo holder = result.holder ? *result.holder : LockInfo{};
        throw LockConflictException(FileUtils::normalizePath(workspacePath), holder);
    }
    return result.lock;
}

bool WorkspaceLockManager::release(const std::string& workspacePath, bool force) {
    std::lock_guard<std::mutex> lock(mutex_);

    const fs::path file = lockFilePath(workspacePath);
    auto holder = readLockFile(file);
    if (!holder) {
        return false;
    }

    // Persistent locks are user-held and removed by an explicit release
    if (!force && holder->type == LockType::PID && holder->pid != ownPid_ && !isStale(*holder)) {
        Logger::get("workspace")->warn("[WorkspaceLock] {} is locked by {}, not by this process",
                                       workspacePath, describeLockHolder(*holder));
        return false;
    }

    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        throw std::runtime_error("Failed to remove lock file " + file.string() + ": " + ec.message());
    }
    Logger::get("workspace")->info("[WorkspaceLock] RELEASE - {}{}", workspacePath, force ? " (forced)" : "");
    return true;
}

bool WorkspaceLockManager::clearStaleLock(const std::string& workspacePath) {
    std::lock_guard<std::mutex> lock(mutex_);

    const fs::path file = lockFilePath(workspacePath);
    auto holder = readLockFile(file);
    if (!holder || !isStale(*holder)) {
        return false;
    }
    std::error_code ec;
    fs::remove(file, ec);
    return !ec;
}

ScopedWorkspaceLock::ScopedWorkspaceLock(WorkspaceLockManager& manager, std::string workspacePath, LockInfo info)
    : manager_(manager), workspacePath_(std::move(workspacePath)), info_(std::move(info)) {}

ScopedWorkspaceLock::~ScopedWorkspaceLock() {
    if (!active_ || info_.type != LockType::PID) {
        return;
    }
    try {
        manager_.release(workspacePath_);
    } catch (const std::exception& e) {
        Logger::get("workspace")->error("[WorkspaceLock] Failed to release {}: {}", workspacePath_, e.what());
    }
}

} // namespace planrunner::core::workspace
