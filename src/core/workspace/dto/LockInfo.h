#ifndef PLANRUNNER_CORE_WORKSPACE_LOCK_INFO_H
#define PLANRUNNER_CORE_WORKSPACE_LOCK_INFO_H

#include <string>
#include <sys/types.h>

namespace planrunner::core::workspace {

/**
 * @brief Lock flavour
 *
 * PID locks belong to a running process and are reclaimed once it is gone.
 * Persistent locks survive their creator and are only released explicitly.
 */
enum class LockType {
    PID,
    PERSISTENT
};

inline std::string lockTypeToString(LockType type) {
    switch (type) {
        case LockType::PID:        return "pid";
        case LockType::PERSISTENT: return "persistent";
        default:                   return "unknown";
    }
}

/**
 * @brief Contents of a workspace lock file
 */
struct LockInfo {
    std::string workspacePath;
    LockType type{LockType::PID};
    pid_t pid{0};
    std::string command;
    std::string hostname;
    std::string startedAt;    // ISO-8601 UTC
    int version{2};
};

inline std::string describeLockHolder(const LockInfo& info) {
    std::string text = "pid " + std::to_string(info.pid);
    if (!info.hostname.empty()) {
        text += " on " + info.hostname;
    }
    if (!info.command.empty()) {
        text += " (" + info.command + ")";
    }
    if (info.type == LockType::PERSISTENT) {
        text += " [persistent]";
    }
    return text;
}

} // namespace planrunner::core::workspace

#endif // PLANRUNNER_CORE_WORKSPACE_LOCK_INFO_H
