#pragma once

#include "core/workspace/dto/LockInfo.h"
#include <stdexcept>
#include <string>

namespace planrunner {
namespace core {

/**
 * @brief Base class for all planrunner errors
 *
 * Every subclass prefixes its message with its category so that the text
 * printed by the CLI identifies the failure class on its own.
 *
 * @example
 * if (!plan) {
 *     throw NotFoundException("plan", std::to_string(id));
 * }
 */
class PlanRunnerException : public std::runtime_error {
public:
    explicit PlanRunnerException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Malformed plan record, unknown enum value, invalid index
 */
class ValidationException : public PlanRunnerException {
public:
    explicit ValidationException(const std::string& message)
        : PlanRunnerException("Validation: " + message) {}
};

/**
 * @brief Unknown plan id, unknown workspace path, unknown task title
 */
class NotFoundException : public PlanRunnerException {
public:
    NotFoundException(const std::string& kind, const std::string& identifier)
        : PlanRunnerException("NotFound: " + kind + " '" + identifier + "'"),
          kind_(kind), identifier_(identifier) {}

    const std::string& kind() const { return kind_; }
    const std::string& identifier() const { return identifier_; }

private:
    std::string kind_;
    std::string identifier_;
};

/**
 * @brief Workspace is locked by a live process
 *
 * The holder is kept so callers can report who owns the workspace.
 */
class LockConflictException : public PlanRunnerException {
public:
    LockConflictException(const std::string& workspacePath, const workspace::LockInfo& holder)
        : PlanRunnerException("LockConflict: workspace " + workspacePath +
                              " is locked by " + workspace::describeLockHolder(holder)),
          workspacePath_(workspacePath), holder_(holder) {}

    const std::string& workspacePath() const { return workspacePath_; }
    const workspace::LockInfo& holder() const { return holder_; }

private:
    std::string workspacePath_;
    workspace::LockInfo holder_;
};

/**
 * @brief Executor subprocess failed or produced malformed structured output
 */
class ExecutorFailureException : public PlanRunnerException {
public:
    ExecutorFailureException(const std::string& executorName, const std::string& message)
        : PlanRunnerException("ExecutorFailure: " + executorName + ": " + message),
          executorName_(executorName) {}

    const std::string& executorName() const { return executorName_; }

private:
    std::string executorName_;
};

/**
 * @brief Consecutive batch rounds finished without completing any task
 */
class BatchNoProgressException : public PlanRunnerException {
public:
    BatchNoProgressException(int planId, int rounds)
        : PlanRunnerException("BatchNoProgress: plan " + std::to_string(planId) + " made no progress in " +
                              std::to_string(rounds) + " consecutive batch rounds"),
          planId_(planId) {}

    int planId() const { return planId_; }

private:
    int planId_;
};

class VcsException : public PlanRunnerException {
public:
    explicit VcsException(const std::string& message)
        : PlanRunnerException("Vcs: " + message) {}
};

class ConfigException : public PlanRunnerException {
public:
    explicit ConfigException(const std::string& message)
        : PlanRunnerException("Config: " + message) {}
};

} // namespace core
} // namespace planrunner
