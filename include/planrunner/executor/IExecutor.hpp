#ifndef PLANRUNNER_EXECUTOR_IEXECUTOR_HPP
#define PLANRUNNER_EXECUTOR_IEXECUTOR_HPP

#include "planrunner/executor/ExecutionTypes.hpp"
#include <optional>
#include <string>

namespace planrunner {
namespace executor {

/**
 * @brief Turns a prompt into work inside a workspace
 *
 * execute() may block for the lifetime of an agent subprocess. It reports
 * subprocess failures through ExecutionResult instead of throwing.
 *
 * An absent prompt starts an empty interactive session. Executors whose
 * capabilities say requiresPrompt fail immediately with "prompt required".
 */
class IExecutor {
public:
    virtual ~IExecutor() = default;

    virtual std::string name() const = 0;

    virtual ExecutorCapabilities capabilities() const = 0;

    virtual ExecutionResult execute(const std::optional<std::string>& prompt,
                                    const ExecutionContext& context) = 0;
};

} // namespace executor
} // namespace planrunner

#endif // PLANRUNNER_EXECUTOR_IEXECUTOR_HPP
