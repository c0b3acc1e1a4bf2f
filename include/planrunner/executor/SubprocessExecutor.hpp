#ifndef PLANRUNNER_EXECUTOR_SUBPROCESS_EXECUTOR_HPP
#define PLANRUNNER_EXECUTOR_SUBPROCESS_EXECUTOR_HPP

#include "planrunner/executor/IExecutor.hpp"
#include "core/config/PlanRunnerConfig.h"
#include <string>
#include <vector>

namespace planrunner {
namespace executor {

/**
 * @brief Executor that drives an agent CLI as a child process
 *
 * Single-shot runs pipe the prompt on stdin and capture stdout. Keep-open
 * runs hand the terminal to the child and pass the prompt as an argument.
 */
class SubprocessExecutor : public IExecutor {
public:
    SubprocessExecutor(ExecutorKind kind, config::ExecutorSettings settings);

    std::string name() const override;

    ExecutorCapabilities capabilities() const override;

    ExecutionResult execute(const std::optional<std::string>& prompt,
                            const ExecutionContext& context) override;

    /**
     * @brief Command line for a run, exposed for inspection
     */
    std::vector<std::string> buildCommandLine(const std::optional<std::string>& prompt, bool interactive) const;

    static ExecutorCapabilities capabilitiesFor(ExecutorKind kind);

private:
    ExecutorKind kind_;
    config::ExecutorSettings settings_;
};

} // namespace executor
} // namespace planrunner

#endif // PLANRUNNER_EXECUTOR_SUBPROCESS_EXECUTOR_HPP
