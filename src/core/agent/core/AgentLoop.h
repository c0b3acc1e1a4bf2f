#ifndef PLANRUNNER_CORE_AGENT_AGENT_LOOP_H
#define PLANRUNNER_CORE_AGENT_AGENT_LOOP_H

#include "core/agent/core/BatchRunner.h"
#include "core/workspace/core/WorkspaceLockManager.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace planrunner::core::agent {

struct AgentRunOptions {
    bool batch{false};
    std::optional<std::string> workspacePath;    // unset => current directory, no lock
    bool dryRun{false};                          // build the first prompt and stop
    bool lockWorkspace{true};
    std::shared_ptr<executor::CancellationToken> cancellation;
};

struct AgentRunSummary {
    int dispatched{0};                           // executor calls
    bool planComplete{false};
    std::optional<std::string> dryRunPrompt;
};

/**
 * @brief Drives one plan to completion
 *
 * Items are dispatched one at a time and each completion is recorded before
 * the next item is picked. Batch mode hands whole rounds to BatchRunner.
 */
class AgentLoop {
public:
    AgentLoop(std::shared_ptr<plan::PlanStore> store,
              std::shared_ptr<task::TaskStateMachine> stateMachine,
              std::shared_ptr<executor::IExecutor> executor,
              std::shared_ptr<workspace::WorkspaceLockManager> locks = nullptr,
              std::vector<config::PostCommand> postApplyCommands = {});

    /**
     * @throws NotFoundException unknown plan
     * @throws LockConflictException workspace held by another live process
     * @throws ExecutorFailureException executor failed
     * @throws BatchNoProgressException batch rounds stopped completing tasks
     */
    AgentRunSummary run(int planId, const AgentRunOptions& options = {});

private:
    AgentRunSummary runStepwise(int planId, const AgentRunOptions& options);
    AgentRunSummary dryRun(const plan::Plan& plan, const AgentRunOptions& options) const;

    std::shared_ptr<plan::PlanStore> store_;
    std::shared_ptr<task::TaskStateMachine> stateMachine_;
    std::shared_ptr<executor::IExecutor> executor_;
    std::shared_ptr<workspace::WorkspaceLockManager> locks_;
    std::vector<config::PostCommand> postApplyCommands_;
};

} // namespace planrunner::core::agent

#endif // PLANRUNNER_CORE_AGENT_AGENT_LOOP_H
