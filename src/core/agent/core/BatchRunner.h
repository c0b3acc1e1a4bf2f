#ifndef PLANRUNNER_CORE_AGENT_BATCH_RUNNER_H
#define PLANRUNNER_CORE_AGENT_BATCH_RUNNER_H

#include "core/config/PlanRunnerConfig.h"
#include "core/plan/core/PlanStore.h"
#include "core/task/core/TaskStateMachine.h"
#include "planrunner/executor/IExecutor.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace planrunner::core::agent {

struct BatchRunOptions {
    std::string workspacePath;                   // executor cwd and post-apply base directory
    std::shared_ptr<executor::CancellationToken> cancellation;
    int maxNoProgressRounds{2};
};

struct BatchRunSummary {
    int rounds{0};
    std::vector<size_t> completedTasks;          // in the order they were reported
    bool planComplete{false};
};

/**
 * @brief Batch mode: the executor completes several tasks per round
 *
 * Each round the executor reports {"completedTaskIndices":[...]}; the
 * indices go through TaskStateMachine::applyBatchCompletion and the
 * configured post-apply commands run. Rounds repeat until the plan is
 * complete.
 */
class BatchRunner {
public:
    BatchRunner(std::shared_ptr<plan::PlanStore> store,
                std::shared_ptr<task::TaskStateMachine> stateMachine,
                std::shared_ptr<executor::IExecutor> executor,
                std::vector<config::PostCommand> postApplyCommands = {});

    /**
     * @throws ExecutorFailureException executor failed or sent a malformed report
     * @throws BatchNoProgressException too many consecutive rounds without progress
     * @throws PlanRunnerException a post-apply command without allowFailure failed
     */
    BatchRunSummary run(int planId, const BatchRunOptions& options = {});

    /**
     * @brief Task indices reported by an executor
     *
     * Structured output is preferred; otherwise the last JSON object in the
     * text output is used. std::nullopt when there is no report.
     *
     * @throws ValidationException a report that is not a list of non-negative integers
     */
    static std::optional<std::vector<size_t>> parseCompletedTaskIndices(const executor::ExecutionResult& result);

private:
    std::shared_ptr<plan::PlanStore> store_;
    std::shared_ptr<task::TaskStateMachine> stateMachine_;
    std::shared_ptr<executor::IExecutor> executor_;
    std::vector<config::PostCommand> postApplyCommands_;
};

} // namespace planrunner::core::agent

#endif // PLANRUNNER_CORE_AGENT_BATCH_RUNNER_H
