#include "core/agent/core/AgentLoop.h"
#include "core/agent/util/AgentPromptBuilder.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"

namespace planrunner::core::agent {

using logging::Logger;

AgentLoop::AgentLoop(std::shared_ptr<plan::PlanStore> store,
                     std::shared_ptr<task::TaskStateMachine> stateMachine,
                     std::shared_ptr<executor::IExecutor> executor,
                     std::shared_ptr<workspace::WorkspaceLockManager> locks,
                     std::vector<config::PostCommand> postApplyCommands)
    : store_(std::move(store)),
      stateMachine_(std::move(stateMachine)),
      executor_(std::move(executor)),
      locks_(std::move(locks)),
      postApplyCommands_(std::move(postApplyCommands)) {}

AgentRunSummary AgentLoop::dryRun(const plan::Plan& plan, const AgentRunOptions& options) const {
    AgentRunSummary summary;
    if (options.batch) {
        auto incomplete = task::TaskStateMachine::getAllIncompleteTasks(plan);
        summary.planComplete = incomplete.empty();
        if (!incomplete.empty()) {
            summary.dryRunPrompt = AgentPromptBuilder::buildBatchPrompt(plan, incomplete);
        }
        return summary;
    }

    auto item = task::TaskStateMachine::findNextActionableItem(plan);
    summary.planComplete = !item;
    if (item) {
        summary.dryRunPrompt = AgentPromptBuilder::buildItemPrompt(plan, *item);
    }
    return summary;
}

AgentRunSummary AgentLoop::run(int planId, const AgentRunOptions& options) {
    plan::Plan plan = store_->load(planId);

    if (options.dryRun) {
        return dryRun(plan, options);
    }
    if (plan.status == plan::PlanStatus::DONE) {
        Logger::get("agent")->info("[AgentLoop] Plan {} is already done", planId);
        AgentRunSummary summary;
        summary.planComplete = true;
        return summary;
    }
    if (options.batch && !executor_->capabilities().supportsBatch) {
        throw ValidationException(executor_->name() + " does not support batch mode");
    }

    std::optional<workspace::ScopedWorkspaceLock> lock;
    if (options.workspacePath && options.lockWorkspace && locks_) {
        auto info = locks_->acquire(*options.workspacePath, workspace::LockType::PID,
                                    "planrunner agent " + std::to_string(planId));
        lock.emplace(*locks_, *options.workspacePath, info);
    }

    stateMachine_->markPlanInProgress(planId);
    Logger::get("agent")->info("[AgentLoop] Running plan {} with {} ({} mode)", planId, executor_->name(),
                               options.batch ? "batch" : "stepwise");

    if (options.batch) {
        BatchRunner runner(store_, stateMachine_, executor_, postApplyCommands_);
        BatchRunOptions batchOptions;
        batchOptions.workspacePath = options.workspacePath.value_or("");
        batchOptions.cancellation = options.cancellation;
        auto batch = runner.run(planId, batchOptions);

        AgentRunSummary summary;
        summary.dispatched = batch.rounds;
        summary.planComplete = batch.planComplete;
        return summary;
    }
    return runStepwise(planId, options);
}

AgentRunSummary AgentLoop::runStepwise(int planId, const AgentRunOptions& options) {
    AgentRunSummary summary;

    while (true) {
        if (options.cancellation && options.cancellation->isCancelled()) {
            Logger::get("agent")->warn("[AgentLoop] Plan {} cancelled after {} item(s)", planId, summary.dispatched);
            return summary;
        }

        plan::Plan plan = store_->load(planId);
        auto item = task::TaskStateMachine::findNextActionableItem(plan);
        if (!item) {
            if (plan.status != plan::PlanStatus::DONE) {
                // All tasks were complete before the run started
                store_->setStatus(planId, plan::PlanStatus::DONE);
                if (plan.parent) {
                    stateMachine_->checkAndMarkParentDone(*plan.parent);
                }
            }
            summary.planComplete = true;
            break;
        }

        Logger::get("agent")->info("[AgentLoop] Plan {}: dispatching {}", planId, task::actionableItemToString(*item));

        executor::ExecutionContext context;
        context.planId = plan.id;
        context.planTitle = plan.displayTitle();
        context.planFilePath = plan.filename;
        context.workspacePath = options.workspacePath.value_or("");
        context.mode = executor::ExecutionMode::NORMAL;
        context.cancellation = options.cancellation;

        auto result = executor_->execute(AgentPromptBuilder::buildItemPrompt(plan, *item), context);
        ++summary.dispatched;
        if (!result.success) {
            throw ExecutorFailureException(executor_->name(), result.errorMessage);
        }

        auto completion = item->kind == task::ActionableItem::Kind::STEP
                              ? stateMachine_->markStepDone(planId, item->taskIndex, item->stepIndex)
                              : stateMachine_->markTaskDone(planId, item->taskIndex);
        Logger::get("agent")->info("[AgentLoop] {}", completion.message);
        if (completion.planComplete) {
            summary.planComplete = true;
            break;
        }
    }

    Logger::get("agent")->info("[AgentLoop] Plan {} complete after {} dispatch(es)", planId, summary.dispatched);
    return summary;
}

} // namespace planrunner::core::agent
