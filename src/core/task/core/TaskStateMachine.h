#ifndef PLANRUNNER_CORE_TASK_TASK_STATE_MACHINE_H
#define PLANRUNNER_CORE_TASK_TASK_STATE_MACHINE_H

#include "core/plan/core/PlanStore.h"
#include "core/task/dto/ActionableItem.h"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace planrunner::core::task {

/**
 * @brief Step/task completion state machine of a plan
 *
 * Completion calls load the plan from the store, mutate it, persist it and
 * then re-check completion. When the last item of a plan is done the plan
 * becomes done and the parent epic cascade runs.
 */
class TaskStateMachine {
public:
    explicit TaskStateMachine(std::shared_ptr<plan::PlanStore> store);
    ~TaskStateMachine() = default;

    TaskStateMachine(const TaskStateMachine&) = delete;
    TaskStateMachine& operator=(const TaskStateMachine&) = delete;

    /**
     * @brief First open step, or first open task without steps
     *
     * std::nullopt means every task is complete, i.e. the plan is complete.
     */
    static std::optional<ActionableItem> findNextActionableItem(const plan::Plan& plan);

    static std::vector<IncompleteTask> getAllIncompleteTasks(const plan::Plan& plan);

    /**
     * @throws NotFoundException unknown plan
     * @throws ValidationException task or step index out of range
     */
    CompletionResult markStepDone(int planId, size_t taskIndex, size_t stepIndex);

    /**
     * @brief Complete a task directly (its steps are marked done too)
     *
     * @throws NotFoundException unknown plan
     * @throws ValidationException task index out of range
     */
    CompletionResult markTaskDone(int planId, size_t taskIndex);

    /**
     * @brief Complete the task with this exact title
     * @throws NotFoundException unknown plan or no task with the title
     */
    CompletionResult setTaskDone(int planId, const std::string& title);

    /**
     * @brief Apply the task indices an executor reported after a batch round
     *
     * All indices are validated before anything is persisted. Indices of
     * tasks that are already complete are accepted and ignored.
     *
     * @throws ValidationException listing every out-of-range index
     */
    CompletionResult applyBatchCompletion(int planId, const std::vector<size_t>& doneTaskIndices);

    /**
     * @brief pending -> in_progress for the plan and its pending ancestors
     */
    plan::Plan markPlanInProgress(int planId);

    /**
     * @brief Mark the parent epic done if all of its children are finished
     *
     * A parent qualifies when it is an epic, is neither done nor cancelled,
     * has at least one child, and every child is done or cancelled. The
     * check continues with the parent's own parent.
     *
     * @return ids of plans marked done, nearest parent first
     */
    std::vector<int> checkAndMarkParentDone(int parentId);

private:
    CompletionResult finishUpdate(plan::Plan& plan, CompletionResult result);
    std::vector<int> cascadeLocked(int parentId, std::set<int>& visited);

    std::shared_ptr<plan::PlanStore> store_;
    std::mutex mutex_;
};

} // namespace planrunner::core::task

#endif // PLANRUNNER_CORE_TASK_TASK_STATE_MACHINE_H
