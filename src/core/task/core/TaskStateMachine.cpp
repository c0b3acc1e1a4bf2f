#include "core/task/core/TaskStateMachine.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"
#include "core/util/TimeUtils.h"
#include <algorithm>
#include <sstream>

namespace planrunner::core::task {

using logging::Logger;
using plan::Plan;
using plan::PlanStatus;
using util::TimeUtils;

namespace {

void requireTaskIndex(const Plan& plan, size_t taskIndex) {
    if (taskIndex >= plan.tasks.size()) {
        throw ValidationException("plan " + std::to_string(plan.id) + ": task index " + std::to_string(taskIndex) +
                                  " is out of range (plan has " + std::to_string(plan.tasks.size()) + " tasks)");
    }
}

void completeTask(plan::Task& task) {
    task.done = true;
    for (auto& step : task.steps) {
        step.done = true;
    }
}

} // namespace

TaskStateMachine::TaskStateMachine(std::shared_ptr<plan::PlanStore> store)
    : store_(std::move(store)) {}

std::optional<ActionableItem> TaskStateMachine::findNextActionableItem(const Plan& plan) {
    for (size_t taskIndex = 0; taskIndex < plan.tasks.size(); ++taskIndex) {
        const auto& task = plan.tasks[taskIndex];
        if (task.isComplete()) {
            continue;
        }

        if (task.steps.empty()) {
            return ActionableItem{ActionableItem::Kind::TASK, taskIndex, 0};
        }
        for (size_t stepIndex = 0; stepIndex < task.steps.size(); ++stepIndex) {
            if (!task.steps[stepIndex].done) {
                return ActionableItem{ActionableItem::Kind::STEP, taskIndex, stepIndex};
            }
        }
    }
    return std::nullopt;
}

std::vector<IncompleteTask> TaskStateMachine::getAllIncompleteTasks(const Plan& plan) {
    std::vector<IncompleteTask> incomplete;
    for (size_t i = 0; i < plan.tasks.size(); ++i) {
        if (!plan.tasks[i].isComplete()) {
            incomplete.push_back({i, plan.tasks[i]});
        }
    }
    return incomplete;
}

CompletionResult TaskStateMachine::finishUpdate(Plan& plan, CompletionResult result) {
    plan.updatedAt = TimeUtils::nowIso8601();

    if (!findNextActionableItem(plan)) {
        plan.status = PlanStatus::DONE;
        result.planComplete = true;
    } else if (plan.status == PlanStatus::PENDING) {
        plan.status = PlanStatus::IN_PROGRESS;
    }

    store_->save(plan);

    if (result.planComplete) {
        Logger::get("task")->info("[TaskStateMachine] COMPLETE - plan {} '{}'", plan.id, plan.displayTitle());
        if (plan.parent) {
            std::set<int> visited{plan.id};
            result.cascadedPlanIds = cascadeLocked(*plan.parent, visited);
        }
    }
    return result;
}

CompletionResult TaskStateMachine::markStepDone(int planId, size_t taskIndex, size_t stepIndex) {
    std::lock_guard<std::mutex> lock(mutex_);
    Plan plan = store_->load(planId);
    requireTaskIndex(plan, taskIndex);

    auto& task = plan.tasks[taskIndex];
    if (stepIndex >= task.steps.size()) {
        throw ValidationException("plan " + std::to_string(planId) + ": step index " + std::to_string(stepIndex) +
                                  " is out of range for task " + std::to_string(taskIndex) + " (task has " +
                                  std::to_string(task.steps.size()) + " steps)");
    }

    CompletionResult result;
    if (task.steps[stepIndex].done) {
        result.message = "Step " + std::to_string(stepIndex) + " of task " + std::to_string(taskIndex) +
                         " is already marked as done";
        result.planComplete = !findNextActionableItem(plan);
        return result;
    }

    task.steps[stepIndex].done = true;
    if (task.isComplete() && !task.done) {
        task.done = true;
        result.newlyCompletedTasks.push_back(taskIndex);
    }
    result.message = "Marked step " + std::to_string(stepIndex) + " of task '" + task.title + "' as done";
    Logger::get("task")->info("[TaskStateMachine] STEP DONE - plan {} task {} step {}", planId, taskIndex, stepIndex);

    return finishUpdate(plan, std::move(result));
}

CompletionResult TaskStateMachine::markTaskDone(int planId, size_t taskIndex) {
    std::lock_guard<std::mutex> lock(mutex_);
    Plan plan = store_->load(planId);
    requireTaskIndex(plan, taskIndex);

    auto& task = plan.tasks[taskIndex];
    CompletionResult result;
    if (task.done) {
        result.message = "Task '" + task.title + "' is already marked as done";
        result.planComplete = !findNextActionableItem(plan);
        return result;
    }

    completeTask(task);
    result.newlyCompletedTasks.push_back(taskIndex);
    result.message = "Marked task '" + task.title + "' as done";
    Logger::get("task")->info("[TaskStateMachine] TASK DONE - plan {} task {}", planId, taskIndex);

    return finishUpdate(plan, std::move(result));
}

CompletionResult TaskStateMachine::setTaskDone(int planId, const std::string& title) {
    size_t taskIndex = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Plan plan = store_->load(planId);
        auto it = std::find_if(plan.tasks.begin(), plan.tasks.end(),
                               [&title](const plan::Task& task) { return task.title == title; });
        if (it == plan.tasks.end()) {
            throw NotFoundException("task in plan " + std::to_string(planId), title);
        }
        taskIndex = static_cast<size_t>(std::distance(plan.tasks.begin(), it));
    }
    return markTaskDone(planId, taskIndex);
}

CompletionResult TaskStateMachine::applyBatchCompletion(int planId, const std::vector<size_t>& doneTaskIndices) {
    std::lock_guard<std::mutex> lock(mutex_);
    Plan plan = store_->load(planId);

    std::vector<size_t> invalid;
    for (size_t index : doneTaskIndices) {
        if (index >= plan.tasks.size()) {
            invalid.push_back(index);
        }
    }
    if (!invalid.empty()) {
        std::ostringstream oss;
        for (size_t i = 0; i < invalid.size(); ++i) {
            oss << (i ? ", " : "") << invalid[i];
        }
        throw ValidationException("plan " + std::to_string(planId) + ": batch reported unknown task indexes: " +
                                  oss.str() + " (plan has " + std::to_string(plan.tasks.size()) + " tasks)");
    }

    CompletionResult result;
    for (size_t index : doneTaskIndices) {
        auto& task = plan.tasks[index];
        if (task.isComplete()) {
            task.done = true;
            continue;
        }
        completeTask(task);
        result.newlyCompletedTasks.push_back(index);
    }

    result.message = "Batch completed " + std::to_string(result.newlyCompletedTasks.size()) + " task(s)";
    Logger::get("task")->info("[TaskStateMachine] BATCH - plan {}: {} newly completed, {} reported",
                              planId, result.newlyCompletedTasks.size(), doneTaskIndices.size());

    if (result.newlyCompletedTasks.empty()) {
        result.planComplete = !findNextActionableItem(plan);
        return result;
    }
    return finishUpdate(plan, std::move(result));
}

Plan TaskStateMachine::markPlanInProgress(int planId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Plan plan = store_->load(planId);

    std::set<int> visited;
    Plan current = plan;
    while (visited.insert(current.id).second) {
        if (current.status == PlanStatus::PENDING) {
            current.status = PlanStatus::IN_PROGRESS;
            current.updatedAt = TimeUtils::nowIso8601();
            store_->save(current);
            Logger::get("task")->info("[TaskStateMachine] IN PROGRESS - plan {}", current.id);
            if (current.id == planId) {
                plan = current;
            }
        }
        if (!current.parent) {
            break;
        }
        try {
            current = store_->load(*current.parent);
        } catch (const NotFoundException& e) {
            Logger::get("task")->warn("[TaskStateMachine] Parent of plan {} not found: {}", current.id, e.what());
            break;
        }
    }
    return plan;
}

std::vector<int> TaskStateMachine::checkAndMarkParentDone(int parentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<int> visited;
    return cascadeLocked(parentId, visited);
}

std::vector<int> TaskStateMachine::cascadeLocked(int parentId, std::set<int>& visited) {
    std::vector<int> marked;
    std::optional<int> current = parentId;

    while (current && visited.insert(*current).second) {
        Plan parent;
        try {
            parent = store_->load(*current);
        } catch (const NotFoundException& e) {
            Logger::get("task")->warn("[TaskStateMachine] Cascade stopped: {}", e.what());
            break;
        }

        if (!parent.epic || parent.status == PlanStatus::DONE || parent.status == PlanStatus::CANCELLED) {
            break;
        }

        auto children = store_->childrenOf(parent.id);
        if (children.empty()) {
            break;
        }
        bool allFinished = std::all_of(children.begin(), children.end(), [](const Plan& child) {
            return child.status == PlanStatus::DONE || child.status == PlanStatus::CANCELLED;
        });
        if (!allFinished) {
            break;
        }

        parent.status = PlanStatus::DONE;
        parent.updatedAt = TimeUtils::nowIso8601();
        store_->save(parent);
        marked.push_back(parent.id);
        Logger::get("task")->info("[TaskStateMachine] EPIC DONE - plan {} (all {} children finished)",
                                  parent.id, children.size());

        current = parent.parent;
    }
    return marked;
}

} // namespace planrunner::core::task
