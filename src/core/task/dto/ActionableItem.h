#ifndef PLANRUNNER_CORE_TASK_ACTIONABLE_ITEM_H
#define PLANRUNNER_CORE_TASK_ACTIONABLE_ITEM_H

#include "core/plan/dto/Plan.h"
#include <cstddef>
#include <string>
#include <vector>

namespace planrunner::core::task {

/**
 * @brief Next unit of work inside a plan
 */
struct ActionableItem {
    enum class Kind {
        STEP,   // first open step of a task with steps
        TASK    // task without steps
    };

    Kind kind{Kind::TASK};
    size_t taskIndex{0};
    size_t stepIndex{0};   // only meaningful for STEP

    bool operator==(const ActionableItem& other) const {
        return kind == other.kind && taskIndex == other.taskIndex &&
               (kind == Kind::TASK || stepIndex == other.stepIndex);
    }
};

inline std::string actionableItemToString(const ActionableItem& item) {
    if (item.kind == ActionableItem::Kind::STEP) {
        return "step " + std::to_string(item.stepIndex) + " of task " + std::to_string(item.taskIndex);
    }
    return "task " + std::to_string(item.taskIndex);
}

/**
 * @brief Task that is not complete yet, with its position in the plan
 */
struct IncompleteTask {
    size_t taskIndex{0};
    plan::Task task;
};

/**
 * @brief Outcome of a completion call
 */
struct CompletionResult {
    bool planComplete{false};
    std::string message;
    std::vector<size_t> newlyCompletedTasks;
    std::vector<int> cascadedPlanIds;    // parents marked done by the epic cascade
};

} // namespace planrunner::core::task

#endif // PLANRUNNER_CORE_TASK_ACTIONABLE_ITEM_H
