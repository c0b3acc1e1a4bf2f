#ifndef PLANRUNNER_CORE_PLAN_PLAN_STATUS_H
#define PLANRUNNER_CORE_PLAN_PLAN_STATUS_H

#include <optional>
#include <string>

namespace planrunner::core::plan {

/**
 * @brief Plan lifecycle state
 */
enum class PlanStatus {
    PENDING,
    IN_PROGRESS,
    DONE,
    CANCELLED,
    DEFERRED
};

/**
 * @brief Plan priority
 *
 * MAYBE ranks lowest; a plan with no priority at all ranks below MAYBE.
 */
enum class PlanPriority {
    LOW,
    MEDIUM,
    HIGH,
    URGENT,
    MAYBE
};

inline std::string planStatusToString(PlanStatus status) {
    switch (status) {
        case PlanStatus::PENDING:     return "pending";
        case PlanStatus::IN_PROGRESS: return "in_progress";
        case PlanStatus::DONE:        return "done";
        case PlanStatus::CANCELLED:   return "cancelled";
        case PlanStatus::DEFERRED:    return "deferred";
        default:                      return "unknown";
    }
}

inline std::optional<PlanStatus> planStatusFromString(const std::string& text) {
    if (text == "pending")     return PlanStatus::PENDING;
    if (text == "in_progress") return PlanStatus::IN_PROGRESS;
    if (text == "done")        return PlanStatus::DONE;
    if (text == "cancelled")   return PlanStatus::CANCELLED;
    if (text == "deferred")    return PlanStatus::DEFERRED;
    return std::nullopt;
}

inline std::string planPriorityToString(PlanPriority priority) {
    switch (priority) {
        case PlanPriority::LOW:    return "low";
        case PlanPriority::MEDIUM: return "medium";
        case PlanPriority::HIGH:   return "high";
        case PlanPriority::URGENT: return "urgent";
        case PlanPriority::MAYBE:  return "maybe";
        default:                   return "unknown";
    }
}

inline std::optional<PlanPriority> planPriorityFromString(const std::string& text) {
    if (text == "low")    return PlanPriority::LOW;
    if (text == "medium") return PlanPriority::MEDIUM;
    if (text == "high")   return PlanPriority::HIGH;
    if (text == "urgent") return PlanPriority::URGENT;
    if (text == "maybe")  return PlanPriority::MAYBE;
    return std::nullopt;
}

/**
 * @brief Sort weight, higher runs first
 */
inline int priorityRank(const std::optional<PlanPriority>& priority) {
    if (!priority) {
        return 0;
    }
    switch (*priority) {
        case PlanPriority::URGENT: return 5;
        case PlanPriority::HIGH:   return 4;
        case PlanPriority::MEDIUM: return 3;
        case PlanPriority::LOW:    return 2;
        case PlanPriority::MAYBE:  return 1;
        default:                   return 0;
    }
}

} // namespace planrunner::core::plan

#endif // PLANRUNNER_CORE_PLAN_PLAN_STATUS_H
