#ifndef PLANRUNNER_CORE_PLAN_PLAN_H
#define PLANRUNNER_CORE_PLAN_PLAN_H

#include "core/plan/dto/PlanStatus.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace planrunner::core::plan {

/**
 * @brief Smallest unit of work, one prompt for the executor
 *
 * Terminal once done.
 */
struct Step {
    std::string prompt;
    bool done{false};
};

/**
 * @brief Task inside a plan
 *
 * A task without steps is completed through its own done flag; a task with
 * steps is complete once every step is done.
 */
struct Task {
    std::string title;
    std::string description;
    std::vector<std::string> files;
    bool done{false};
    std::vector<Step> steps;

    bool isComplete() const {
        if (done) {
            return true;
        }
        if (steps.empty()) {
            return false;
        }
        for (const auto& step : steps) {
            if (!step.done) {
                return false;
            }
        }
        return true;
    }
};

/**
 * @brief Plan record as persisted in the tasks directory
 */
struct Plan {
    int id{0};
    std::string uuid;
    std::string title;
    std::string goal;
    std::string details;
    PlanStatus status{PlanStatus::PENDING};
    std::optional<PlanPriority> priority;
    std::vector<int> dependencies;
    std::optional<int> parent;
    std::optional<int> discoveredFrom;
    bool epic{false};
    std::vector<std::string> tags;       // normalized, see normalizeTags()
    std::optional<std::string> branch;
    std::vector<Task> tasks;
    std::string createdAt;               // ISO-8601 UTC
    std::string updatedAt;               // ISO-8601 UTC

    std::string filename;                // absolute path of the backing file, not persisted

    /**
     * @brief Title for display, falling back to the goal
     */
    std::string displayTitle() const {
        return title.empty() ? goal : title;
    }
};

using PlanMap = std::map<int, Plan>;

/**
 * @brief Plan file that could not be loaded during a directory scan
 */
struct SkippedPlanFile {
    std::string path;
    std::string reason;
};

/**
 * @brief Result of a directory scan
 */
struct PlanLoadResult {
    PlanMap plans;
    std::vector<SkippedPlanFile> skipped;
};

/**
 * @brief Trim, lowercase, de-duplicate and sort tags
 */
inline std::vector<std::string> normalizeTags(const std::vector<std::string>& tags) {
    std::vector<std::string> normalized;
    for (const auto& tag : tags) {
        auto begin = tag.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            continue;
        }
        auto end = tag.find_last_not_of(" \t\r\n");
        std::string value = tag.substr(begin, end - begin + 1);
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        normalized.push_back(std::move(value));
    }
    std::sort(normalized.begin(), normalized.end());
    normalized.erase(std::unique(normalized.begin(), normalized.end()), normalized.end());
    return normalized;
}

} // namespace planrunner::core::plan

#endif // PLANRUNNER_CORE_PLAN_PLAN_H
