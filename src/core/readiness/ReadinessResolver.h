#ifndef PLANRUNNER_CORE_READINESS_READINESS_RESOLVER_H
#define PLANRUNNER_CORE_READINESS_READINESS_RESOLVER_H

#include "core/plan/dto/Plan.h"
#include <optional>
#include <string>
#include <vector>

namespace planrunner::core::readiness {

enum class SortField {
    PRIORITY,
    ID,
    TITLE,
    CREATED,
    UPDATED
};

std::optional<SortField> sortFieldFromString(const std::string& text);

/**
 * @brief Filters applied by filterAndSort()
 *
 * Empty lists mean "no filter". Tags match with OR semantics.
 */
struct ReadyFilterOptions {
    std::vector<plan::PlanPriority> priorities;
    std::vector<std::string> tags;
    std::optional<int> epicId;
    bool pendingOnly{false};
    std::optional<size_t> limit;
    SortField sortField{SortField::PRIORITY};
    bool reverse{false};
};

/**
 * @brief Decides which plans may run next
 *
 * Stateless; every function works on a snapshot of the plan map. Walks over
 * parent and dependency links carry a visited set, so cyclic data yields a
 * finite (if meaningless) answer instead of a hang.
 */
class ReadinessResolver {
public:
    /**
     * @brief Plan may execute now
     *
     * True iff status is pending or in_progress, the plan has at least one
     * task, and every dependency resolves to a plan whose status is done.
     */
    static bool isReady(const plan::Plan& plan, const plan::PlanMap& allPlans);

    /**
     * @brief Ready plans matching the filter, in deterministic order
     *
     * Priority sort: priority descending, then createdAt ascending, then id
     * ascending. `reverse` flips the final order.
     */
    static std::vector<plan::Plan> filterAndSort(const plan::PlanMap& allPlans,
                                                 const ReadyFilterOptions& options = {});

    /**
     * @brief Stable sort by the given field
     */
    static void sortPlans(std::vector<plan::Plan>& plans, SortField field, bool reverse = false);

    /**
     * @brief Parent ids from the direct parent upwards, stopping at a repeat
     */
    static std::vector<int> ancestorChain(const plan::Plan& plan, const plan::PlanMap& allPlans);

    /**
     * @brief Plan is the epic itself or descends from it
     */
    static bool belongsToEpic(const plan::Plan& plan, int epicId, const plan::PlanMap& allPlans);

    /**
     * @brief Dependencies that are missing or not done, in declaration order
     */
    static std::vector<int> blockingDependencies(const plan::Plan& plan, const plan::PlanMap& allPlans);

    static std::optional<plan::Plan> findNextReadyPlan(const plan::PlanMap& allPlans,
                                                       const ReadyFilterOptions& options = {});

    /**
     * @brief One dependency cycle as an id path (first id repeated at the end)
     * @return empty if the dependency graph is acyclic
     */
    static std::vector<int> findDependencyCycle(const plan::PlanMap& allPlans);
};

} // namespace planrunner::core::readiness

#endif // PLANRUNNER_CORE_READINESS_READINESS_RESOLVER_H
