#include "core/readiness/ReadinessResolver.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace planrunner::core::readiness {

using plan::Plan;
using plan::PlanMap;
using plan::PlanStatus;

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool hasAnyTag(const Plan& plan, const std::vector<std::string>& wanted) {
    for (const auto& tag : plan::normalizeTags(wanted)) {
        if (std::binary_search(plan.tags.begin(), plan.tags.end(), tag)) {
            return true;
        }
    }
    return false;
}

} // namespace

std::optional<SortField> sortFieldFromString(const std::string& text) {
    if (text == "priority") return SortField::PRIORITY;
    if (text == "id")       return SortField::ID;
    if (text == "title")    return SortField::TITLE;
    if (text == "created")  return SortField::CREATED;
    if (text == "updated")  return SortField::UPDATED;
    return std::nullopt;
}

bool ReadinessResolver::isReady(const Plan& plan, const PlanMap& allPlans) {
    if (plan.status != PlanStatus::PENDING && plan.status != PlanStatus::IN_PROGRESS) {
        return false;
    }
    if (plan.tasks.empty()) {
        return false;
    }
    return blockingDependencies(plan, allPlans).empty();
}

std::vector<int> ReadinessResolver::blockingDependencies(const Plan& plan, const PlanMap& allPlans) {
    std::vector<int> blocking;
    for (int depId : plan.dependencies) {
        auto it = allPlans.find(depId);
        if (it == allPlans.end() || it->second.status != PlanStatus::DONE) {
            blocking.push_back(depId);
        }
    }
    return blocking;
}

std::vector<int> ReadinessResolver::ancestorChain(const Plan& plan, const PlanMap& allPlans) {
    std::vector<int> chain;
    std::set<int> visited{plan.id};

    std::optional<int> current = plan.parent;
    while (current && visited.insert(*current).second) {
        chain.push_back(*current);
        auto it = allPlans.find(*current);
        if (it == allPlans.end()) {
            break;
        }
        current = it->second.parent;
    }
    return chain;
}

bool ReadinessResolver::belongsToEpic(const Plan& plan, int epicId, const PlanMap& allPlans) {
    if (plan.id == epicId) {
        return true;
    }
    auto chain = ancestorChain(plan, allPlans);
    return std::find(chain.begin(), chain.end(), epicId) != chain.end();
}

void ReadinessResolver::sortPlans(std::vector<Plan>& plans, SortField field, bool reverse) {
    auto byPriority = [](const Plan& a, const Plan& b) {
        int rankA = plan::priorityRank(a.priority);
        int rankB = plan::priorityRank(b.priority);
        if (rankA != rankB) {
            return rankA > rankB;
        }
        if (a.createdAt != b.createdAt) {
            return a.createdAt < b.createdAt;
        }
        return a.id < b.id;
    };

    switch (field) {
        case SortField::PRIORITY:
            std::stable_sort(plans.begin(), plans.end(), byPriority);
            break;
        case SortField::ID:
            std::stable_sort(plans.begin(), plans.end(),
                             [](const Plan& a, const Plan& b) { return a.id < b.id; });
            break;
        case SortField::TITLE:
            std::stable_sort(plans.begin(), plans.end(), [](const Plan& a, const Plan& b) {
                auto titleA = lowercase(a.displayTitle());
                auto titleB = lowercase(b.displayTitle());
                if (titleA != titleB) {
                    return titleA < titleB;
                }
                if (a.createdAt != b.createdAt) {
                    return a.createdAt < b.createdAt;
                }
                return a.id < b.id;
            });
            break;
        case SortField::CREATED:
            std::stable_sort(plans.begin(), plans.end(), [](const Plan& a, const Plan& b) {
                if (a.createdAt != b.createdAt) {
                    return a.createdAt < b.createdAt;
                }
                return a.id < b.id;
            });
            break;
        case SortField::UPDATED:
            std::stable_sort(plans.begin(), plans.end(), [](const Plan& a, const Plan& b) {
                if (a.updatedAt != b.updatedAt) {
                    return a.updatedAt < b.updatedAt;
                }
                if (a.createdAt != b.createdAt) {
                    return a.createdAt < b.createdAt;
                }
                return a.id < b.id;
            });
            break;
    }

    if (reverse) {
        std::reverse(plans.begin(), plans.end());
    }
}

std::vector<Plan> ReadinessResolver::filterAndSort(const PlanMap& allPlans, const ReadyFilterOptions& options) {
    std::vector<Plan> ready;

    for (const auto& [id, plan] : allPlans) {
        if (!isReady(plan, allPlans)) {
            continue;
        }
        if (options.pendingOnly && plan.status != PlanStatus::PENDING) {
            continue;
        }
        if (!options.priorities.empty()) {
            if (!plan.priority ||
                std::find(options.priorities.begin(), options.priorities.end(), *plan.priority) ==
                    options.priorities.end()) {
                continue;
            }
        }
        if (!options.tags.empty() && !hasAnyTag(plan, options.tags)) {
            continue;
        }
        if (options.epicId && !belongsToEpic(plan, *options.epicId, allPlans)) {
            continue;
        }
        ready.push_back(plan);
    }

    sortPlans(ready, options.sortField, options.reverse);

    if (options.limit && ready.size() > *options.limit) {
        ready.resize(*options.limit);
    }
    return ready;
}

std::optional<Plan> ReadinessResolver::findNextReadyPlan(const PlanMap& allPlans, const ReadyFilterOptions& options) {
    ReadyFilterOptions first = options;
    first.limit = 1;
    auto ready = filterAndSort(allPlans, first);
    if (ready.empty()) {
        return std::nullopt;
    }
    return ready.front();
}

std::vector<int> ReadinessResolver::findDependencyCycle(const PlanMap& allPlans) {
    enum class Mark { UNVISITED, ON_STACK, DONE };
    std::map<int, Mark> marks;
    for (const auto& [id, plan] : allPlans) {
        marks[id] = Mark::UNVISITED;
    }

    struct Frame {
        int id;
        size_t nextDependency;
    };

    for (const auto& [startId, startPlan] : allPlans) {
        if (marks[startId] != Mark::UNVISITED) {
            continue;
        }

        std::vector<Frame> stack{{startId, 0}};
        marks[startId] = Mark::ON_STACK;

        while (!stack.empty()) {
            Frame& frame = stack.back();
            const auto& dependencies = allPlans.at(frame.id).dependencies;

            if (frame.nextDependency >= dependencies.size()) {
                marks[frame.id] = Mark::DONE;
                stack.pop_back();
                continue;
            }

            int depId = dependencies[frame.nextDependency++];
            auto mark = marks.find(depId);
            if (mark == marks.end() || mark->second == Mark::DONE) {
                continue;
            }
            if (mark->second == Mark::ON_STACK) {
                std::vector<int> cycle;
                auto begin = std::find_if(stack.begin(), stack.end(),
                                          [depId](const Frame& f) { return f.id == depId; });
                for (auto it = begin; it != stack.end(); ++it) {
                    cycle.push_back(it->id);
                }
                cycle.push_back(depId);
                return cycle;
            }

            mark->second = Mark::ON_STACK;
            stack.push_back({depId, 0});
        }
    }
    return {};
}

} // namespace planrunner::core::readiness
