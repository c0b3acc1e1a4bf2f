#ifndef PLANRUNNER_CORE_REVIEW_REVIEW_TASK_SCOPE_H
#define PLANRUNNER_CORE_REVIEW_REVIEW_TASK_SCOPE_H

#include "core/plan/dto/Plan.h"
#include <string>
#include <vector>

namespace planrunner::core::review {

/**
 * @brief Tasks a review is limited to
 *
 * Indices are zero-based. Titles match exactly, ignoring case.
 */
struct ReviewTaskFilter {
    std::vector<int> indices;
    std::vector<std::string> titles;

    bool empty() const { return indices.empty() && titles.empty(); }
};

class ReviewTaskScope {
public:
    /**
     * @brief Union of index and title matches, in plan order
     *
     * An empty filter selects every task.
     *
     * @throws ValidationException listing every unmatched index and title
     */
    static std::vector<size_t> select(const plan::Plan& plan, const ReviewTaskFilter& filter);
};

} // namespace planrunner::core::review

#endif // PLANRUNNER_CORE_REVIEW_REVIEW_TASK_SCOPE_H
