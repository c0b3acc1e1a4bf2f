#ifndef PLANRUNNER_CORE_REVIEW_REVIEW_PROMPT_BUILDER_H
#define PLANRUNNER_CORE_REVIEW_REVIEW_PROMPT_BUILDER_H

#include "core/plan/dto/Plan.h"
#include <string>
#include <vector>

namespace planrunner::core::review {

/**
 * @brief Review prompt for the selected tasks of a plan
 *
 * The prompt ends with the JSON schema the executors must answer with.
 */
class ReviewPromptBuilder {
public:
    static std::string build(const plan::Plan& plan, const std::vector<size_t>& taskIndices);
};

} // namespace planrunner::core::review

#endif // PLANRUNNER_CORE_REVIEW_REVIEW_PROMPT_BUILDER_H
