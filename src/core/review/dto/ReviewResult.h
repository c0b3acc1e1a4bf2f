#ifndef PLANRUNNER_CORE_REVIEW_REVIEW_RESULT_H
#define PLANRUNNER_CORE_REVIEW_REVIEW_RESULT_H

#include "core/review/dto/ReviewIssue.h"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace planrunner::core::review {

/**
 * @brief Structured output of a single executor
 */
struct ReviewOutput {
    std::vector<ReviewIssue> issues;
    std::vector<std::string> recommendations;
    std::vector<std::string> actionItems;
};

/**
 * @brief Counts derived from an issue list
 */
struct ReviewSummary {
    size_t totalIssues{0};
    std::map<std::string, size_t> bySeverity;   // every severity present, zero included
    std::map<std::string, size_t> byCategory;   // every category present, zero included
    size_t filesReviewed{0};                     // distinct files referenced by issues
};

/**
 * @brief Merged review of one plan
 */
struct ReviewResult {
    int planId{0};
    std::string planTitle;
    std::vector<size_t> reviewedTaskIndices;
    std::vector<ReviewIssue> issues;
    std::vector<std::string> recommendations;
    std::vector<std::string> actionItems;
    ReviewSummary summary;
    std::vector<std::string> executors;          // executors whose findings are included
    std::vector<std::string> warnings;           // partial failures
};

nlohmann::json reviewIssueToJson(const ReviewIssue& issue);

nlohmann::json reviewResultToJson(const ReviewResult& result);

} // namespace planrunner::core::review

#endif // PLANRUNNER_CORE_REVIEW_REVIEW_RESULT_H
