#include "core/review/dto/ReviewResult.h"

namespace planrunner::core::review {

nlohmann::json reviewIssueToJson(const ReviewIssue& issue) {
    nlohmann::json json = {
        {"id", issue.id},
        {"severity", reviewSeverityToString(issue.severity)},
        {"category", reviewCategoryToString(issue.category)},
        {"content", issue.content},
        {"file", issue.file ? nlohmann::json(*issue.file) : nlohmann::json(nullptr)},
        {"line", issue.line ? nlohmann::json(*issue.line) : nlohmann::json(nullptr)},
        {"suggestion", issue.suggestion},
    };
    if (!issue.executor.empty()) {
        json["executor"] = issue.executor;
    }
    return json;
}

nlohmann::json reviewResultToJson(const ReviewResult& result) {
    nlohmann::json issues = nlohmann::json::array();
    for (const auto& issue : result.issues) {
        issues.push_back(reviewIssueToJson(issue));
    }

    return {
        {"planId", result.planId},
        {"planTitle", result.planTitle},
        {"reviewedTaskIndices", result.reviewedTaskIndices},
        {"issues", issues},
        {"recommendations", result.recommendations},
        {"actionItems", result.actionItems},
        {"summary", {
            {"totalIssues", result.summary.totalIssues},
            {"bySeverity", result.summary.bySeverity},
            {"byCategory", result.summary.byCategory},
            {"filesReviewed", result.summary.filesReviewed},
        }},
        {"executors", result.executors},
        {"warnings", result.warnings},
    };
}

} // namespace planrunner::core::review
