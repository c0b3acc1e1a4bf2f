#ifndef PLANRUNNER_CORE_REVIEW_REVIEW_ISSUE_H
#define PLANRUNNER_CORE_REVIEW_REVIEW_ISSUE_H

#include <optional>
#include <string>

namespace planrunner::core::review {

enum class ReviewSeverity {
    CRITICAL,
    MAJOR,
    MINOR,
    INFO
};

enum class ReviewCategory {
    SECURITY,
    PERFORMANCE,
    BUG,
    STYLE,
    COMPLIANCE,
    TESTING,
    OTHER
};

inline std::string reviewSeverityToString(ReviewSeverity severity) {
    switch (severity) {
        case ReviewSeverity::CRITICAL: return "critical";
        case ReviewSeverity::MAJOR:    return "major";
        case ReviewSeverity::MINOR:    return "minor";
        case ReviewSeverity::INFO:     return "info";
        default:                       return "unknown";
    }
}

inline std::optional<ReviewSeverity> reviewSeverityFromString(const std::string& text) {
    if (text == "critical") return ReviewSeverity::CRITICAL;
    if (text == "major")    return ReviewSeverity::MAJOR;
    if (text == "minor")    return ReviewSeverity::MINOR;
    if (text == "info")     return ReviewSeverity::INFO;
    return std::nullopt;
}

inline std::string reviewCategoryToString(ReviewCategory category) {
    switch (category) {
        case ReviewCategory::SECURITY:    return "security";
        case ReviewCategory::PERFORMANCE: return "performance";
        case ReviewCategory::BUG:         return "bug";
        case ReviewCategory::STYLE:       return "style";
        case ReviewCategory::COMPLIANCE:  return "compliance";
        case ReviewCategory::TESTING:     return "testing";
        case ReviewCategory::OTHER:       return "other";
        default:                          return "unknown";
    }
}

inline std::optional<ReviewCategory> reviewCategoryFromString(const std::string& text) {
    if (text == "security")    return ReviewCategory::SECURITY;
    if (text == "performance") return ReviewCategory::PERFORMANCE;
    if (text == "bug")         return ReviewCategory::BUG;
    if (text == "style")       return ReviewCategory::STYLE;
    if (text == "compliance")  return ReviewCategory::COMPLIANCE;
    if (text == "testing")     return ReviewCategory::TESTING;
    if (text == "other")       return ReviewCategory::OTHER;
    return std::nullopt;
}

/**
 * @brief One finding reported by a review executor
 */
struct ReviewIssue {
    std::string id;                    // reassigned after merge
    ReviewSeverity severity{ReviewSeverity::INFO};
    ReviewCategory category{ReviewCategory::OTHER};
    std::string content;
    std::optional<std::string> file;
    std::optional<int> line;
    std::string suggestion;
    std::string executor;              // name of the executor that reported it
};

} // namespace planrunner::core::review

#endif // PLANRUNNER_CORE_REVIEW_REVIEW_ISSUE_H
