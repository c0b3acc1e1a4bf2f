#ifndef PLANRUNNER_CORE_REVIEW_REVIEW_OUTPUT_PARSER_H
#define PLANRUNNER_CORE_REVIEW_REVIEW_OUTPUT_PARSER_H

#include "core/review/dto/ReviewResult.h"
#include <nlohmann/json.hpp>
#include <string>

namespace planrunner::core::review {

/**
 * @brief Strict validation of executor review output
 *
 * Expected shape:
 * {"issues":[{"severity","category","content","file","line","suggestion"}],
 *  "recommendations":[...], "actionItems":[...]}
 *
 * Unknown keys, unknown enum values and wrong types are rejected.
 */
class ReviewOutputParser {
public:
    /**
     * @throws ValidationException describing the first violation
     */
    static ReviewOutput parse(const nlohmann::json& output, const std::string& executorName);

private:
    static ReviewIssue parseIssue(const nlohmann::json& value, size_t index, const std::string& executorName);
    static std::vector<std::string> parseStringList(const nlohmann::json& value, const std::string& key);
};

} // namespace planrunner::core::review

#endif // PLANRUNNER_CORE_REVIEW_REVIEW_OUTPUT_PARSER_H
