#include "core/review/util/ReviewOutputParser.h"
#include "core/error/Exceptions.h"
#include <set>

namespace planrunner::core::review {

namespace {

const std::set<std::string> kTopLevelKeys = {"issues", "recommendations", "actionItems"};
const std::set<std::string> kIssueKeys = {"id", "severity", "category", "content", "file", "line", "suggestion"};

} // namespace

ReviewOutput ReviewOutputParser::parse(const nlohmann::json& output, const std::string& executorName) {
    if (!output.is_object()) {
        throw ValidationException(executorName + " review output must be a JSON object");
    }
    for (const auto& [key, value] : output.items()) {
        if (kTopLevelKeys.count(key) == 0) {
            throw ValidationException(executorName + " review output has unknown key '" + key + "'");
        }
    }
    if (!output.contains("issues") || !output["issues"].is_array()) {
        throw ValidationException(executorName + " review output must contain an 'issues' array");
    }

    ReviewOutput parsed;
    const auto& issues = output["issues"];
    for (size_t i = 0; i < issues.size(); ++i) {
        parsed.issues.push_back(parseIssue(issues[i], i, executorName));
    }
    if (output.contains("recommendations")) {
        parsed.recommendations = parseStringList(output["recommendations"], executorName + " recommendations");
    }
    if (output.contains("actionItems")) {
        parsed.actionItems = parseStringList(output["actionItems"], executorName + " actionItems");
    }
    return parsed;
}

ReviewIssue ReviewOutputParser::parseIssue(const nlohmann::json& value, size_t index,
                                           const std::string& executorName) {
    const std::string where = executorName + " issue " + std::to_string(index);
    if (!value.is_object()) {
        throw ValidationException(where + " must be an object");
    }
    for (const auto& [key, field] : value.items()) {
        if (kIssueKeys.count(key) == 0) {
            throw ValidationException(where + " has unknown key '" + key + "'");
        }
    }

    auto requireString = [&](const char* key) {
        if (!value.contains(key) || !value[key].is_string()) {
            throw ValidationException(where + " requires string '" + key + "'");
        }
        return value[key].get<std::string>();
    };

    ReviewIssue issue;
    issue.executor = executorName;

    const std::string severity = requireString("severity");
    auto parsedSeverity = reviewSeverityFromString(severity);
    if (!parsedSeverity) {
        throw ValidationException(where + " has unknown severity '" + severity + "'");
    }
    issue.severity = *parsedSeverity;

    const std::string category = requireString("category");
    auto parsedCategory = reviewCategoryFromString(category);
    if (!parsedCategory) {
        throw ValidationException(where + " has unknown category '" + category + "'");
    }
    issue.category = *parsedCategory;

    issue.content = requireString("content");

    if (value.contains("id") && !value["id"].is_null()) {
        if (!value["id"].is_string()) {
            throw ValidationException(where + " 'id' must be a string");
        }
        issue.id = value["id"].get<std::string>();
    }
    if (value.contains("file") && !value["file"].is_null()) {
        if (!value["file"].is_string()) {
            throw ValidationException(where + " 'file' must be a string");
        }
        std::string file = value["file"].get<std::string>();
        if (!file.empty()) {
            issue.file = std::move(file);
        }
    }
    if (value.contains("line") && !value["line"].is_null()) {
        if (!value["line"].is_number_integer() || value["line"].get<long long>() < 0) {
            throw ValidationException(where + " 'line' must be a non-negative integer");
        }
        issue.line = value["line"].get<int>();
    }
    if (value.contains("suggestion") && !value["suggestion"].is_null()) {
        if (!value["suggestion"].is_string()) {
            throw ValidationException(where + " 'suggestion' must be a string");
        }
        issue.suggestion = value["suggestion"].get<std::string>();
    }
    return issue;
}

std::vector<std::string> ReviewOutputParser::parseStringList(const nlohmann::json& value, const std::string& key) {
    if (!value.is_array()) {
        throw ValidationException(key + " must be an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ValidationException(key + " must be an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

} // namespace planrunner::core::review
