#include "core/review/core/ReviewTaskScope.h"
#include "core/error/Exceptions.h"
#include <algorithm>
#include <cctype>
#include <set>

namespace planrunner::core::review {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string join(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += item;
    }
    return joined;
}

} // namespace

std::vector<size_t> ReviewTaskScope::select(const plan::Plan& plan, const ReviewTaskFilter& filter) {
    std::vector<size_t> all(plan.tasks.size());
    for (size_t i = 0; i < all.size(); ++i) {
        all[i] = i;
    }
    if (filter.empty()) {
        return all;
    }

    std::set<size_t> selected;
    std::vector<std::string> unknownIndices;
    for (int index : filter.indices) {
        if (index < 0 || static_cast<size_t>(index) >= plan.tasks.size()) {
            unknownIndices.push_back(std::to_string(index));
            continue;
        }
        selected.insert(static_cast<size_t>(index));
    }

    std::vector<std::string> unknownTitles;
    for (const auto& title : filter.titles) {
        const std::string wanted = toLower(title);
        bool matched = false;
        for (size_t i = 0; i < plan.tasks.size(); ++i) {
            if (toLower(plan.tasks[i].title) == wanted) {
                selected.insert(i);
                matched = true;
            }
        }
        if (!matched) {
            unknownTitles.push_back("\"" + title + "\"");
        }
    }

    if (!unknownIndices.empty() || !unknownTitles.empty()) {
        std::vector<std::string> parts;
        if (!unknownIndices.empty()) {
            parts.push_back("Unknown task indexes: " + join(unknownIndices));
        }
        if (!unknownTitles.empty()) {
            parts.push_back("Unknown task titles: " + join(unknownTitles));
        }
        std::string message = parts[0];
        if (parts.size() > 1) {
            message += "; " + parts[1];
        }
        throw ValidationException("plan " + std::to_string(plan.id) + ": " + message);
    }

    return std::vector<size_t>(selected.begin(), selected.end());
}

} // namespace planrunner::core::review
