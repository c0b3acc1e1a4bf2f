#include "planrunner/executor/ExecutionTypes.hpp"
#include <stdexcept>

namespace planrunner {
namespace executor {

std::vector<ExecutorKind> parseReviewExecutorSelection(const std::string& text) {
    if (text == "both") {
        return {ExecutorKind::CLAUDE_CODE, ExecutorKind::CODEX_CLI};
    }
    if (text == "claude-code") {
        return {ExecutorKind::CLAUDE_CODE};
    }
    if (text == "codex-cli") {
        return {ExecutorKind::CODEX_CLI};
    }
    throw std::invalid_argument("Unknown review executor '" + text +
                                "' (expected claude-code, codex-cli or both)");
}

namespace {

std::optional<nlohmann::json> parseObject(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

// Top-level {...} spans in order of appearance. Quotes are only tracked
// inside a span so prose apostrophes do not derail the scan.
std::vector<std::pair<size_t, size_t>> balancedSpans(const std::string& text) {
    std::vector<std::pair<size_t, size_t>> spans;
    int depth = 0;
    bool inString = false;
    bool escaped = false;
    size_t start = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (depth > 0 && inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        if (c == '{') {
            if (depth == 0) {
                start = i;
            }
            ++depth;
        } else if (c == '}' && depth > 0) {
            --depth;
            if (depth == 0) {
                spans.emplace_back(start, i + 1);
            }
        } else if (c == '"' && depth > 0) {
            inString = true;
        }
    }
    return spans;
}

} // namespace

std::optional<nlohmann::json> extractLastJsonObject(const std::string& text) {
    if (auto whole = parseObject(text)) {
        return whole;
    }

    auto spans = balancedSpans(text);
    for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
        if (auto object = parseObject(text.substr(it->first, it->second - it->first))) {
            return object;
        }
    }
    return std::nullopt;
}

} // namespace executor
} // namespace planrunner
