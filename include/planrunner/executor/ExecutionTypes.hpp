#ifndef PLANRUNNER_EXECUTOR_EXECUTION_TYPES_HPP
#define PLANRUNNER_EXECUTOR_EXECUTION_TYPES_HPP

#include "planrunner/executor/CancellationToken.hpp"
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace planrunner {
namespace executor {

/**
 * @brief What the executor is asked to do
 */
enum class ExecutionMode {
    NORMAL,   // implement plan work
    BARE,     // free chat, prompt may be absent
    REVIEW    // read-only review producing structured findings
};

inline std::string executionModeToString(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::NORMAL: return "normal";
        case ExecutionMode::BARE:   return "bare";
        case ExecutionMode::REVIEW: return "review";
        default:                    return "unknown";
    }
}

enum class ExecutorKind {
    CLAUDE_CODE,
    CODEX_CLI
};

inline std::string executorKindToString(ExecutorKind kind) {
    switch (kind) {
        case ExecutorKind::CLAUDE_CODE: return "claude-code";
        case ExecutorKind::CODEX_CLI:   return "codex-cli";
        default:                        return "unknown";
    }
}

inline std::optional<ExecutorKind> executorKindFromString(const std::string& text) {
    if (text == "claude-code" || text == "claude") return ExecutorKind::CLAUDE_CODE;
    if (text == "codex-cli" || text == "codex")    return ExecutorKind::CODEX_CLI;
    return std::nullopt;
}

/**
 * @brief Feature flags callers query instead of branching on executor names
 */
struct ExecutorCapabilities {
    bool supportsTerminalInput{false};
    bool supportsBatch{false};
    bool requiresPrompt{false};
    bool supportsStructuredOutput{false};
};

struct ExecutionContext {
    std::optional<int> planId;
    std::string planTitle;
    std::string planFilePath;
    std::string workspacePath;
    ExecutionMode mode{ExecutionMode::NORMAL};
    bool batchMode{false};
    bool keepOpen{false};    // interactive session on the caller's terminal
    std::shared_ptr<CancellationToken> cancellation;
    std::optional<std::chrono::milliseconds> inactivityTimeout;   // overrides the executor setting
};

struct ExecutionResult {
    bool success{false};
    int exitCode{-1};
    std::string output;
    std::optional<nlohmann::json> structuredOutput;
    std::string errorMessage;
    bool timedOut{false};
    bool cancelled{false};
};

/**
 * @brief Executors requested for a review: "claude-code", "codex-cli" or "both"
 * @throws std::invalid_argument for any other text
 */
std::vector<ExecutorKind> parseReviewExecutorSelection(const std::string& text);

/**
 * @brief Last top-level JSON object in free text
 *
 * The whole text is tried first, then balanced {...} spans from the end.
 */
std::optional<nlohmann::json> extractLastJsonObject(const std::string& text);

} // namespace executor
} // namespace planrunner

#endif // PLANRUNNER_EXECUTOR_EXECUTION_TYPES_HPP
