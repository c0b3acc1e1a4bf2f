#include "planrunner/executor/SubprocessExecutor.hpp"
#include "core/logging/Logger.h"
#include "core/process/ProcessRunner.h"

namespace planrunner {
namespace executor {

using core::logging::Logger;

namespace {

// Keeps the tail of stderr so error messages stay readable
std::string tail(const std::string& text, size_t maxChars = 2000) {
    if (text.size() <= maxChars) {
        return text;
    }
    return "..." + text.substr(text.size() - maxChars);
}

// claude --output-format json wraps the reply as {"type":"result","result":"..."}
std::optional<nlohmann::json> unwrapStructuredOutput(const std::string& output) {
    auto object = extractLastJsonObject(output);
    if (object && object->value("type", "") == "result" && object->contains("result") &&
        (*object)["result"].is_string()) {
        return extractLastJsonObject((*object)["result"].get<std::string>());
    }
    return object;
}

} // namespace

SubprocessExecutor::SubprocessExecutor(ExecutorKind kind, config::ExecutorSettings settings)
    : kind_(kind), settings_(std::move(settings)) {}

std::string SubprocessExecutor::name() const {
    return executorKindToString(kind_);
}

ExecutorCapabilities SubprocessExecutor::capabilitiesFor(ExecutorKind kind) {
    ExecutorCapabilities caps;
    switch (kind) {
        case ExecutorKind::CLAUDE_CODE:
            caps.supportsTerminalInput = true;
            caps.supportsBatch = true;
            caps.requiresPrompt = false;
            caps.supportsStructuredOutput = true;
            break;
        case ExecutorKind::CODEX_CLI:
            caps.supportsTerminalInput = false;
            caps.supportsBatch = true;
            caps.requiresPrompt = true;
            caps.supportsStructuredOutput = true;
            break;
    }
    return caps;
}

ExecutorCapabilities SubprocessExecutor::capabilities() const {
    return capabilitiesFor(kind_);
}

std::vector<std::string> SubprocessExecutor::buildCommandLine(const std::optional<std::string>& prompt,
                                                              bool interactive) const {
    std::vector<std::string> argv{settings_.command};
    if (!interactive) {
        argv.insert(argv.end(), settings_.args.begin(), settings_.args.end());
    }
    if (!settings_.model.empty()) {
        argv.push_back("--model");
        argv.push_back(settings_.model);
    }
    // Interactive sessions take the opening prompt as an argument; stdin belongs to the user
    if (interactive && prompt) {
        argv.push_back(*prompt);
    }
    return argv;
}

ExecutionResult SubprocessExecutor::execute(const std::optional<std::string>& prompt,
                                            const ExecutionContext& context) {
    const auto caps = capabilities();
    ExecutionResult result;

    if (!prompt && caps.requiresPrompt) {
        result.errorMessage = "prompt required: " + name() + " cannot start without a prompt";
        Logger::get("executor")->error("[SubprocessExecutor] {}", result.errorMessage);
        return result;
    }

    const bool interactive = caps.supportsTerminalInput && (context.keepOpen || !prompt);
    if (context.keepOpen && !caps.supportsTerminalInput) {
        Logger::get("executor")->warn("[SubprocessExecutor] {} has no terminal input; running single-shot", name());
    }

    core::process::ProcessOptions options;
    options.argv = buildCommandLine(prompt, interactive);
    options.workingDirectory = context.workspacePath;
    options.inheritStdio = interactive;
    options.echoOutput = !interactive && context.mode != ExecutionMode::REVIEW;
    options.cancellation = context.cancellation;
    options.inactivityTimeout = context.inactivityTimeout
                                    ? *context.inactivityTimeout
                                    : std::chrono::milliseconds(settings_.inactivityTimeoutMs);
    if (!interactive) {
        options.stdinData = prompt;
    }

    options.env["PLANRUNNER_EXECUTION_MODE"] = executionModeToString(context.mode);
    if (context.planId) {
        options.env["PLANRUNNER_PLAN_ID"] = std::to_string(*context.planId);
    }
    if (!context.planFilePath.empty()) {
        options.env["PLANRUNNER_PLAN_FILE"] = context.planFilePath;
    }
    if (context.batchMode) {
        options.env["PLANRUNNER_BATCH_MODE"] = "1";
    }

    Logger::get("executor")->info("[SubprocessExecutor] Starting {} ({} mode{}) in {}", name(),
                                  executionModeToString(context.mode), interactive ? ", interactive" : "",
                                  context.workspacePath.empty() ? "." : context.workspacePath);

    auto processResult = core::process::ProcessRunner::run(options);

    result.exitCode = processResult.exitCode;
    result.output = processResult.stdoutText;
    result.timedOut = processResult.timedOut;
    result.cancelled = processResult.cancelled;
    result.success = processResult.success();

    if (!result.success) {
        result.errorMessage = processResult.errorMessage;
        if (result.errorMessage.empty()) {
            result.errorMessage = name() + " exited with code " + std::to_string(processResult.exitCode);
        }
        if (!processResult.stderrText.empty()) {
            result.errorMessage += "\n" + tail(processResult.stderrText);
        }
        Logger::get("executor")->error("[SubprocessExecutor] {} failed: {}", name(), result.errorMessage);
        return result;
    }

    if (caps.supportsStructuredOutput && !interactive) {
        result.structuredOutput = unwrapStructuredOutput(result.output);
    }
    Logger::get("executor")->debug("[SubprocessExecutor] {} finished ({} bytes of output)", name(),
                                   result.output.size());
    return result;
}

} // namespace executor
} // namespace planrunner
