#include "core/process/PostCommandRunner.h"
#include "core/logging/Logger.h"
#include "core/process/ProcessRunner.h"
#include "core/util/FileUtils.h"

namespace planrunner::core::process {

using logging::Logger;

PostCommandOutcome PostCommandRunner::runOne(const config::PostCommand& command,
                                             const std::filesystem::path& baseDirectory,
                                             const std::map<std::string, std::string>& extraEnv) {
    ProcessOptions options;
    options.workingDirectory = command.workingDirectory
                                   ? util::FileUtils::resolveAgainst(baseDirectory, *command.workingDirectory)
                                   : baseDirectory;
    options.env = extraEnv;
    for (const auto& [name, value] : command.env) {
        options.env[name] = value;
    }

    Logger::get("process")->info("[PostCommand] Running '{}' in {}", command.title,
                                 options.workingDirectory.string());
    auto result = ProcessRunner::runShell(command.command, options);

    PostCommandOutcome outcome;
    outcome.title = command.title;
    outcome.success = result.success();
    outcome.exitCode = result.exitCode;
    outcome.output = result.stdoutText + result.stderrText;

    if (outcome.success) {
        if (!command.hideOutputOnSuccess && !outcome.output.empty()) {
            Logger::get("process")->info("[PostCommand] {} output:\n{}", command.title, outcome.output);
        }
        return outcome;
    }

    const std::string reason = result.errorMessage.empty() ? "exit code " + std::to_string(result.exitCode)
                                                           : result.errorMessage;
    if (command.allowFailure) {
        outcome.allowedFailure = true;
        Logger::get("process")->warn("[PostCommand] '{}' failed ({}), continuing because allowFailure is set\n{}",
                                     command.title, reason, outcome.output);
    } else {
        Logger::get("process")->error("[PostCommand] '{}' failed ({})\n{}", command.title, reason, outcome.output);
    }
    return outcome;
}

bool PostCommandRunner::runAll(const std::vector<config::PostCommand>& commands,
                               const std::filesystem::path& baseDirectory,
                               const std::map<std::string, std::string>& extraEnv,
                               std::vector<PostCommandOutcome>* outcomes) {
    for (const auto& command : commands) {
        auto outcome = runOne(command, baseDirectory, extraEnv);
        bool fatal = !outcome.success && !outcome.allowedFailure;
        if (outcomes) {
            outcomes->push_back(outcome);
        }
        if (fatal) {
            return false;
        }
    }
    return true;
}

} // namespace planrunner::core::process
