#ifndef PLANRUNNER_CORE_PROCESS_POST_COMMAND_RUNNER_H
#define PLANRUNNER_CORE_PROCESS_POST_COMMAND_RUNNER_H

#include "core/config/PlanRunnerConfig.h"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace planrunner::core::process {

/**
 * @brief Result of one configured post command
 */
struct PostCommandOutcome {
    std::string title;
    bool success{false};
    bool allowedFailure{false};   // failed, but marked allowFailure
    int exitCode{0};
    std::string output;
};

/**
 * @brief Runs configured post-clone and post-apply command lists
 *
 * Commands run in order through /bin/sh -c. A failing command marked
 * allowFailure is logged as a warning and the sequence continues; any other
 * failure stops the sequence.
 */
class PostCommandRunner {
public:
    /**
     * @param baseDirectory working directory, and the base for relative workingDirectory values
     * @param extraEnv variables added for every command (per-command env wins)
     * @return false if a command without allowFailure failed
     */
    static bool runAll(const std::vector<config::PostCommand>& commands,
                       const std::filesystem::path& baseDirectory,
                       const std::map<std::string, std::string>& extraEnv,
                       std::vector<PostCommandOutcome>* outcomes = nullptr);

    static PostCommandOutcome runOne(const config::PostCommand& command,
                                     const std::filesystem::path& baseDirectory,
                                     const std::map<std::string, std::string>& extraEnv);
};

} // namespace planrunner::core::process

#endif // PLANRUNNER_CORE_PROCESS_POST_COMMAND_RUNNER_H
