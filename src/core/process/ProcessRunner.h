#ifndef PLANRUNNER_CORE_PROCESS_PROCESS_RUNNER_H
#define PLANRUNNER_CORE_PROCESS_PROCESS_RUNNER_H

#include "planrunner/executor/CancellationToken.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace planrunner::core::process {

/**
 * @brief How to start a subprocess
 */
struct ProcessOptions {
    std::vector<std::string> argv;                  // argv[0] is looked up in PATH
    std::filesystem::path workingDirectory;         // empty => inherit
    std::map<std::string, std::string> env;         // added to the inherited environment
    std::optional<std::string> stdinData;           // written then closed; unset => /dev/null
    bool inheritStdio{false};                       // interactive sessions: child uses our terminal
    bool echoOutput{false};                         // copy captured output to our stderr as it arrives
    std::chrono::milliseconds inactivityTimeout{0}; // 0 disables the watchdog
    std::chrono::milliseconds terminateGrace{2000}; // SIGTERM -> SIGKILL delay
    std::shared_ptr<executor::CancellationToken> cancellation;
};

/**
 * @brief Outcome of a finished subprocess
 */
struct ProcessResult {
    int exitCode{-1};
    int termSignal{0};
    std::string stdoutText;
    std::string stderrText;
    bool timedOut{false};
    bool cancelled{false};
    bool spawnFailed{false};
    std::string errorMessage;

    bool success() const {
        return !spawnFailed && !timedOut && !cancelled && termSignal == 0 && exitCode == 0;
    }
};

/**
 * @brief fork/exec wrapper with piped stdio, inactivity watchdog and cancellation
 *
 * The child runs in its own process group (unless it inherits our terminal)
 * so termination reaches anything it spawned.
 */
class ProcessRunner {
public:
    /**
     * @brief Run to completion
     *
     * Never throws for child failures; spawn errors are reported through
     * ProcessResult::spawnFailed and errorMessage.
     */
    static ProcessResult run(const ProcessOptions& options);

    /**
     * @brief Run a command string through /bin/sh -c
     */
    static ProcessResult runShell(const std::string& command, ProcessOptions options = {});
};

} // namespace planrunner::core::process

#endif // PLANRUNNER_CORE_PROCESS_PROCESS_RUNNER_H
