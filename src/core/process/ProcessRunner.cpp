#include "core/process/ProcessRunner.h"
#include "core/logging/Logger.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace planrunner::core::process {

using logging::Logger;
using Clock = std::chrono::steady_clock;

namespace {

constexpr int kPollIntervalMs = 100;

void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        sigaction(SIGPIPE, &action, nullptr);
    });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        std::string name = eq == std::string::npos ? item : item.substr(0, eq);
        if (overrides.count(name) == 0) {
            env.push_back(std::move(item));
        }
    }
    for (const auto& [name, value] : overrides) {
        env.push_back(name + "=" + value);
    }
    return env;
}

std::vector<char*> toCharPointers(std::vector<std::string>& values) {
    std::vector<char*> pointers;
    pointers.reserve(values.size() + 1);
    for (auto& value : values) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

// Reads whatever is available; returns false on EOF or a hard error.
bool drainFd(int fd, std::string& sink, bool echo) {
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            sink.append(chunk, static_cast<size_t>(n));
            if (echo) {
                std::cerr.write(chunk, n);
                std::cerr.flush();
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void fillExitStatus(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
        result.exitCode = 128 + result.termSignal;
    }
}

} // namespace

ProcessResult ProcessRunner::run(const ProcessOptions& options) {
    ProcessResult result;
    if (options.argv.empty()) {
        result.spawnFailed = true;
        result.errorMessage = "empty command line";
        return result;
    }

    ignoreSigpipe();

    std::vector<std::string> argvStorage = options.argv;
    std::vector<char*> argv = toCharPointers(argvStorage);
    std::vector<std::string> envStorage = buildEnvironment(options.env);
    std::vector<char*> envp = toCharPointers(envStorage);
    const std::string workingDirectory = options.workingDirectory.string();
    const bool piped = !options.inheritStdio;

    int errorPipe[2] = {-1, -1};
    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int devNull = -1;

    auto closeAll = [&] {
        for (int* fd : {&errorPipe[0], &errorPipe[1], &inPipe[0], &inPipe[1], &outPipe[0], &outPipe[1],
                        &errPipe[0], &errPipe[1], &devNull}) {
            closeFd(*fd);
        }
    };

    bool pipesOk = ::pipe2(errorPipe, O_CLOEXEC) == 0;
    if (pipesOk && piped) {
        pipesOk = ::pipe2(outPipe, O_CLOEXEC) == 0 && ::pipe2(errPipe, O_CLOEXEC) == 0;
        if (pipesOk && options.stdinData) {
            pipesOk = ::pipe2(inPipe, O_CLOEXEC) == 0;
        } else if (pipesOk) {
            devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            pipesOk = devNull >= 0;
        }
    }
    if (!pipesOk) {
        result.spawnFailed = true;
        result.errorMessage = std::string("pipe() failed: ") + std::strerror(errno);
        closeAll();
        return result;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        result.spawnFailed = true;
        result.errorMessage = std::string("fork() failed: ") + std::strerror(errno);
        closeAll();
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        if (piped) {
            ::setpgid(0, 0);
            ::dup2(options.stdinData ? inPipe[0] : devNull, STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
        }
        if (!workingDirectory.empty() && ::chdir(workingDirectory.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(errorPipe[1]);
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(devNull);

    int childErrno = 0;
    ssize_t errorBytes;
    do {
        errorBytes = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
    } while (errorBytes < 0 && errno == EINTR);
    closeFd(errorPipe[0]);

    if (errorBytes == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        closeAll();
        result.spawnFailed = true;
        result.errorMessage = "failed to start '" + options.argv[0] + "'" +
                              (workingDirectory.empty() ? "" : " in " + workingDirectory) + ": " +
                              std::strerror(childErrno);
        Logger::get("process")->error("[ProcessRunner] {}", result.errorMessage);
        return result;
    }

    Logger::get("process")->debug("[ProcessRunner] Started pid {}: {}", pid, options.argv[0]);

    int stdinFd = inPipe[1];
    int stdoutFd = outPipe[0];
    int stderrFd = errPipe[0];
    size_t stdinOffset = 0;
    for (int fd : {stdinFd, stdoutFd, stderrFd}) {
        if (fd >= 0) {
            setNonBlocking(fd);
        }
    }

    const pid_t killTarget = piped ? -pid : pid;
    auto lastActivity = Clock::now();
    std::optional<Clock::time_point> killDeadline;
    bool reaped = false;
    int status = 0;

    auto beginTermination = [&](const std::string& reason) {
        if (killDeadline) {
            return;
        }
        Logger::get("process")->warn("[ProcessRunner] Terminating pid {}: {}", pid, reason);
        ::kill(killTarget, SIGTERM);
        killDeadline = Clock::now() + options.terminateGrace;
    };

    while (true) {
        std::vector<pollfd> fds;
        if (stdinFd >= 0) {
            fds.push_back({stdinFd, POLLOUT, 0});
        }
        if (stdoutFd >= 0) {
            fds.push_back({stdoutFd, POLLIN, 0});
        }
        if (stderrFd >= 0) {
            fds.push_back({stderrFd, POLLIN, 0});
        }

        if (fds.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs / 2));
        } else {
            int ready = ::poll(fds.data(), fds.size(), kPollIntervalMs);
            if (ready < 0 && errno != EINTR) {
                result.errorMessage = std::string("poll() failed: ") + std::strerror(errno);
                beginTermination(result.errorMessage);
            }
        }

        for (const auto& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }
            if (entry.fd == stdinFd) {
                if (entry.revents & (POLLERR | POLLHUP)) {
                    closeFd(stdinFd);
                    continue;
                }
                const std::string& data = *options.stdinData;
                ssize_t n = ::write(stdinFd, data.data() + stdinOffset, data.size() - stdinOffset);
                if (n > 0) {
                    stdinOffset += static_cast<size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    closeFd(stdinFd);
                }
                if (stdinFd >= 0 && stdinOffset >= data.size()) {
                    closeFd(stdinFd);
                }
            } else if (entry.fd == stdoutFd) {
                size_t before = result.stdoutText.size();
                if (!drainFd(stdoutFd, result.stdoutText, options.echoOutput)) {
                    closeFd(stdoutFd);
                }
                if (result.stdoutText.size() != before) {
                    lastActivity = Clock::now();
                }
            } else if (entry.fd == stderrFd) {
                size_t before = result.stderrText.size();
                if (!drainFd(stderrFd, result.stderrText, options.echoOutput)) {
                    closeFd(stderrFd);
                }
                if (result.stderrText.size() != before) {
                    lastActivity = Clock::now();
                }
            }
        }
        if (stdinFd >= 0 && options.stdinData && stdinOffset >= options.stdinData->size()) {
            closeFd(stdinFd);
        }

        if (!reaped) {
            pid_t waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                reaped = true;
            }
        }
        if (reaped) {
            // Grandchildren may still hold the pipes; take what is buffered and stop
            if (stdoutFd >= 0) {
                drainFd(stdoutFd, result.stdoutText, options.echoOutput);
            }
            if (stderrFd >= 0) {
                drainFd(stderrFd, result.stderrText, options.echoOutput);
            }
            break;
        }

        const auto now = Clock::now();
        if (options.cancellation && options.cancellation->isCancelled() && !result.cancelled) {
            result.cancelled = true;
            beginTermination("cancelled");
        }
        if (piped && options.inactivityTimeout.count() > 0 && !result.timedOut &&
            now - lastActivity > options.inactivityTimeout) {
            result.timedOut = true;
            result.errorMessage = "terminated after inactivity of " +
                                  std::to_string(options.inactivityTimeout.count()) + " ms";
            beginTermination(result.errorMessage);
        }
        if (killDeadline && now >= *killDeadline) {
            ::kill(killTarget, SIGKILL);
            killDeadline = now + std::chrono::hours(24);
        }
    }

    closeFd(stdinFd);
    closeFd(stdoutFd);
    closeFd(stderrFd);

    fillExitStatus(status, result);
    if (result.cancelled && result.errorMessage.empty()) {
        result.errorMessage = "cancelled";
    }
    if (!result.success() && result.errorMessage.empty()) {
        result.errorMessage = result.termSignal != 0
                                  ? "killed by signal " + std::to_string(result.termSignal)
                                  : "exited with code " + std::to_string(result.exitCode);
    }

    Logger::get("process")->debug("[ProcessRunner] pid {} finished: exit {} signal {}",
                                  pid, result.exitCode, result.termSignal);
    return result;
}

ProcessResult ProcessRunner::runShell(const std::string& command, ProcessOptions options) {
    options.argv = {"/bin/sh", "-c", command};
    return run(options);
}

} // namespace planrunner::core::process
