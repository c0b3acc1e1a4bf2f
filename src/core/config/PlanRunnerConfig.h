#pragma once

#include "ConfigLoader.h"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace planrunner {
namespace config {

/**
 * @brief Shell command run after a clone or after a batch round
 */
struct PostCommand {
    std::string title;
    std::string command;                          // passed to /bin/sh -c
    std::optional<std::string> workingDirectory;  // relative to the workspace root
    std::map<std::string, std::string> env;
    bool allowFailure{false};
    bool hideOutputOnSuccess{false};
};

struct ExecutorSettings {
    std::string command;
    std::vector<std::string> args;
    int inactivityTimeoutMs{0};  // 0 disables the inactivity watchdog
    std::string model;
};

struct WorkspaceCreationConfig {
    std::optional<std::string> scriptPath;     // set => script strategy
    std::optional<std::string> repositoryUrl;  // unset => inferred from origin
    std::filesystem::path cloneLocation;
    bool createBranch{true};
    std::string branchPrefix{"planrunner/"};
    bool copyPlanFile{true};
    std::vector<PostCommand> postCloneCommands;
};

struct ReviewConfig {
    std::string defaultExecutor{"both"};
    bool allowPartialFailures{true};
};

/**
 * @brief Typed view of .planrunner/config.json
 */
struct PlanRunnerConfig {
    std::filesystem::path repositoryRoot;
    std::filesystem::path tasksDirectory;
    std::filesystem::path trackingFile;
    std::filesystem::path lockDirectory;

    std::string defaultExecutor{"claude-code"};
    std::map<std::string, ExecutorSettings> executors;
    ReviewConfig review;
    WorkspaceCreationConfig workspaceCreation;
    std::vector<PostCommand> postApplyCommands;

    std::string logLevel{"info"};
    std::optional<std::string> logFile;

    /**
     * @brief Build the typed configuration from a loaded (or empty) loader
     *
     * Relative paths are resolved against repositoryRoot, "~/" against $HOME.
     * PLANRUNNER_LOCK_DIR overrides paths.lockDirectory.
     *
     * @throws planrunner::core::ConfigException naming the offending key
     */
    static PlanRunnerConfig fromLoader(const ConfigLoader& loader,
                                       const std::filesystem::path& repositoryRoot);

    /**
     * @brief Default location of the configuration file inside a repository
     */
    static std::filesystem::path defaultConfigPath(const std::filesystem::path& repositoryRoot);

    /**
     * @brief Settings for an executor, falling back to built-in defaults
     */
    ExecutorSettings executorSettings(const std::string& name) const;
};

/**
 * @brief Parse a list of post commands from a JSON array
 * @throws planrunner::core::ConfigException naming keyPath on malformed entries
 */
std::vector<PostCommand> parsePostCommands(const nlohmann::json& array, const std::string& keyPath);

} // namespace config
} // namespace planrunner
