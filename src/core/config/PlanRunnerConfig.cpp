#include "PlanRunnerConfig.h"
#include "core/error/Exceptions.h"
#include "core/util/FileUtils.h"
#include <algorithm>
#include <array>
#include <cstdlib>

namespace planrunner {
namespace config {

using core::ConfigException;
using core::util::FileUtils;

namespace {

constexpr std::array<const char*, 2> kExecutorNames = {"claude-code", "codex-cli"};
constexpr std::array<const char*, 6> kLogLevels = {"trace", "debug", "info", "warn", "error", "off"};

template<size_t N>
bool contains(const std::array<const char*, N>& values, const std::string& value) {
    return std::any_of(values.begin(), values.end(),
                       [&value](const char* candidate) { return value == candidate; });
}

std::string requireString(const ConfigLoader& loader, const std::string& key, const std::string& fallback) {
    if (!loader.hasKey(key)) {
        return fallback;
    }
    const auto section = loader.getSection(key);
    if (!section.is_string()) {
        throw ConfigException(key + " must be a string");
    }
    return section.get<std::string>();
}

bool requireBool(const ConfigLoader& loader, const std::string& key, bool fallback) {
    if (!loader.hasKey(key)) {
        return fallback;
    }
    const auto section = loader.getSection(key);
    if (!section.is_boolean()) {
        throw ConfigException(key + " must be a boolean");
    }
    return section.get<bool>();
}

std::filesystem::path resolvePath(const std::filesystem::path& root, const std::string& value) {
    return FileUtils::resolveAgainst(root, value);
}

} // namespace

std::vector<PostCommand> parsePostCommands(const nlohmann::json& array, const std::string& keyPath) {
    if (!array.is_array()) {
        throw ConfigException(keyPath + " must be an array");
    }

    std::vector<PostCommand> commands;
    for (size_t i = 0; i < array.size(); ++i) {
        const auto& item = array[i];
        const std::string itemPath = keyPath + "[" + std::to_string(i) + "]";
        if (!item.is_object()) {
            throw ConfigException(itemPath + " must be an object");
        }
        if (!item.contains("command") || !item["command"].is_string() ||
            item["command"].get<std::string>().empty()) {
            throw ConfigException(itemPath + ".command is required");
        }

        PostCommand command;
        command.command = item["command"].get<std::string>();
        command.title = item.value("title", command.command);
        if (item.contains("workingDirectory") && item["workingDirectory"].is_string()) {
            command.workingDirectory = item["workingDirectory"].get<std::string>();
        }
        if (item.contains("env")) {
            if (!item["env"].is_object()) {
                throw ConfigException(itemPath + ".env must be an object");
            }
            for (const auto& [name, value] : item["env"].items()) {
                if (!value.is_string()) {
                    throw ConfigException(itemPath + ".env." + name + " must be a string");
                }
                command.env[name] = value.get<std::string>();
            }
        }
        command.allowFailure = item.value("allowFailure", false);
        command.hideOutputOnSuccess = item.value("hideOutputOnSuccess", false);
        commands.push_back(std::move(command));
    }
    return commands;
}

std::filesystem::path PlanRunnerConfig::defaultConfigPath(const std::filesystem::path& repositoryRoot) {
    return repositoryRoot / ".planrunner" / "config.json";
}

PlanRunnerConfig PlanRunnerConfig::fromLoader(const ConfigLoader& loader,
                                              const std::filesystem::path& repositoryRoot) {
    PlanRunnerConfig config;
    config.repositoryRoot = repositoryRoot;

    config.tasksDirectory = resolvePath(repositoryRoot, requireString(loader, "paths.tasks", "tasks"));
    config.trackingFile = resolvePath(
        repositoryRoot, requireString(loader, "paths.trackingFile", "~/.config/planrunner/workspaces.json"));

    const char* lockDirEnv = std::getenv("PLANRUNNER_LOCK_DIR");
    if (lockDirEnv && *lockDirEnv) {
        config.lockDirectory = resolvePath(repositoryRoot, lockDirEnv);
    } else {
        config.lockDirectory = resolvePath(
            repositoryRoot, requireString(loader, "paths.lockDirectory", "~/.config/planrunner/locks"));
    }

    config.defaultExecutor = requireString(loader, "defaultExecutor", config.defaultExecutor);
    if (!contains(kExecutorNames, config.defaultExecutor)) {
        throw ConfigException("defaultExecutor: unknown executor '" + config.defaultExecutor + "'");
    }

    if (loader.hasKey("executors")) {
        const auto executors = loader.getSection("executors");
        if (!executors.is_object()) {
            throw ConfigException("executors must be an object");
        }
        for (const auto& [name, value] : executors.items()) {
            if (!contains(kExecutorNames, name)) {
                throw ConfigException("executors." + name + ": unknown executor");
            }
            if (!value.is_object()) {
                throw ConfigException("executors." + name + " must be an object");
            }
            ExecutorSettings settings = config.executorSettings(name);
            settings.command = value.value("command", settings.command);
            if (value.contains("args")) {
                if (!value["args"].is_array()) {
                    throw ConfigException("executors." + name + ".args must be an array");
                }
                settings.args = value["args"].get<std::vector<std::string>>();
            }
            settings.inactivityTimeoutMs = value.value("inactivityTimeoutMs", settings.inactivityTimeoutMs);
            if (settings.inactivityTimeoutMs < 0) {
                throw ConfigException("executors." + name + ".inactivityTimeoutMs must not be negative");
            }
            settings.model = value.value("model", settings.model);
            config.executors[name] = std::move(settings);
        }
    }

    config.review.defaultExecutor = requireString(loader, "review.defaultExecutor", config.review.defaultExecutor);
    if (config.review.defaultExecutor != "both" && !contains(kExecutorNames, config.review.defaultExecutor)) {
        throw ConfigException("review.defaultExecutor: unknown executor '" + config.review.defaultExecutor + "'");
    }
    config.review.allowPartialFailures =
        requireBool(loader, "review.allowPartialFailures", config.review.allowPartialFailures);

    auto& creation = config.workspaceCreation;
    if (loader.hasKey("workspaceCreation.scriptPath")) {
        creation.scriptPath = resolvePath(repositoryRoot,
                                          requireString(loader, "workspaceCreation.scriptPath", "")).string();
    }
    if (loader.hasKey("workspaceCreation.repositoryUrl")) {
        creation.repositoryUrl = requireString(loader, "workspaceCreation.repositoryUrl", "");
    }
    creation.cloneLocation = resolvePath(
        repositoryRoot, requireString(loader, "workspaceCreation.cloneLocation", "~/.planrunner/workspaces/"));
    creation.createBranch = requireBool(loader, "workspaceCreation.createBranch", creation.createBranch);
    creation.branchPrefix = requireString(loader, "workspaceCreation.branchPrefix", creation.branchPrefix);
    creation.copyPlanFile = requireBool(loader, "workspaceCreation.copyPlanFile", creation.copyPlanFile);
    if (loader.hasKey("workspaceCreation.postCloneCommands")) {
        creation.postCloneCommands = parsePostCommands(
            loader.getSection("workspaceCreation.postCloneCommands"), "workspaceCreation.postCloneCommands");
    }

    if (loader.hasKey("postApplyCommands")) {
        config.postApplyCommands = parsePostCommands(loader.getSection("postApplyCommands"), "postApplyCommands");
    }

    config.logLevel = requireString(loader, "logging.level", config.logLevel);
    if (!contains(kLogLevels, config.logLevel)) {
        throw ConfigException("logging.level: unknown level '" + config.logLevel + "'");
    }
    if (loader.hasKey("logging.file")) {
        config.logFile = resolvePath(repositoryRoot, requireString(loader, "logging.file", "")).string();
    }

    return config;
}

ExecutorSettings PlanRunnerConfig::executorSettings(const std::string& name) const {
    auto it = executors.find(name);
    if (it != executors.end()) {
        return it->second;
    }

    ExecutorSettings settings;
    if (name == "codex-cli") {
        settings.command = "codex";
        settings.args = {"exec", "--full-auto"};
    } else {
        settings.command = "claude";
        settings.args = {"--print", "--output-format", "text"};
    }
    return settings;
}

} // namespace config
} // namespace planrunner
