#include "core/workspace/core/WorkspaceManager.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"
#include "core/process/PostCommandRunner.h"
#include "core/process/ProcessRunner.h"
#include "core/util/FileUtils.h"
#include <algorithm>
#include <map>

namespace fs = std::filesystem;

namespace planrunner::core::workspace {

using logging::Logger;
using util::FileUtils;

namespace {

std::string repositoryNameFromUrl(const std::string& url) {
    std::string name = url;
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    auto slash = name.find_last_of("/:");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    if (name.size() > 4 && name.compare(name.size() - 4, 4, ".git") == 0) {
        name.erase(name.size() - 4);
    }
    return name.empty() ? "workspace" : name;
}

std::string lastNonEmptyLine(const std::string& text) {
    std::string last;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
        auto b = line.find_first_not_of(" \t\r");
        if (b != std::string::npos) {
            auto e = line.find_last_not_of(" \t\r");
            last = line.substr(b, e - b + 1);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return last;
}

} // namespace

WorkspaceManager::WorkspaceManager(config::WorkspaceCreationConfig config,
                                   fs::path repositoryRoot,
                                   std::shared_ptr<vcs::IVcsClient> vcs,
                                   std::shared_ptr<WorkspaceRegistry> registry,
                                   std::shared_ptr<WorkspaceLockManager> locks)
    : config_(std::move(config)),
      repositoryRoot_(std::move(repositoryRoot)),
      vcs_(std::move(vcs)),
      registry_(std::move(registry)),
      locks_(std::move(locks)),
      identityResolver_(vcs_) {}

std::optional<Workspace> WorkspaceManager::create(const CreateWorkspaceOptions& options) {
    if (options.taskId.empty()) {
        Logger::get("workspace")->error("[WorkspaceManager] Cannot create a workspace without a task id");
        return std::nullopt;
    }

    try {
        return config_.scriptPath ? createWithScript(options) : createManaged(options);
    } catch (const PlanRunnerException& e) {
        Logger::get("workspace")->error("[WorkspaceManager] Workspace creation for {} failed: {}",
                                        options.taskId, e.what());
    } catch (const std::runtime_error& e) {
        Logger::get("workspace")->error("[WorkspaceManager] Workspace creation for {} failed: {}",
                                        options.taskId, e.what());
    }
    return std::nullopt;
}

std::optional<Workspace> WorkspaceManager::createWithScript(const CreateWorkspaceOptions& options) {
    const std::string script = *config_.scriptPath;
    Logger::get("workspace")->info("[WorkspaceManager] Running workspace script {} for {}", script, options.taskId);

    process::ProcessOptions processOptions;
    processOptions.argv = {script};
    processOptions.workingDirectory = repositoryRoot_;
    processOptions.env["PLANRUNNER_TASK_ID"] = options.taskId;
    if (options.planFilePath) {
        processOptions.env["PLANRUNNER_PLAN_FILE_PATH"] = FileUtils::normalizePath(*options.planFilePath);
    }

    auto result = process::ProcessRunner::run(processOptions);
    if (!result.success()) {
        Logger::get("workspace")->error("[WorkspaceManager] Workspace script failed: {}\n{}",
                                        result.errorMessage, result.stderrText);
        return std::nullopt;
    }

    const std::string printed = lastNonEmptyLine(result.stdoutText);
    if (printed.empty()) {
        Logger::get("workspace")->error("[WorkspaceManager] Workspace script printed no path");
        return std::nullopt;
    }
    fs::path workspacePath(printed);
    if (!workspacePath.is_absolute()) {
        Logger::get("workspace")->error("[WorkspaceManager] Workspace script printed a relative path: {}", printed);
        return std::nullopt;
    }
    if (FileUtils::probeDirectory(workspacePath) != util::PathState::DIRECTORY) {
        Logger::get("workspace")->error("[WorkspaceManager] Workspace script path is not a directory: {}", printed);
        return std::nullopt;
    }

    Workspace workspace;
    workspace.path = FileUtils::normalizePath(workspacePath);
    workspace.taskId = options.taskId;
    if (options.planFilePath) {
        workspace.originalPlanFilePath = FileUtils::normalizePath(*options.planFilePath);
    }

    if (!registerWorkspace(workspace, options, std::nullopt)) {
        return std::nullopt;
    }
    return workspace;
}

std::optional<Workspace> WorkspaceManager::createManaged(const CreateWorkspaceOptions& options) {
    std::optional<std::string> repositoryUrl = config_.repositoryUrl;
    if (!repositoryUrl) {
        repositoryUrl = vcs_->remoteUrl(repositoryRoot_);
    }
    if (!repositoryUrl) {
        // Repositories without a remote are cloned from the local checkout
        repositoryUrl = FileUtils::normalizePath(repositoryRoot_);
    }

    const fs::path target = config_.cloneLocation / (repositoryNameFromUrl(*repositoryUrl) + "-" + options.taskId);
    std::error_code ec;
    if (fs::exists(target, ec)) {
        Logger::get("workspace")->error("[WorkspaceManager] Target directory already exists: {}", target.string());
        return std::nullopt;
    }
    fs::create_directories(config_.cloneLocation);

    vcs_->clone(*repositoryUrl, target);

    auto cleanup = [&target](const std::string& why) {
        Logger::get("workspace")->error("[WorkspaceManager] {}; removing {}", why, target.string());
        std::error_code removeError;
        fs::remove_all(target, removeError);
        if (removeError) {
            Logger::get("workspace")->error("[WorkspaceManager] Failed to remove {}: {}", target.string(),
                                            removeError.message());
        }
    };

    Workspace workspace;
    workspace.path = FileUtils::normalizePath(target);
    workspace.taskId = options.taskId;

    if (config_.createBranch) {
        const std::string branch = config_.branchPrefix + options.taskId;
        try {
            vcs_->createBranch(target, branch);
        } catch (const VcsException& e) {
            cleanup(e.what());
            return std::nullopt;
        }
        workspace.branch = branch;
    }

    if (options.planFilePath) {
        workspace.originalPlanFilePath = FileUtils::normalizePath(*options.planFilePath);
        if (config_.copyPlanFile) {
            const fs::path destination = pathInWorkspace(*options.planFilePath, target);
            fs::create_directories(destination.parent_path(), ec);
            fs::copy_file(*options.planFilePath, destination, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                cleanup("Failed to copy plan file: " + ec.message());
                return std::nullopt;
            }
            workspace.planFilePathInWorkspace = destination.string();
        }
    }

    std::map<std::string, std::string> env{{"PLANRUNNER_TASK_ID", options.taskId}};
    if (workspace.planFilePathInWorkspace || workspace.originalPlanFilePath) {
        env["PLANRUNNER_PLAN_FILE_PATH"] = workspace.planFilePathInWorkspace ? *workspace.planFilePathInWorkspace
                                                                             : *workspace.originalPlanFilePath;
    }
    if (!process::PostCommandRunner::runAll(config_.postCloneCommands, target, env)) {
        cleanup("Post-clone command failed");
        return std::nullopt;
    }

    if (!registerWorkspace(workspace, options, repositoryUrl)) {
        cleanup("Registration of the new workspace failed");
        return std::nullopt;
    }
    Logger::get("workspace")->info("[WorkspaceManager] Created workspace {} for {}", workspace.path, options.taskId);
    return workspace;
}

std::string WorkspaceManager::pathInWorkspace(const fs::path& planFile, const fs::path& workspaceRoot) const {
    const fs::path absolutePlan = FileUtils::normalizePath(planFile);
    const fs::path root = FileUtils::normalizePath(repositoryRoot_);
    fs::path relative = absolutePlan.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        relative = absolutePlan.filename();
    }
    return (workspaceRoot / relative).string();
}

bool WorkspaceManager::registerWorkspace(Workspace& workspace, const CreateWorkspaceOptions& options,
                                         const std::optional<std::string>& repositoryUrl) {
    // Lock first so a workspace that cannot be held is never registered
    if (options.lockAfterCreate) {
        auto result = locks_->tryAcquire(workspace.path, LockType::PID, "workspace create " + options.taskId);
        if (!result.acquired) {
            Logger::get("workspace")->error("[WorkspaceManager] Could not lock new workspace {}", workspace.path);
            return false;
        }
        workspace.lock = result.lock;
    }

    WorkspaceMetadataPatch patch;
    patch.taskId = FieldPatch<std::string>::set(options.taskId);
    if (workspace.originalPlanFilePath) {
        patch.originalPlanFilePath = FieldPatch<std::string>::set(*workspace.originalPlanFilePath);
    }
    if (options.planId) {
        patch.planId = FieldPatch<int>::set(*options.planId);
    }
    if (options.planTitle) {
        patch.planTitle = FieldPatch<std::string>::set(*options.planTitle);
    }
    patch.stampCreatedAt = true;

    std::optional<std::string> url = repositoryUrl;
    try {
        auto identity = identityResolver_.resolve(repositoryRoot_);
        patch.repositoryId = FieldPatch<std::string>::set(identity.repositoryId);
        if (!url) {
            url = identity.remoteUrl;
        }
    } catch (const VcsException& e) {
        Logger::get("workspace")->warn("[WorkspaceManager] Repository identity unavailable: {}", e.what());
    }
    if (url) {
        patch.repositoryUrl = FieldPatch<std::string>::set(*url);
    }

    try {
        registry_->patchMetadata(workspace.path, patch);
    } catch (const std::runtime_error& e) {
        Logger::get("workspace")->error("[WorkspaceManager] Could not register {}: {}", workspace.path, e.what());
        if (workspace.lock) {
            if (!locks_->release(workspace.path)) {
                Logger::get("workspace")->warn("[WorkspaceManager] Lock on {} was already gone", workspace.path);
            }
            workspace.lock.reset();
        }
        return false;
    }
    return true;
}

WorkspaceAutoSelector::WorkspaceAutoSelector(std::shared_ptr<WorkspaceRegistry> registry,
                                             std::shared_ptr<WorkspaceLockManager> locks)
    : registry_(std::move(registry)), locks_(std::move(locks)) {}

std::optional<WorkspaceEntry> WorkspaceAutoSelector::select(const std::string& repositoryId,
                                                            std::optional<int> preferredPlanId) {
    ListOptions listOptions;
    listOptions.repositoryId = repositoryId;
    listOptions.includeBranch = false;

    std::vector<WorkspaceEntry> available;
    for (const auto& item : registry_->listEntries(listOptions)) {
        if (item.state != util::PathState::DIRECTORY) {
            continue;
        }
        const std::string& path = item.entry.workspacePath;
        if (locks_->clearStaleLock(path)) {
            Logger::get("workspace")->info("[WorkspaceAutoSelector] Cleared stale lock on {}", path);
        }
        if (locks_->isLocked(path)) {
            continue;
        }
        available.push_back(item.entry);
    }

    if (available.empty()) {
        return std::nullopt;
    }

    if (preferredPlanId) {
        auto preferred = std::find_if(available.begin(), available.end(), [&](const WorkspaceEntry& entry) {
            return entry.planId && *entry.planId == *preferredPlanId;
        });
        if (preferred != available.end()) {
            return *preferred;
        }
    }

    std::stable_sort(available.begin(), available.end(), [](const WorkspaceEntry& a, const WorkspaceEntry& b) {
        return a.updatedAt.value_or("") < b.updatedAt.value_or("");
    });
    return available.front();
}

} // namespace planrunner::core::workspace
