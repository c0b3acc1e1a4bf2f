#ifndef PLANRUNNER_CORE_WORKSPACE_WORKSPACE_MANAGER_H
#define PLANRUNNER_CORE_WORKSPACE_WORKSPACE_MANAGER_H

#include "core/config/PlanRunnerConfig.h"
#include "core/vcs/interfaces/IVcsClient.h"
#include "core/workspace/core/RepositoryIdentityResolver.h"
#include "core/workspace/core/WorkspaceLockManager.h"
#include "core/workspace/core/WorkspaceRegistry.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace planrunner::core::workspace {

struct CreateWorkspaceOptions {
    std::string taskId;
    std::optional<std::filesystem::path> planFilePath;
    std::optional<int> planId;
    std::optional<std::string> planTitle;
    bool lockAfterCreate{false};
};

/**
 * @brief Newly created workspace
 */
struct Workspace {
    std::string path;
    std::string taskId;
    std::optional<std::string> branch;
    std::optional<std::string> originalPlanFilePath;
    std::optional<std::string> planFilePathInWorkspace;
    std::optional<LockInfo> lock;
};

/**
 * @brief Creates isolated workspaces and registers them
 *
 * Script strategy (workspaceCreation.scriptPath set): the script runs in the
 * repository root with PLANRUNNER_TASK_ID and PLANRUNNER_PLAN_FILE_PATH set
 * and prints the absolute workspace path on stdout.
 *
 * Managed strategy: clone into <cloneLocation>/<repo>-<taskId>, create the
 * task branch, copy the plan file, then run the post-clone commands inside
 * the clone. A failing command without allowFailure removes the clone.
 */
class WorkspaceManager {
public:
    WorkspaceManager(config::WorkspaceCreationConfig config,
                     std::filesystem::path repositoryRoot,
                     std::shared_ptr<vcs::IVcsClient> vcs,
                     std::shared_ptr<WorkspaceRegistry> registry,
                     std::shared_ptr<WorkspaceLockManager> locks);

    /**
     * @brief Create and register a workspace
     *
     * Failures are logged and reported as std::nullopt; nothing is thrown.
     */
    std::optional<Workspace> create(const CreateWorkspaceOptions& options);

private:
    std::optional<Workspace> createWithScript(const CreateWorkspaceOptions& options);
    std::optional<Workspace> createManaged(const CreateWorkspaceOptions& options);
    bool registerWorkspace(Workspace& workspace, const CreateWorkspaceOptions& options,
                           const std::optional<std::string>& repositoryUrl);
    std::string pathInWorkspace(const std::filesystem::path& planFile,
                                const std::filesystem::path& workspaceRoot) const;

    config::WorkspaceCreationConfig config_;
    std::filesystem::path repositoryRoot_;
    std::shared_ptr<vcs::IVcsClient> vcs_;
    std::shared_ptr<WorkspaceRegistry> registry_;
    std::shared_ptr<WorkspaceLockManager> locks_;
    RepositoryIdentityResolver identityResolver_;
};

/**
 * @brief Picks a reusable workspace for a repository
 */
class WorkspaceAutoSelector {
public:
    WorkspaceAutoSelector(std::shared_ptr<WorkspaceRegistry> registry,
                          std::shared_ptr<WorkspaceLockManager> locks);

    /**
     * @brief Existing, unlocked workspace of the repository
     *
     * Stale locks are cleared on the way. A workspace already associated
     * with preferredPlanId wins; otherwise the least recently updated one.
     */
    std::optional<WorkspaceEntry> select(const std::string& repositoryId,
                                         std::optional<int> preferredPlanId = std::nullopt);

private:
    std::shared_ptr<WorkspaceRegistry> registry_;
    std::shared_ptr<WorkspaceLockManager> locks_;
};

} // namespace planrunner::core::workspace

#endif // PLANRUNNER_CORE_WORKSPACE_WORKSPACE_MANAGER_H
