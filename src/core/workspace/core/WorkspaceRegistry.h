#ifndef PLANRUNNER_CORE_WORKSPACE_WORKSPACE_REGISTRY_H
#define PLANRUNNER_CORE_WORKSPACE_WORKSPACE_REGISTRY_H

#include "core/vcs/interfaces/IVcsClient.h"
#include "core/workspace/dto/WorkspaceEntry.h"
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace planrunner::core::workspace {

/**
 * @brief Registry file representation; absent optionals are omitted
 */
void to_json(nlohmann::json& j, const WorkspaceEntry& entry);
void from_json(const nlohmann::json& j, WorkspaceEntry& entry);

struct ListOptions {
    std::optional<std::string> repositoryId;
    bool includeBranch{true};
};

/**
 * @brief JSON registry of workspaces, one object keyed by workspace path
 *
 * The file location is injected. Each mutation re-reads the file, applies
 * the change and writes it back atomically; there is no cross-process
 * conflict detection, so concurrent writers end with the last write.
 */
class WorkspaceRegistry {
public:
    WorkspaceRegistry(std::filesystem::path trackingFile, std::shared_ptr<vcs::IVcsClient> vcs);
    ~WorkspaceRegistry() = default;

    WorkspaceRegistry(const WorkspaceRegistry&) = delete;
    WorkspaceRegistry& operator=(const WorkspaceRegistry&) = delete;
    WorkspaceRegistry(WorkspaceRegistry&&) = delete;
    WorkspaceRegistry& operator=(WorkspaceRegistry&&) = delete;

    /**
     * @brief Every entry, keyed by normalized path
     *
     * A missing file is an empty registry.
     *
     * @throws ValidationException if the file is not a JSON object
     */
    std::map<std::string, WorkspaceEntry> readAll() const;

    std::optional<WorkspaceEntry> get(const std::string& workspacePath) const;

    /**
     * @brief Merge a partial update, creating a minimal entry if the path is untracked
     *
     * Always stamps updatedAt.
     */
    WorkspaceEntry patchMetadata(const std::string& workspacePath, const WorkspaceMetadataPatch& patch);

    /**
     * @brief Insert or replace a full entry (used after workspace creation)
     */
    void recordWorkspace(WorkspaceEntry entry);

    bool removeEntry(const std::string& workspacePath);

    std::vector<WorkspaceEntry> findByTaskId(const std::string& taskId) const;

    /**
     * @brief Entries of one repository, compared trimmed and case-insensitively
     */
    std::vector<WorkspaceEntry> findByRepositoryId(const std::string& repositoryId) const;

    /**
     * @brief Entries whose directory still exists, with live branch names
     *
     * Entries whose directory is confirmed missing are left out (not
     * deleted). Entries whose stat failed for another reason are kept and
     * flagged UNKNOWN. A failing branch query yields an empty branch.
     */
    std::vector<WorkspaceListEntry> listEntries(const ListOptions& options = {}) const;

    /**
     * @brief Delete entries whose directory is confirmed missing
     * @return the removed paths
     */
    std::vector<std::string> pruneMissing();

    const std::filesystem::path& trackingFile() const { return trackingFile_; }

    static bool sameRepositoryId(const std::string& a, const std::string& b);

private:
    std::map<std::string, WorkspaceEntry> readLocked() const;
    void writeLocked(const std::map<std::string, WorkspaceEntry>& entries) const;

    std::filesystem::path trackingFile_;
    std::shared_ptr<vcs::IVcsClient> vcs_;
    mutable std::mutex mutex_;
};

} // namespace planrunner::core::workspace

#endif // PLANRUNNER_CORE_WORKSPACE_WORKSPACE_REGISTRY_H
