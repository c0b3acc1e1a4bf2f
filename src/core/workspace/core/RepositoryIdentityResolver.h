#ifndef PLANRUNNER_CORE_WORKSPACE_REPOSITORY_IDENTITY_RESOLVER_H
#define PLANRUNNER_CORE_WORKSPACE_REPOSITORY_IDENTITY_RESOLVER_H

#include "core/vcs/interfaces/IVcsClient.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace planrunner::core::workspace {

/**
 * @brief Identity used to group workspaces of one project
 */
struct RepositoryIdentity {
    std::string repositoryId;                 // normalized remote, or "local:<...>"
    std::optional<std::string> remoteUrl;     // raw origin URL, if any
    std::filesystem::path root;
};

/**
 * @brief Resolves repository identity across VCS backends
 *
 * Order: normalized origin URL; then "local:<root commit id>", which every
 * clone of the same history shares; then "local:<hash of the root path>".
 */
class RepositoryIdentityResolver {
public:
    explicit RepositoryIdentityResolver(std::shared_ptr<vcs::IVcsClient> vcs);

    /**
     * @throws VcsException if `directory` is not inside a repository
     */
    RepositoryIdentity resolve(const std::filesystem::path& directory) const;

    /**
     * @brief Canonical form of a remote URL
     *
     * "git@github.com:Owner/Repo.git", "https://github.com/Owner/Repo" and
     * "ssh://git@github.com/Owner/Repo.git" all map to "github.com/Owner/Repo".
     * The host is lowercased; the path keeps its case.
     */
    static std::string normalizeRemoteUrl(const std::string& url);

private:
    std::shared_ptr<vcs::IVcsClient> vcs_;
};

} // namespace planrunner::core::workspace

#endif // PLANRUNNER_CORE_WORKSPACE_REPOSITORY_IDENTITY_RESOLVER_H
