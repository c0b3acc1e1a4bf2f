#ifndef PLANRUNNER_CORE_VCS_IVCS_CLIENT_H
#define PLANRUNNER_CORE_VCS_IVCS_CLIENT_H

#include <filesystem>
#include <optional>
#include <string>

namespace planrunner::core::vcs {

/**
 * @brief Version control queries and operations used by the workspace manager
 */
class IVcsClient {
public:
    virtual ~IVcsClient() = default;

    /**
     * @brief Top-level directory of the repository containing `directory`
     */
    virtual std::optional<std::filesystem::path> repositoryRoot(const std::filesystem::path& directory) = 0;

    /**
     * @brief Branch (or bookmark) checked out in `directory`
     * @throws VcsException if the query fails
     */
    virtual std::string currentBranch(const std::filesystem::path& directory) = 0;

    /**
     * @brief URL of a named remote, if configured
     */
    virtual std::optional<std::string> remoteUrl(const std::filesystem::path& directory,
                                                 const std::string& remote = "origin") = 0;

    /**
     * @brief Id of the first root commit, stable across clones of the same history
     */
    virtual std::optional<std::string> rootCommitId(const std::filesystem::path& directory) = 0;

    /**
     * @throws VcsException on failure
     */
    virtual void clone(const std::string& url, const std::filesystem::path& target) = 0;

    /**
     * @brief Create and check out a new branch
     * @throws VcsException on failure
     */
    virtual void createBranch(const std::filesystem::path& repository, const std::string& branch) = 0;
};

} // namespace planrunner::core::vcs

#endif // PLANRUNNER_CORE_VCS_IVCS_CLIENT_H
