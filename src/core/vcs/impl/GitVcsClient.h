#ifndef PLANRUNNER_CORE_VCS_GIT_VCS_CLIENT_H
#define PLANRUNNER_CORE_VCS_GIT_VCS_CLIENT_H

#include "core/vcs/interfaces/IVcsClient.h"
#include <vector>

namespace planrunner::core::vcs {

/**
 * @brief IVcsClient backed by the git CLI, with jj fallbacks
 *
 * Jujutsu repositories colocated with git answer the git queries; a pure jj
 * repository is detected by its ".jj" directory and queried through jj.
 */
class GitVcsClient : public IVcsClient {
public:
    std::optional<std::filesystem::path> repositoryRoot(const std::filesystem::path& directory) override;
    std::string currentBranch(const std::filesystem::path& directory) override;
    std::optional<std::string> remoteUrl(const std::filesystem::path& directory,
                                         const std::string& remote = "origin") override;
    std::optional<std::string> rootCommitId(const std::filesystem::path& directory) override;
    void clone(const std::string& url, const std::filesystem::path& target) override;
    void createBranch(const std::filesystem::path& repository, const std::string& branch) override;

private:
    struct CommandOutput {
        bool ok{false};
        std::string text;    // stdout, trailing whitespace removed
        std::string error;
    };

    static CommandOutput runTool(const std::vector<std::string>& argv, const std::filesystem::path& cwd);
    static bool isJjRepository(const std::filesystem::path& directory);
};

} // namespace planrunner::core::vcs

#endif // PLANRUNNER_CORE_VCS_GIT_VCS_CLIENT_H
