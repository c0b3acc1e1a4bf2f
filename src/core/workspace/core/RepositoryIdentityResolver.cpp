#include "core/workspace/core/RepositoryIdentityResolver.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"
#include "core/util/FileUtils.h"
#include "core/util/HashUtils.h"
#include <algorithm>
#include <cctype>

namespace planrunner::core::workspace {

using logging::Logger;

RepositoryIdentityResolver::RepositoryIdentityResolver(std::shared_ptr<vcs::IVcsClient> vcs)
    : vcs_(std::move(vcs)) {}

std::string RepositoryIdentityResolver::normalizeRemoteUrl(const std::string& url) {
    std::string text = url;
    auto begin = text.find_first_not_of(" \t\r\n");
    auto end = text.find_last_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    text = text.substr(begin, end - begin + 1);

    bool scpStyle = false;
    auto scheme = text.find("://");
    if (scheme != std::string::npos) {
        text = text.substr(scheme + 3);
    } else if (text.find(':') != std::string::npos && text.find('/') > text.find(':')) {
        scpStyle = true;
    }

    auto at = text.find('@');
    auto firstSlash = text.find('/');
    if (at != std::string::npos && (firstSlash == std::string::npos || at < firstSlash)) {
        text = text.substr(at + 1);
    }

    if (scpStyle) {
        auto colon = text.find(':');
        if (colon != std::string::npos) {
            text[colon] = '/';
        }
    }

    while (!text.empty() && text.back() == '/') {
        text.pop_back();
    }
    if (text.size() > 4 && text.compare(text.size() - 4, 4, ".git") == 0) {
        text.erase(text.size() - 4);
    }

    auto hostEnd = text.find('/');
    std::transform(text.begin(), hostEnd == std::string::npos ? text.end() : text.begin() + hostEnd, text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Default ports carry no identity
    auto portColon = text.find(':');
    if (portColon != std::string::npos && (hostEnd == std::string::npos || portColon < hostEnd)) {
        std::string port = text.substr(portColon + 1, hostEnd == std::string::npos ? std::string::npos
                                                                                    : hostEnd - portColon - 1);
        if (port == "22" || port == "443" || port == "80") {
            text.erase(portColon, port.size() + 1);
        }
    }
    return text;
}

RepositoryIdentity RepositoryIdentityResolver::resolve(const std::filesystem::path& directory) const {
    auto root = vcs_->repositoryRoot(directory);
    if (!root) {
        throw VcsException("not inside a repository: " + directory.string());
    }

    RepositoryIdentity identity;
    identity.root = *root;
    identity.remoteUrl = vcs_->remoteUrl(*root);

    if (identity.remoteUrl) {
        identity.repositoryId = normalizeRemoteUrl(*identity.remoteUrl);
        if (!identity.repositoryId.empty()) {
            return identity;
        }
    }

    if (auto rootCommit = vcs_->rootCommitId(*root)) {
        identity.repositoryId = "local:" + *rootCommit;
        Logger::get("workspace")->debug("[RepositoryIdentity] {} has no origin, using root commit {}",
                                        root->string(), *rootCommit);
        return identity;
    }

    identity.repositoryId = "local:" + util::fnv1a64Hex(util::FileUtils::normalizePath(*root));
    return identity;
}

} // namespace planrunner::core::workspace
