#include "core/vcs/impl/GitVcsClient.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"
#include "core/process/ProcessRunner.h"

namespace fs = std::filesystem;

namespace planrunner::core::vcs {

using logging::Logger;

namespace {

std::string trimTrailing(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

std::string firstLine(const std::string& text) {
    auto newline = text.find('\n');
    return newline == std::string::npos ? text : text.substr(0, newline);
}

} // namespace

GitVcsClient::CommandOutput GitVcsClient::runTool(const std::vector<std::string>& argv, const fs::path& cwd) {
    process::ProcessOptions options;
    options.argv = argv;
    options.workingDirectory = cwd;
    auto result = process::ProcessRunner::run(options);

    CommandOutput output;
    output.ok = result.success();
    output.text = trimTrailing(result.stdoutText);
    output.error = trimTrailing(result.stderrText.empty() ? result.errorMessage : result.stderrText);
    return output;
}

bool GitVcsClient::isJjRepository(const fs::path& directory) {
    std::error_code ec;
    for (fs::path current = fs::absolute(directory, ec); !current.empty(); current = current.parent_path()) {
        if (fs::is_directory(current / ".jj", ec)) {
            return true;
        }
        if (current == current.root_path()) {
            break;
        }
    }
    return false;
}

std::optional<fs::path> GitVcsClient::repositoryRoot(const fs::path& directory) {
    auto git = runTool({"git", "rev-parse", "--show-toplevel"}, directory);
    if (git.ok && !git.text.empty()) {
        return fs::path(git.text);
    }
    if (isJjRepository(directory)) {
        auto jj = runTool({"jj", "root"}, directory);
        if (jj.ok && !jj.text.empty()) {
            return fs::path(jj.text);
        }
    }
    return std::nullopt;
}

std::string GitVcsClient::currentBranch(const fs::path& directory) {
    auto git = runTool({"git", "branch", "--show-current"}, directory);
    if (git.ok && !git.text.empty()) {
        return git.text;
    }

    if (isJjRepository(directory)) {
        auto jj = runTool({"jj", "log", "-r", "@", "--no-graph", "-T", "bookmarks.join(\",\")"}, directory);
        if (jj.ok) {
            return jj.text;
        }
        throw VcsException("jj log failed in " + directory.string() + ": " + jj.error);
    }

    if (!git.ok) {
        throw VcsException("git branch failed in " + directory.string() + ": " + git.error);
    }
    return "";  // detached HEAD
}

std::optional<std::string> GitVcsClient::remoteUrl(const fs::path& directory, const std::string& remote) {
    auto git = runTool({"git", "remote", "get-url", remote}, directory);
    if (git.ok && !git.text.empty()) {
        return git.text;
    }
    return std::nullopt;
}

std::optional<std::string> GitVcsClient::rootCommitId(const fs::path& directory) {
    auto git = runTool({"git", "rev-list", "--max-parents=0", "HEAD"}, directory);
    if (git.ok && !git.text.empty()) {
        return firstLine(git.text);
    }
    if (isJjRepository(directory)) {
        auto jj = runTool({"jj", "log", "-r", "root()+", "--no-graph", "-T", "commit_id ++ \"\\n\""}, directory);
        if (jj.ok && !jj.text.empty()) {
            return firstLine(jj.text);
        }
    }
    return std::nullopt;
}

void GitVcsClient::clone(const std::string& url, const fs::path& target) {
    Logger::get("vcs")->info("[GitVcsClient] Cloning {} into {}", url, target.string());
    auto git = runTool({"git", "clone", url, target.string()}, target.parent_path());
    if (!git.ok) {
        throw VcsException("git clone " + url + " failed: " + git.error);
    }
}

void GitVcsClient::createBranch(const fs::path& repository, const std::string& branch) {
    auto git = runTool({"git", "checkout", "-b", branch}, repository);
    if (!git.ok) {
        throw VcsException("git checkout -b " + branch + " failed: " + git.error);
    }
}

} // namespace planrunner::core::vcs
