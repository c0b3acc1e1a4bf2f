#include "core/workspace/core/WorkspaceRegistry.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"
#include "core/util/TimeUtils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace planrunner::core::workspace {

using logging::Logger;
using util::FileUtils;
using util::PathState;
using util::TimeUtils;

namespace {

template<typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template<typename T>
void getOptional(const nlohmann::json& j, const char* key, std::optional<T>& value) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        value = it->get<T>();
    }
}

std::string normalizeId(const std::string& id) {
    auto begin = id.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = id.find_last_not_of(" \t\r\n");
    std::string trimmed = id.substr(begin, end - begin + 1);
    std::transform(trimmed.begin(), trimmed.end(), trimmed.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return trimmed;
}

} // namespace

void to_json(nlohmann::json& j, const WorkspaceEntry& entry) {
    j = nlohmann::json::object();
    j["workspacePath"] = entry.workspacePath;
    putOptional(j, "taskId", entry.taskId);
    putOptional(j, "name", entry.name);
    putOptional(j, "description", entry.description);
    putOptional(j, "repositoryId", entry.repositoryId);
    putOptional(j, "repositoryUrl", entry.repositoryUrl);
    putOptional(j, "originalPlanFilePath", entry.originalPlanFilePath);
    putOptional(j, "planId", entry.planId);
    putOptional(j, "planTitle", entry.planTitle);
    if (!entry.issueUrls.empty()) {
        j["issueUrls"] = entry.issueUrls;
    }
    putOptional(j, "createdAt", entry.createdAt);
    putOptional(j, "updatedAt", entry.updatedAt);
}

void from_json(const nlohmann::json& j, WorkspaceEntry& entry) {
    entry.workspacePath = j.value("workspacePath", std::string());
    getOptional(j, "taskId", entry.taskId);
    getOptional(j, "name", entry.name);
    getOptional(j, "description", entry.description);
    getOptional(j, "repositoryId", entry.repositoryId);
    getOptional(j, "repositoryUrl", entry.repositoryUrl);
    getOptional(j, "originalPlanFilePath", entry.originalPlanFilePath);
    getOptional(j, "planId", entry.planId);
    getOptional(j, "planTitle", entry.planTitle);
    if (j.contains("issueUrls") && j["issueUrls"].is_array()) {
        entry.issueUrls = j["issueUrls"].get<std::vector<std::string>>();
    }
    getOptional(j, "createdAt", entry.createdAt);
    getOptional(j, "updatedAt", entry.updatedAt);
}

WorkspaceRegistry::WorkspaceRegistry(fs::path trackingFile, std::shared_ptr<vcs::IVcsClient> vcs)
    : trackingFile_(std::move(trackingFile)), vcs_(std::move(vcs)) {}

bool WorkspaceRegistry::sameRepositoryId(const std::string& a, const std::string& b) {
    return normalizeId(a) == normalizeId(b);
}

std::map<std::string, WorkspaceEntry> WorkspaceRegistry::readLocked() const {
    std::map<std::string, WorkspaceEntry> entries;

    std::error_code ec;
    if (!fs::exists(trackingFile_, ec)) {
        return entries;
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(FileUtils::readFile(trackingFile_));
    } catch (const nlohmann::json::exception& e) {
        throw ValidationException("workspace registry " + trackingFile_.string() + " is not valid JSON: " + e.what());
    }
    if (!root.is_object()) {
        throw ValidationException("workspace registry " + trackingFile_.string() + " must contain a JSON object");
    }

    for (const auto& [path, value] : root.items()) {
        if (!value.is_object()) {
            Logger::get("workspace")->warn("[WorkspaceRegistry] Ignoring malformed entry for {}", path);
            continue;
        }
        try {
            WorkspaceEntry entry = value.get<WorkspaceEntry>();
            entry.workspacePath = path;
            entries.emplace(path, std::move(entry));
        } catch (const nlohmann::json::exception& e) {
            Logger::get("workspace")->warn("[WorkspaceRegistry] Ignoring malformed entry for {}: {}", path, e.what());
        }
    }
    return entries;
}

void WorkspaceRegistry::writeLocked(const std::map<std::string, WorkspaceEntry>& entries) const {
    nlohmann::json root = nlohmann::json::object();
    for (const auto& [path, entry] : entries) {
        root[path] = entry;
    }
    FileUtils::writeFileAtomic(trackingFile_, root.dump(2) + "\n");
}

std::map<std::string, WorkspaceEntry> WorkspaceRegistry::readAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return readLocked();
}

std::optional<WorkspaceEntry> WorkspaceRegistry::get(const std::string& workspacePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = readLocked();
    auto it = entries.find(FileUtils::normalizePath(workspacePath));
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

WorkspaceEntry WorkspaceRegistry::patchMetadata(const std::string& workspacePath, const WorkspaceMetadataPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = FileUtils::normalizePath(workspacePath);
    auto entries = readLocked();

    auto it = entries.find(key);
    bool created = it == entries.end();
    if (created) {
        WorkspaceEntry entry;
        entry.workspacePath = key;
        it = entries.emplace(key, std::move(entry)).first;
    }

    WorkspaceEntry& entry = it->second;
    patch.taskId.applyTo(entry.taskId);
    patch.name.applyTo(entry.name);
    patch.description.applyTo(entry.description);
    patch.repositoryId.applyTo(entry.repositoryId);
    patch.repositoryUrl.applyTo(entry.repositoryUrl);
    patch.originalPlanFilePath.applyTo(entry.originalPlanFilePath);
    patch.planId.applyTo(entry.planId);
    patch.planTitle.applyTo(entry.planTitle);
    if (patch.issueUrls.isClear()) {
        entry.issueUrls.clear();
    } else if (patch.issueUrls.hasValue()) {
        entry.issueUrls = patch.issueUrls.value();
    }
    entry.updatedAt = TimeUtils::nowIso8601();
    if (created && patch.stampCreatedAt) {
        entry.createdAt = entry.updatedAt;
    }

    writeLocked(entries);
    Logger::get("workspace")->info("[WorkspaceRegistry] {} - {}", created ? "CREATE" : "PATCH", key);
    return entry;
}

void WorkspaceRegistry::recordWorkspace(WorkspaceEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entry.workspacePath = FileUtils::normalizePath(entry.workspacePath);
    const std::string now = TimeUtils::nowIso8601();
    if (!entry.createdAt) {
        entry.createdAt = now;
    }
    entry.updatedAt = now;

    auto entries = readLocked();
    entries[entry.workspacePath] = entry;
    writeLocked(entries);
    Logger::get("workspace")->info("[WorkspaceRegistry] RECORD - {}", entry.workspacePath);
}

bool WorkspaceRegistry::removeEntry(const std::string& workspacePath) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = readLocked();
    if (entries.erase(FileUtils::normalizePath(workspacePath)) == 0) {
        return false;
    }
    writeLocked(entries);
    Logger::get("workspace")->info("[WorkspaceRegistry] REMOVE - {}", workspacePath);
    return true;
}

std::vector<WorkspaceEntry> WorkspaceRegistry::findByTaskId(const std::string& taskId) const {
    std::vector<WorkspaceEntry> matches;
    for (const auto& [path, entry] : readAll()) {
        if (entry.taskId && *entry.taskId == taskId) {
            matches.push_back(entry);
        }
    }
    return matches;
}

std::vector<WorkspaceEntry> WorkspaceRegistry::findByRepositoryId(const std::string& repositoryId) const {
    std::vector<WorkspaceEntry> matches;
    for (const auto& [path, entry] : readAll()) {
        if (entry.repositoryId && sameRepositoryId(*entry.repositoryId, repositoryId)) {
            matches.push_back(entry);
        }
    }
    return matches;
}

std::vector<WorkspaceListEntry> WorkspaceRegistry::listEntries(const ListOptions& options) const {
    std::vector<WorkspaceListEntry> result;

    for (const auto& [path, entry] : readAll()) {
        if (options.repositoryId &&
            (!entry.repositoryId || !sameRepositoryId(*entry.repositoryId, *options.repositoryId))) {
            continue;
        }

        std::string statError;
        PathState state = FileUtils::probeDirectory(path, &statError);
        if (state == PathState::MISSING) {
            Logger::get("workspace")->debug("[WorkspaceRegistry] Skipping missing workspace {}", path);
            continue;
        }
        if (state == PathState::NOT_DIRECTORY) {
            // Something else now sits at the path, so the entry is kept but flagged
            state = PathState::UNKNOWN;
            statError = "not a directory";
        }

        WorkspaceListEntry item;
        item.entry = entry;
        item.state = state;
        if (state == PathState::UNKNOWN) {
            item.stateMessage = statError;
            Logger::get("workspace")->warn("[WorkspaceRegistry] Cannot stat {}: {}", path, statError);
        } else if (options.includeBranch && vcs_) {
            try {
                item.branch = vcs_->currentBranch(path);
            } catch (const VcsException& e) {
                Logger::get("workspace")->debug("[WorkspaceRegistry] Branch query failed for {}: {}", path, e.what());
            }
        }
        result.push_back(std::move(item));
    }
    return result;
}

std::vector<std::string> WorkspaceRegistry::pruneMissing() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = readLocked();

    std::vector<std::string> removed;
    for (auto it = entries.begin(); it != entries.end();) {
        if (FileUtils::probeDirectory(it->first) == PathState::MISSING) {
            removed.push_back(it->first);
            it = entries.erase(it);
        } else {
            ++it;
        }
    }

    if (!removed.empty()) {
        writeLocked(entries);
        Logger::get("workspace")->info("[WorkspaceRegistry] Pruned {} missing workspaces", removed.size());
    }
    return removed;
}

} // namespace planrunner::core::workspace
