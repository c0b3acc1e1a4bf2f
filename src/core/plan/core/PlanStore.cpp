#include "core/plan/core/PlanStore.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"
#include "core/plan/util/PlanSerializer.h"
#include "core/util/FileUtils.h"
#include "core/util/TimeUtils.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <uuid/uuid.h>

namespace fs = std::filesystem;

namespace planrunner::core::plan {

using logging::Logger;
using util::FileUtils;
using util::TimeUtils;

namespace {

bool isAllDigits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

PlanStore::PlanStore(fs::path tasksDirectory)
    : tasksDirectory_(std::move(tasksDirectory)) {}

PlanLoadResult PlanStore::scanDirectory() const {
    PlanLoadResult result;

    std::error_code ec;
    if (!fs::is_directory(tasksDirectory_, ec)) {
        Logger::get("plan")->warn("[PlanStore] Tasks directory does not exist: {}", tasksDirectory_.string());
        return result;
    }

    std::vector<fs::path> files;
    for (fs::recursive_directory_iterator it(tasksDirectory_, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && PlanSerializer::isPlanFile(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        Logger::get("plan")->warn("[PlanStore] Directory scan of {} stopped early: {}",
                                  tasksDirectory_.string(), ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        try {
            Plan plan = PlanSerializer::parse(FileUtils::readFile(file), file);
            plan.filename = FileUtils::normalizePath(file);

            auto existing = result.plans.find(plan.id);
            if (existing != result.plans.end()) {
                result.skipped.push_back({file.string(),
                                          "duplicate id " + std::to_string(plan.id) + " (already defined in " +
                                              existing->second.filename + ")"});
                Logger::get("plan")->warn("[PlanStore] SKIP - {}: duplicate id {}", file.string(), plan.id);
                continue;
            }

            Logger::get("plan")->debug("[PlanStore] LOAD - plan {} from {}", plan.id, file.string());
            result.plans.emplace(plan.id, std::move(plan));
        } catch (const std::exception& e) {
            result.skipped.push_back({file.string(), e.what()});
            Logger::get("plan")->warn("[PlanStore] SKIP - {}", e.what());
        }
    }

    Logger::get("plan")->info("[PlanStore] Loaded {} plans from {} ({} skipped)",
                              result.plans.size(), tasksDirectory_.string(), result.skipped.size());
    return result;
}

void PlanStore::ensureLoadedLocked() {
    if (!cache_) {
        cache_ = scanDirectory();
    }
}

PlanLoadResult PlanStore::loadAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoadedLocked();
    return *cache_;
}

void PlanStore::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.reset();
}

std::vector<SkippedPlanFile> PlanStore::skippedFiles() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoadedLocked();
    return cache_->skipped;
}

Plan PlanStore::load(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoadedLocked();

    auto it = cache_->plans.find(id);
    if (it == cache_->plans.end()) {
        throw NotFoundException("plan", std::to_string(id));
    }
    return it->second;
}

Plan PlanStore::load(const std::string& idOrPath) {
    if (isAllDigits(idOrPath)) {
        int id = 0;
        try {
            id = std::stoi(idOrPath);
        } catch (const std::out_of_range&) {
            // No plan can carry an id beyond int range
            throw NotFoundException("plan", idOrPath);
        }
        return load(id);
    }

    std::vector<fs::path> candidates;
    fs::path given = FileUtils::expandHome(idOrPath);
    candidates.push_back(given);
    if (given.is_relative()) {
        candidates.push_back(tasksDirectory_ / given);
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) {
            continue;
        }
        Plan plan = PlanSerializer::parse(FileUtils::readFile(candidate), candidate);
        plan.filename = FileUtils::normalizePath(candidate);
        return plan;
    }

    throw NotFoundException("plan", idOrPath);
}

void PlanStore::saveLocked(Plan& plan) {
    if (plan.id <= 0) {
        throw ValidationException("plan id must be a positive integer, got " + std::to_string(plan.id));
    }
    if (plan.filename.empty()) {
        plan.filename = FileUtils::normalizePath(
            tasksDirectory_ / (std::to_string(plan.id) + "-" + slugify(plan.displayTitle()) + ".plan.md"));
    }
    plan.tags = normalizeTags(plan.tags);

    FileUtils::writeFileAtomic(plan.filename, PlanSerializer::serialize(plan, plan.filename));
    Logger::get("plan")->debug("[PlanStore] SAVE - plan {} to {}", plan.id, plan.filename);

    if (cache_) {
        cache_->plans[plan.id] = plan;
    }
}

void PlanStore::save(Plan& plan) {
    std::lock_guard<std::mutex> lock(mutex_);
    saveLocked(plan);
}

int PlanStore::nextAvailableId() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoadedLocked();
    return cache_->plans.empty() ? 1 : cache_->plans.rbegin()->first + 1;
}

Plan PlanStore::createPlan(const std::string& title, const CreatePlanOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoadedLocked();

    Plan plan;
    plan.id = cache_->plans.empty() ? 1 : cache_->plans.rbegin()->first + 1;
    plan.uuid = generateUuid();
    plan.title = title;
    plan.goal = options.goal;
    plan.details = options.details;
    plan.status = options.status;
    plan.priority = options.priority;
    plan.dependencies = options.dependencies;
    plan.parent = options.parent;
    plan.discoveredFrom = options.discoveredFrom;
    plan.epic = options.epic;
    plan.tags = options.tags;
    plan.tasks = options.tasks;
    plan.createdAt = TimeUtils::nowIso8601();
    plan.updatedAt = plan.createdAt;

    saveLocked(plan);
    Logger::get("plan")->info("[PlanStore] CREATE - plan {} '{}'", plan.id, plan.title);
    return plan;
}

Plan PlanStore::setStatus(int id, PlanStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoadedLocked();

    auto it = cache_->plans.find(id);
    if (it == cache_->plans.end()) {
        throw NotFoundException("plan", std::to_string(id));
    }

    Plan plan = it->second;
    plan.status = status;
    plan.updatedAt = TimeUtils::nowIso8601();
    saveLocked(plan);
    Logger::get("plan")->info("[PlanStore] STATUS - plan {} -> {}", id, planStatusToString(status));
    return plan;
}

std::vector<Plan> PlanStore::childrenOf(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoadedLocked();

    std::vector<Plan> children;
    for (const auto& [childId, plan] : cache_->plans) {
        if (plan.parent && *plan.parent == id) {
            children.push_back(plan);
        }
    }
    return children;
}

std::string PlanStore::slugify(const std::string& title) {
    std::string slug;
    bool pendingDash = false;
    for (unsigned char c : title) {
        if (std::isalnum(c)) {
            if (pendingDash && !slug.empty()) {
                slug.push_back('-');
            }
            pendingDash = false;
            slug.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pendingDash = true;
        }
        if (slug.size() >= 50) {
            break;
        }
    }
    return slug.empty() ? "plan" : slug;
}

std::string PlanStore::generateUuid() {
    uuid_t uuid;
    uuid_generate(uuid);
    char text[37];
    uuid_unparse_lower(uuid, text);
    return text;
}

} // namespace planrunner::core::plan
