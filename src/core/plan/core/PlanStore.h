#ifndef PLANRUNNER_CORE_PLAN_PLAN_STORE_H
#define PLANRUNNER_CORE_PLAN_PLAN_STORE_H

#include "core/plan/dto/Plan.h"
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace planrunner::core::plan {

/**
 * @brief Fields for a newly created plan
 */
struct CreatePlanOptions {
    std::string goal;
    std::string details;
    PlanStatus status{PlanStatus::PENDING};
    std::optional<PlanPriority> priority;
    std::vector<int> dependencies;
    std::optional<int> parent;
    std::optional<int> discoveredFrom;
    bool epic{false};
    std::vector<std::string> tags;
    std::vector<Task> tasks;
};

/**
 * @brief Plan files of one tasks directory
 *
 * Owns the on-disk plan records. loadAll() scans the directory once and
 * keeps an id-indexed cache until invalidate() is called; save() writes
 * through to disk and to the cache.
 *
 * Writes are read-modify-write without version checks: two processes
 * saving the same plan concurrently end with the last write.
 */
class PlanStore {
public:
    explicit PlanStore(std::filesystem::path tasksDirectory);
    ~PlanStore() = default;

    PlanStore(const PlanStore&) = delete;
    PlanStore& operator=(const PlanStore&) = delete;
    PlanStore(PlanStore&&) = delete;
    PlanStore& operator=(PlanStore&&) = delete;

    /**
     * @brief All valid plans plus the files that were skipped
     *
     * Invalid files and duplicate ids are reported in `skipped` without
     * aborting the scan. For duplicate ids the first file in path order wins.
     */
    PlanLoadResult loadAll();

    /**
     * @brief Drop the cache; the next loadAll() rescans the directory
     */
    void invalidate();

    std::vector<SkippedPlanFile> skippedFiles();

    /**
     * @brief Plan by id
     * @throws NotFoundException if no plan has this id
     */
    Plan load(int id);

    /**
     * @brief Plan by numeric id or by file path
     *
     * Relative paths are tried against the working directory first and the
     * tasks directory second.
     *
     * @throws NotFoundException if nothing matches
     * @throws ValidationException if the file exists but is malformed
     */
    Plan load(const std::string& idOrPath);

    /**
     * @brief Persist a plan atomically
     *
     * Plans without a filename get "<id>-<slug>.plan.md" in the tasks directory.
     */
    void save(Plan& plan);

    /**
     * @brief Allocate the next id and write a new plan file
     */
    Plan createPlan(const std::string& title, const CreatePlanOptions& options = {});

    /**
     * @brief Update status and updatedAt, then save
     * @throws NotFoundException if no plan has this id
     */
    Plan setStatus(int id, PlanStatus status);

    /**
     * @brief Plans whose parent is the given id, ordered by id
     */
    std::vector<Plan> childrenOf(int id);

    int nextAvailableId();

    const std::filesystem::path& tasksDirectory() const { return tasksDirectory_; }

    /**
     * @brief Lowercase ASCII slug of a title for file names
     */
    static std::string slugify(const std::string& title);

    static std::string generateUuid();

private:
    void ensureLoadedLocked();
    PlanLoadResult scanDirectory() const;
    void saveLocked(Plan& plan);

    std::filesystem::path tasksDirectory_;
    mutable std::mutex mutex_;
    std::optional<PlanLoadResult> cache_;
};

} // namespace planrunner::core::plan

#endif // PLANRUNNER_CORE_PLAN_PLAN_STORE_H
