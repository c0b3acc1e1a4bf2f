#ifndef PLANRUNNER_CORE_REVIEW_REVIEW_MERGER_H
#define PLANRUNNER_CORE_REVIEW_REVIEW_MERGER_H

#include "core/plan/dto/Plan.h"
#include "core/review/core/ReviewTaskScope.h"
#include "core/review/dto/ReviewResult.h"
#include "planrunner/executor/IExecutor.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace planrunner::core::review {

struct ReviewOptions {
    bool allowPartialFailures{true};
    std::string workspacePath;
    std::shared_ptr<executor::CancellationToken> cancellation;
};

/**
 * @brief Runs review executors concurrently and merges their findings
 *
 * Every executor runs on its own std::async task; all are joined before
 * merging. A failed executor is dropped with a warning as long as another
 * one succeeded. When every executor fails the review fails.
 */
class ReviewMerger {
public:
    explicit ReviewMerger(ReviewOptions options = {});

    /**
     * @throws ValidationException unmatched task filter (before any executor runs)
     * @throws ExecutorFailureException all executors failed, or any failed with
     *         allowPartialFailures disabled
     */
    ReviewResult runReview(const plan::Plan& plan,
                           const std::vector<std::shared_ptr<executor::IExecutor>>& executors,
                           const ReviewTaskFilter& filter = {});

    /**
     * @brief Concatenate, sort by file then line (missing last), re-index, summarize
     */
    static ReviewResult mergeOutputs(const std::vector<std::pair<std::string, ReviewOutput>>& outputs);

    static ReviewSummary summarize(const std::vector<ReviewIssue>& issues);

    /**
     * @brief Timeouts get one more attempt
     */
    static bool isRetryableFailure(const executor::ExecutionResult& result);

private:
    struct ExecutorOutcome {
        std::string name;
        std::optional<ReviewOutput> output;
        std::string error;
    };

    ExecutorOutcome runExecutor(executor::IExecutor& executor, const std::string& prompt,
                                const plan::Plan& plan) const;

    ReviewOptions options_;
};

} // namespace planrunner::core::review

#endif // PLANRUNNER_CORE_REVIEW_REVIEW_MERGER_H
