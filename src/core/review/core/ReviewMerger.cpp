#include "core/review/core/ReviewMerger.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"
#include "core/review/core/ReviewPromptBuilder.h"
#include "core/review/util/ReviewOutputParser.h"
#include <algorithm>
#include <future>
#include <set>

namespace planrunner::core::review {

using logging::Logger;

namespace {

// Issues with a file sort before issues without one; the same holds for lines
bool issueLess(const ReviewIssue& a, const ReviewIssue& b) {
    if (a.file.has_value() != b.file.has_value()) {
        return a.file.has_value();
    }
    if (a.file && *a.file != *b.file) {
        return *a.file < *b.file;
    }
    if (a.line.has_value() != b.line.has_value()) {
        return a.line.has_value();
    }
    if (a.line) {
        return *a.line < *b.line;
    }
    return false;
}

} // namespace

ReviewMerger::ReviewMerger(ReviewOptions options) : options_(std::move(options)) {}

bool ReviewMerger::isRetryableFailure(const executor::ExecutionResult& result) {
    if (result.success || result.cancelled) {
        return false;
    }
    return result.timedOut || result.errorMessage.find("timed out") != std::string::npos ||
           result.errorMessage.find("terminated after inactivity") != std::string::npos;
}

ReviewMerger::ExecutorOutcome ReviewMerger::runExecutor(executor::IExecutor& executor, const std::string& prompt,
                                                        const plan::Plan& plan) const {
    ExecutorOutcome outcome;
    outcome.name = executor.name();

    executor::ExecutionContext context;
    context.planId = plan.id;
    context.planTitle = plan.displayTitle();
    context.planFilePath = plan.filename;
    context.workspacePath = options_.workspacePath;
    context.mode = executor::ExecutionMode::REVIEW;
    context.cancellation = options_.cancellation;

    auto result = executor.execute(prompt, context);
    if (isRetryableFailure(result)) {
        Logger::get("review")->warn("[ReviewMerger] {} timed out, retrying once", outcome.name);
        result = executor.execute(prompt, context);
    }

    if (!result.success) {
        outcome.error = result.errorMessage.empty() ? "exited with code " + std::to_string(result.exitCode)
                                                    : result.errorMessage;
        return outcome;
    }
    if (!result.structuredOutput) {
        outcome.error = "no structured output";
        return outcome;
    }

    try {
        outcome.output = ReviewOutputParser::parse(*result.structuredOutput, outcome.name);
    } catch (const ValidationException& e) {
        outcome.error = std::string("malformed structured output: ") + e.what();
    }
    return outcome;
}

ReviewResult ReviewMerger::runReview(const plan::Plan& plan,
                                     const std::vector<std::shared_ptr<executor::IExecutor>>& executors,
                                     const ReviewTaskFilter& filter) {
    if (executors.empty()) {
        throw ValidationException("no review executors selected");
    }

    const auto taskIndices = ReviewTaskScope::select(plan, filter);
    const std::string prompt = ReviewPromptBuilder::build(plan, taskIndices);

    Logger::get("review")->info("[ReviewMerger] Reviewing plan {} ({} tasks) with {} executor(s)", plan.id,
                                taskIndices.size(), executors.size());

    std::vector<std::future<ExecutorOutcome>> futures;
    futures.reserve(executors.size());
    for (const auto& executor : executors) {
        futures.push_back(std::async(std::launch::async, [this, executor, &prompt, &plan]() {
            try {
                return runExecutor(*executor, prompt, plan);
            } catch (const std::exception& e) {
                ExecutorOutcome outcome;
                outcome.name = executor->name();
                outcome.error = e.what();
                return outcome;
            }
        }));
    }

    std::vector<ExecutorOutcome> outcomes;
    for (auto& future : futures) {
        outcomes.push_back(future.get());
    }

    std::vector<std::pair<std::string, ReviewOutput>> successes;
    std::vector<const ExecutorOutcome*> failures;
    for (const auto& outcome : outcomes) {
        if (outcome.output) {
            successes.emplace_back(outcome.name, *outcome.output);
        } else {
            failures.push_back(&outcome);
        }
    }

    if (outcomes.size() == 1 && !failures.empty()) {
        throw ExecutorFailureException(failures.front()->name, failures.front()->error);
    }
    if (successes.empty()) {
        std::string message = "all review executors failed";
        for (const auto* failure : failures) {
            message += "; " + failure->name + ": " + failure->error;
        }
        throw ExecutorFailureException("review", message);
    }
    if (!failures.empty() && !options_.allowPartialFailures) {
        throw ExecutorFailureException(failures.front()->name, failures.front()->error);
    }

    ReviewResult result = mergeOutputs(successes);
    result.planId = plan.id;
    result.planTitle = plan.displayTitle();
    result.reviewedTaskIndices = taskIndices;
    for (const auto* failure : failures) {
        std::string warning = failure->name + " failed, its findings are omitted: " + failure->error;
        Logger::get("review")->warn("[ReviewMerger] {}", warning);
        result.warnings.push_back(std::move(warning));
    }

    Logger::get("review")->info("[ReviewMerger] Plan {} review finished with {} issue(s)", plan.id,
                                result.summary.totalIssues);
    return result;
}

ReviewResult ReviewMerger::mergeOutputs(const std::vector<std::pair<std::string, ReviewOutput>>& outputs) {
    ReviewResult result;
    for (const auto& [name, output] : outputs) {
        result.executors.push_back(name);
        for (auto issue : output.issues) {
            if (issue.executor.empty()) {
                issue.executor = name;
            }
            result.issues.push_back(std::move(issue));
        }
        result.recommendations.insert(result.recommendations.end(), output.recommendations.begin(),
                                      output.recommendations.end());
        result.actionItems.insert(result.actionItems.end(), output.actionItems.begin(), output.actionItems.end());
    }

    std::stable_sort(result.issues.begin(), result.issues.end(), issueLess);
    for (size_t i = 0; i < result.issues.size(); ++i) {
        result.issues[i].id = "issue-" + std::to_string(i + 1);
    }
    result.summary = summarize(result.issues);
    return result;
}

ReviewSummary ReviewMerger::summarize(const std::vector<ReviewIssue>& issues) {
    ReviewSummary summary;
    summary.totalIssues = issues.size();
    for (auto severity : {ReviewSeverity::CRITICAL, ReviewSeverity::MAJOR, ReviewSeverity::MINOR,
                          ReviewSeverity::INFO}) {
        summary.bySeverity[reviewSeverityToString(severity)] = 0;
    }
    for (auto category : {ReviewCategory::SECURITY, ReviewCategory::PERFORMANCE, ReviewCategory::BUG,
                          ReviewCategory::STYLE, ReviewCategory::COMPLIANCE, ReviewCategory::TESTING,
                          ReviewCategory::OTHER}) {
        summary.byCategory[reviewCategoryToString(category)] = 0;
    }

    std::set<std::string> files;
    for (const auto& issue : issues) {
        ++summary.bySeverity[reviewSeverityToString(issue.severity)];
        ++summary.byCategory[reviewCategoryToString(issue.category)];
        if (issue.file) {
            files.insert(*issue.file);
        }
    }
    summary.filesReviewed = files.size();
    return summary;
}

} // namespace planrunner::core::review
