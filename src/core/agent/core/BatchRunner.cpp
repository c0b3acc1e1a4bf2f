#include "core/agent/core/BatchRunner.h"
#include "core/agent/util/AgentPromptBuilder.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"
#include "core/process/PostCommandRunner.h"
#include <filesystem>
#include <map>

namespace planrunner::core::agent {

using logging::Logger;

namespace {

constexpr const char* kReportKey = "completedTaskIndices";

std::optional<nlohmann::json> findReport(const executor::ExecutionResult& result) {
    if (result.structuredOutput && result.structuredOutput->is_object() &&
        result.structuredOutput->contains(kReportKey)) {
        return result.structuredOutput;
    }
    auto fromText = executor::extractLastJsonObject(result.output);
    if (fromText && fromText->contains(kReportKey)) {
        return fromText;
    }
    return std::nullopt;
}

} // namespace

BatchRunner::BatchRunner(std::shared_ptr<plan::PlanStore> store,
                         std::shared_ptr<task::TaskStateMachine> stateMachine,
                         std::shared_ptr<executor::IExecutor> executor,
                         std::vector<config::PostCommand> postApplyCommands)
    : store_(std::move(store)),
      stateMachine_(std::move(stateMachine)),
      executor_(std::move(executor)),
      postApplyCommands_(std::move(postApplyCommands)) {}

std::optional<std::vector<size_t>> BatchRunner::parseCompletedTaskIndices(const executor::ExecutionResult& result) {
    auto report = findReport(result);
    if (!report) {
        return std::nullopt;
    }

    const auto& indices = (*report)[kReportKey];
    if (!indices.is_array()) {
        throw ValidationException(std::string(kReportKey) + " must be an array");
    }
    std::vector<size_t> parsed;
    for (const auto& index : indices) {
        if (!index.is_number_integer() || index.get<long long>() < 0) {
            throw ValidationException(std::string(kReportKey) + " must contain non-negative integers, got " +
                                      index.dump());
        }
        parsed.push_back(index.get<size_t>());
    }
    return parsed;
}

BatchRunSummary BatchRunner::run(int planId, const BatchRunOptions& options) {
    BatchRunSummary summary;
    int roundsWithoutProgress = 0;

    const std::filesystem::path baseDirectory =
        options.workspacePath.empty() ? std::filesystem::current_path() : std::filesystem::path(options.workspacePath);

    while (true) {
        plan::Plan plan = store_->load(planId);
        auto incomplete = task::TaskStateMachine::getAllIncompleteTasks(plan);
        if (incomplete.empty()) {
            if (plan.status != plan::PlanStatus::DONE) {
                // All tasks were complete before the round started
                store_->setStatus(planId, plan::PlanStatus::DONE);
                if (plan.parent) {
                    stateMachine_->checkAndMarkParentDone(*plan.parent);
                }
            }
            summary.planComplete = true;
            break;
        }

        ++summary.rounds;
        Logger::get("agent")->info("[BatchRunner] Plan {} round {}: {} incomplete task(s)", planId, summary.rounds,
                                   incomplete.size());

        executor::ExecutionContext context;
        context.planId = plan.id;
        context.planTitle = plan.displayTitle();
        context.planFilePath = plan.filename;
        context.workspacePath = options.workspacePath;
        context.mode = executor::ExecutionMode::NORMAL;
        context.batchMode = true;
        context.cancellation = options.cancellation;

        auto result = executor_->execute(AgentPromptBuilder::buildBatchPrompt(plan, incomplete), context);
        if (!result.success) {
            throw ExecutorFailureException(executor_->name(), result.errorMessage);
        }

        std::optional<std::vector<size_t>> reported;
        try {
            reported = parseCompletedTaskIndices(result);
        } catch (const ValidationException& e) {
            throw ExecutorFailureException(executor_->name(), std::string("malformed batch report: ") + e.what());
        }
        if (!reported) {
            Logger::get("agent")->warn("[BatchRunner] {} did not report completed tasks", executor_->name());
            reported.emplace();
        }

        auto completion = stateMachine_->applyBatchCompletion(planId, *reported);
        summary.completedTasks.insert(summary.completedTasks.end(), completion.newlyCompletedTasks.begin(),
                                      completion.newlyCompletedTasks.end());

        if (!postApplyCommands_.empty()) {
            std::map<std::string, std::string> env{{"PLANRUNNER_PLAN_ID", std::to_string(planId)}};
            if (!plan.filename.empty()) {
                env["PLANRUNNER_PLAN_FILE_PATH"] = plan.filename;
            }
            if (!process::PostCommandRunner::runAll(postApplyCommands_, baseDirectory, env)) {
                throw PlanRunnerException("post-apply command failed after batch round " +
                                          std::to_string(summary.rounds) + " of plan " + std::to_string(planId));
            }
        }

        if (completion.planComplete) {
            summary.planComplete = true;
            break;
        }

        if (completion.newlyCompletedTasks.empty()) {
            ++roundsWithoutProgress;
            Logger::get("agent")->warn("[BatchRunner] Plan {} round {} made no progress ({} in a row)", planId,
                                       summary.rounds, roundsWithoutProgress);
            if (roundsWithoutProgress >= options.maxNoProgressRounds) {
                throw BatchNoProgressException(planId, roundsWithoutProgress);
            }
        } else {
            roundsWithoutProgress = 0;
        }
    }

    Logger::get("agent")->info("[BatchRunner] Plan {} finished after {} round(s), {} task(s) completed", planId,
                               summary.rounds, summary.completedTasks.size());
    return summary;
}

} // namespace planrunner::core::agent
