#include "cli/Commands.h"
#include "core/agent/core/AgentLoop.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"
#include "core/readiness/ReadinessResolver.h"
#include "core/review/core/ReviewMerger.h"
#include "core/util/FileUtils.h"
#include "core/vcs/impl/GitVcsClient.h"
#include "core/workspace/core/RepositoryIdentityResolver.h"
#include "core/workspace/core/WorkspaceManager.h"
#include "planrunner/executor/ExecutorFactory.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace planrunner::cli {

using core::logging::Logger;
using core::plan::Plan;
using core::readiness::ReadinessResolver;

namespace {

std::string priorityText(const Plan& plan) {
    return plan.priority ? core::plan::planPriorityToString(*plan.priority) : "-";
}

std::string progressText(const Plan& plan) {
    size_t done = 0;
    for (const auto& task : plan.tasks) {
        if (task.isComplete()) {
            ++done;
        }
    }
    return fmt::format("{}/{}", done, plan.tasks.size());
}

std::string joinInts(const std::vector<int>& ids) {
    std::string joined;
    for (int id : ids) {
        joined += (joined.empty() ? "" : ", ") + std::to_string(id);
    }
    return joined;
}

nlohmann::json planSummaryJson(const Plan& plan, const core::plan::PlanMap& all) {
    return {
        {"id", plan.id},
        {"title", plan.displayTitle()},
        {"status", core::plan::planStatusToString(plan.status)},
        {"priority", plan.priority ? nlohmann::json(core::plan::planPriorityToString(*plan.priority))
                                   : nlohmann::json(nullptr)},
        {"tasks", progressText(plan)},
        {"ready", ReadinessResolver::isReady(plan, all)},
        {"blockedBy", ReadinessResolver::blockingDependencies(plan, all)},
        {"file", plan.filename},
    };
}

void reportSkipped(const std::vector<core::plan::SkippedPlanFile>& skipped) {
    for (const auto& file : skipped) {
        Logger::get("cli")->warn("[CLI] Skipped {}: {}", file.path, file.reason);
    }
}

int requirePlanId(const ParsedArgs& args, const std::string& command) {
    auto text = args.positional(1);
    if (!text) {
        throw core::ValidationException(command + " requires a plan id");
    }
    return ArgParser::parseInt(*text, command + " plan id");
}

std::string workspaceArgument(const ParsedArgs& args) {
    auto path = args.positional(2);
    return core::util::FileUtils::normalizePath(path ? fs::path(*path) : fs::current_path());
}

} // namespace

std::set<std::string> booleanFlags() {
    return {"help", "batch", "dry-run", "print", "reverse", "pending-only", "json",
            "force", "no-lock", "clear-issue-urls", "all", "auto-workspace"};
}

void printUsage(std::ostream& out) {
    out << "usage: planrunner [--config FILE] [--repo DIR] [--log-level LEVEL] <command> [args]\n"
           "\n"
           "commands:\n"
           "  ready [--priority P]... [--tag T]... [--epic ID] [--pending-only] [--limit N]\n"
           "        [--sort priority|id|title|created|updated] [--reverse] [--json]\n"
           "  list [--status S]... [--json]\n"
           "  validate\n"
           "  agent <id> [--batch] [--workspace DIR | --auto-workspace] [--executor NAME]\n"
           "        [--dry-run] [--no-lock]\n"
           "  review <id> [--executor claude-code|codex-cli|both] [--task-index N]...\n"
           "        [--task-title T]... [--workspace DIR] [--print]\n"
           "  workspace list [--repository-id ID] [--all] [--json]\n"
           "  workspace update [DIR] [--name V] [--description V] [--task-id V] [--plan-id N]\n"
           "        [--plan-title V] [--issue-url U]... [--clear-issue-urls]\n"
           "  workspace lock [DIR]\n"
           "  workspace unlock [DIR] [--force]\n"
           "  workspace create <task-id> [--plan ID]\n"
           "  workspace prune\n";
}

AppContext buildContext(const ParsedArgs& args, std::shared_ptr<executor::CancellationToken> cancellation) {
    AppContext context;
    context.cancellation = std::move(cancellation);
    context.vcs = std::make_shared<core::vcs::GitVcsClient>();

    fs::path repositoryRoot;
    if (auto repo = args.value("repo")) {
        repositoryRoot = core::util::FileUtils::normalizePath(*repo);
    } else {
        repositoryRoot = context.vcs->repositoryRoot(fs::current_path()).value_or(fs::current_path());
    }

    config::ConfigLoader loader;
    const auto explicitConfig = args.value("config");
    const fs::path configPath = explicitConfig ? fs::path(*explicitConfig)
                                               : config::PlanRunnerConfig::defaultConfigPath(repositoryRoot);
    std::error_code ec;
    if (explicitConfig || fs::exists(configPath, ec)) {
        if (!loader.loadFromFile(configPath)) {
            throw core::ConfigException("cannot load " + configPath.string());
        }
    }

    context.config = config::PlanRunnerConfig::fromLoader(loader, repositoryRoot);
    context.store = std::make_shared<core::plan::PlanStore>(context.config.tasksDirectory);
    context.stateMachine = std::make_shared<core::task::TaskStateMachine>(context.store);
    context.registry = std::make_shared<core::workspace::WorkspaceRegistry>(context.config.trackingFile, context.vcs);
    context.locks = std::make_shared<core::workspace::WorkspaceLockManager>(context.config.lockDirectory);
    return context;
}

int runCommand(AppContext& context, const ParsedArgs& args) {
    const std::string command = args.positional(0).value_or("");
    if (command == "ready")     return runReady(context, args);
    if (command == "list")      return runList(context, args);
    if (command == "validate")  return runValidate(context, args);
    if (command == "agent")     return runAgent(context, args);
    if (command == "review")    return runReview(context, args);
    if (command == "workspace") return runWorkspace(context, args);

    std::cerr << "unknown command '" << command << "'\n";
    printUsage(std::cerr);
    return 2;
}

int runReady(AppContext& context, const ParsedArgs& args) {
    auto loaded = context.store->loadAll();
    reportSkipped(loaded.skipped);

    core::readiness::ReadyFilterOptions options;
    for (const auto& text : args.values("priority")) {
        auto priority = core::plan::planPriorityFromString(text);
        if (!priority) {
            throw core::ValidationException("unknown priority '" + text + "'");
        }
        options.priorities.push_back(*priority);
    }
    options.tags = core::plan::normalizeTags(args.values("tag"));
    options.epicId = args.intValue("epic");
    options.pendingOnly = args.has("pending-only");
    if (auto limit = args.intValue("limit")) {
        if (*limit < 0) {
            throw core::ValidationException("--limit must not be negative");
        }
        options.limit = static_cast<size_t>(*limit);
    }
    if (auto sort = args.value("sort")) {
        auto field = core::readiness::sortFieldFromString(*sort);
        if (!field) {
            throw core::ValidationException("unknown sort field '" + *sort + "'");
        }
        options.sortField = *field;
    }
    options.reverse = args.has("reverse");

    auto ready = ReadinessResolver::filterAndSort(loaded.plans, options);

    if (args.has("json")) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& plan : ready) {
            out.push_back(planSummaryJson(plan, loaded.plans));
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (ready.empty()) {
        std::cout << "No ready plans." << std::endl;
        return 0;
    }
    std::cout << fmt::format("{:>5}  {:<8}  {:<11}  {:<7}  {}\n", "ID", "PRIORITY", "STATUS", "TASKS", "TITLE");
    for (const auto& plan : ready) {
        std::cout << fmt::format("{:>5}  {:<8}  {:<11}  {:<7}  {}\n", plan.id, priorityText(plan),
                                 core::plan::planStatusToString(plan.status), progressText(plan),
                                 plan.displayTitle());
    }
    return 0;
}

int runList(AppContext& context, const ParsedArgs& args) {
    auto loaded = context.store->loadAll();
    reportSkipped(loaded.skipped);

    std::vector<core::plan::PlanStatus> statuses;
    for (const auto& text : args.values("status")) {
        auto status = core::plan::planStatusFromString(text);
        if (!status) {
            throw core::ValidationException("unknown status '" + text + "'");
        }
        statuses.push_back(*status);
    }

    std::vector<Plan> plans;
    for (const auto& [id, plan] : loaded.plans) {
        if (statuses.empty() || std::find(statuses.begin(), statuses.end(), plan.status) != statuses.end()) {
            plans.push_back(plan);
        }
    }

    if (args.has("json")) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& plan : plans) {
            out.push_back(planSummaryJson(plan, loaded.plans));
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    std::cout << fmt::format("{:>5}  {:<8}  {:<11}  {:<7}  {:<5}  {}\n", "ID", "PRIORITY", "STATUS", "TASKS",
                             "READY", "TITLE");
    for (const auto& plan : plans) {
        auto blocking = ReadinessResolver::blockingDependencies(plan, loaded.plans);
        std::string title = plan.displayTitle();
        if (!blocking.empty()) {
            title += " (blocked by " + joinInts(blocking) + ")";
        }
        std::cout << fmt::format("{:>5}  {:<8}  {:<11}  {:<7}  {:<5}  {}\n", plan.id, priorityText(plan),
                                 core::plan::planStatusToString(plan.status), progressText(plan),
                                 ReadinessResolver::isReady(plan, loaded.plans) ? "yes" : "no", title);
    }
    return 0;
}

int runValidate(AppContext& context, const ParsedArgs&) {
    auto loaded = context.store->loadAll();
    int problems = 0;

    for (const auto& file : loaded.skipped) {
        std::cout << file.path << ": " << file.reason << "\n";
        ++problems;
    }
    for (const auto& [id, plan] : loaded.plans) {
        for (int dependency : plan.dependencies) {
            if (loaded.plans.count(dependency) == 0) {
                std::cout << plan.filename << ": dependency " << dependency << " does not exist\n";
                ++problems;
            }
        }
        if (plan.parent && loaded.plans.count(*plan.parent) == 0) {
            std::cout << plan.filename << ": parent " << *plan.parent << " does not exist\n";
            ++problems;
        }
    }
    auto cycle = ReadinessResolver::findDependencyCycle(loaded.plans);
    if (!cycle.empty()) {
        std::string path;
        for (int id : cycle) {
            path += (path.empty() ? "" : " -> ") + std::to_string(id);
        }
        std::cout << "dependency cycle: " << path << "\n";
        ++problems;
    }

    if (problems == 0) {
        std::cout << loaded.plans.size() << " plan(s) valid" << std::endl;
        return 0;
    }
    std::cout << problems << " problem(s) found" << std::endl;
    return 1;
}

int runAgent(AppContext& context, const ParsedArgs& args) {
    const int planId = requirePlanId(args, "agent");

    executor::ExecutorFactory factory(context.config);
    auto executor = args.value("executor") ? factory.create(*args.value("executor")) : factory.createDefault();

    core::agent::AgentRunOptions options;
    options.batch = args.has("batch");
    options.dryRun = args.has("dry-run");
    options.lockWorkspace = !args.has("no-lock");
    options.cancellation = context.cancellation;

    if (auto workspacePath = args.value("workspace")) {
        options.workspacePath = core::util::FileUtils::normalizePath(*workspacePath);
    } else if (args.has("auto-workspace")) {
        core::workspace::RepositoryIdentityResolver resolver(context.vcs);
        auto identity = resolver.resolve(context.config.repositoryRoot);
        core::workspace::WorkspaceAutoSelector selector(context.registry, context.locks);
        auto selected = selector.select(identity.repositoryId, planId);
        if (!selected) {
            throw core::NotFoundException("available workspace for repository", identity.repositoryId);
        }
        options.workspacePath = selected->workspacePath;
        Logger::get("cli")->info("[CLI] Using workspace {}", selected->workspacePath);
    }

    core::agent::AgentLoop loop(context.store, context.stateMachine, executor, context.locks,
                                context.config.postApplyCommands);
    auto summary = loop.run(planId, options);

    if (options.dryRun) {
        if (summary.dryRunPrompt) {
            std::cout << *summary.dryRunPrompt << std::endl;
        } else {
            std::cout << "Plan " << planId << " has nothing left to do." << std::endl;
        }
        return 0;
    }
    std::cout << "Plan " << planId << (summary.planComplete ? " complete" : " stopped") << " after "
              << summary.dispatched << " dispatch(es)." << std::endl;
    return summary.planComplete ? 0 : 1;
}

int runReview(AppContext& context, const ParsedArgs& args) {
    const int planId = requirePlanId(args, "review");
    Plan plan = context.store->load(planId);

    core::review::ReviewTaskFilter filter;
    for (const auto& text : args.values("task-index")) {
        filter.indices.push_back(ArgParser::parseInt(text, "--task-index"));
    }
    filter.titles = args.values("task-title");

    executor::ExecutorFactory factory(context.config);
    const std::string selection = args.value("executor").value_or(context.config.review.defaultExecutor);
    std::vector<std::shared_ptr<executor::IExecutor>> executors;
    try {
        executors = factory.createForReview(selection);
    } catch (const std::invalid_argument& e) {
        throw core::ValidationException(e.what());
    }

    core::review::ReviewOptions options;
    options.allowPartialFailures = context.config.review.allowPartialFailures;
    options.workspacePath = args.value("workspace").value_or(context.config.repositoryRoot.string());
    options.cancellation = context.cancellation;

    core::review::ReviewMerger merger(options);
    auto result = merger.runReview(plan, executors, filter);

    if (args.has("print")) {
        std::cout << core::review::reviewResultToJson(result).dump(2) << std::endl;
        return 0;
    }

    std::cout << "Review of plan " << result.planId << ": " << result.planTitle << "\n";
    for (const auto& issue : result.issues) {
        std::string location = issue.file ? *issue.file : "(general)";
        if (issue.file && issue.line) {
            location += ":" + std::to_string(*issue.line);
        }
        std::cout << fmt::format("[{}] {} {}: {}\n", core::review::reviewSeverityToString(issue.severity),
                                 core::review::reviewCategoryToString(issue.category), location, issue.content);
        if (!issue.suggestion.empty()) {
            std::cout << "    suggestion: " << issue.suggestion << "\n";
        }
    }
    for (const auto& recommendation : result.recommendations) {
        std::cout << "recommendation: " << recommendation << "\n";
    }
    for (const auto& item : result.actionItems) {
        std::cout << "action item: " << item << "\n";
    }
    std::cout << result.summary.totalIssues << " issue(s) in " << result.summary.filesReviewed << " file(s)"
              << std::endl;
    return 0;
}

namespace {

int workspaceList(AppContext& context, const ParsedArgs& args) {
    core::workspace::ListOptions options;
    if (auto repositoryId = args.value("repository-id")) {
        options.repositoryId = *repositoryId;
    } else if (!args.has("all")) {
        try {
            core::workspace::RepositoryIdentityResolver resolver(context.vcs);
            options.repositoryId = resolver.resolve(context.config.repositoryRoot).repositoryId;
        } catch (const core::VcsException& e) {
            Logger::get("cli")->warn("[CLI] Listing every workspace: {}", e.what());
        }
    }

    auto entries = context.registry->listEntries(options);

    if (args.has("json")) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : entries) {
            nlohmann::json entry = item.entry;
            entry["branch"] = item.branch;
            entry["locked"] = context.locks->isLocked(item.entry.workspacePath);
            if (!item.stateMessage.empty()) {
                entry["stateMessage"] = item.stateMessage;
            }
            out.push_back(entry);
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (entries.empty()) {
        std::cout << "No workspaces." << std::endl;
        return 0;
    }
    for (const auto& item : entries) {
        const auto& entry = item.entry;
        std::string line = entry.workspacePath;
        if (!item.branch.empty()) {
            line += " [" + item.branch + "]";
        }
        if (entry.taskId) {
            line += " task=" + *entry.taskId;
        }
        if (entry.name) {
            line += " name=" + *entry.name;
        }
        if (auto lock = context.locks->getLockInfo(entry.workspacePath);
            lock && context.locks->isLocked(entry.workspacePath)) {
            line += " locked by " + core::workspace::describeLockHolder(*lock);
        }
        if (!item.stateMessage.empty()) {
            line += " (" + item.stateMessage + ")";
        }
        std::cout << line << "\n";
    }
    std::cout.flush();
    return 0;
}

int workspaceUpdate(AppContext& context, const ParsedArgs& args) {
    using core::workspace::FieldPatch;

    core::workspace::WorkspaceMetadataPatch patch;
    patch.name = core::workspace::patchFromText(args.value("name"));
    patch.description = core::workspace::patchFromText(args.value("description"));
    patch.taskId = core::workspace::patchFromText(args.value("task-id"));
    patch.planTitle = core::workspace::patchFromText(args.value("plan-title"));
    if (auto planId = args.value("plan-id")) {
        patch.planId = planId->empty() ? FieldPatch<int>::clear()
                                       : FieldPatch<int>::set(ArgParser::parseInt(*planId, "--plan-id"));
    }
    if (args.has("clear-issue-urls")) {
        patch.issueUrls = FieldPatch<std::vector<std::string>>::clear();
    } else if (args.has("issue-url")) {
        patch.issueUrls = FieldPatch<std::vector<std::string>>::set(args.values("issue-url"));
    }

    const std::string path = workspaceArgument(args);
    auto entry = context.registry->patchMetadata(path, patch);
    std::cout << nlohmann::json(entry).dump(2) << std::endl;
    return 0;
}

int workspaceLock(AppContext& context, const ParsedArgs& args) {
    const std::string path = workspaceArgument(args);
    // The CLI exits right away, so a PID lock would be stale at once
    auto info = context.locks->acquire(path, core::workspace::LockType::PERSISTENT, "planrunner workspace lock");
    std::cout << "Locked " << path << " (" << core::workspace::describeLockHolder(info) << ")" << std::endl;
    return 0;
}

int workspaceUnlock(AppContext& context, const ParsedArgs& args) {
    const std::string path = workspaceArgument(args);
    if (!context.locks->release(path, args.has("force"))) {
        auto holder = context.locks->getLockInfo(path);
        if (holder) {
            std::cerr << "Lock on " << path << " is held by running " << core::workspace::describeLockHolder(*holder)
                      << "; use --force to remove it" << std::endl;
        } else {
            std::cerr << path << " is not locked" << std::endl;
        }
        return 1;
    }
    std::cout << "Unlocked " << path << std::endl;
    return 0;
}

int workspaceCreate(AppContext& context, const ParsedArgs& args) {
    auto taskId = args.positional(2);
    if (!taskId) {
        throw core::ValidationException("workspace create requires a task id");
    }

    core::workspace::CreateWorkspaceOptions options;
    options.taskId = *taskId;
    if (auto planId = args.intValue("plan")) {
        Plan plan = context.store->load(*planId);
        options.planFilePath = plan.filename;
        options.planId = plan.id;
        options.planTitle = plan.displayTitle();
    }

    core::workspace::WorkspaceManager manager(context.config.workspaceCreation, context.config.repositoryRoot,
                                              context.vcs, context.registry, context.locks);
    auto workspace = manager.create(options);
    if (!workspace) {
        std::cerr << "Workspace creation failed" << std::endl;
        return 1;
    }
    std::cout << workspace->path << std::endl;
    return 0;
}

int workspacePrune(AppContext& context) {
    auto removed = context.registry->pruneMissing();
    for (const auto& path : removed) {
        std::cout << "Removed " << path << "\n";
    }
    std::cout << removed.size() << " entr" << (removed.size() == 1 ? "y" : "ies") << " pruned" << std::endl;
    return 0;
}

} // namespace

int runWorkspace(AppContext& context, const ParsedArgs& args) {
    const std::string sub = args.positional(1).value_or("list");
    if (sub == "list")   return workspaceList(context, args);
    if (sub == "update") return workspaceUpdate(context, args);
    if (sub == "lock")   return workspaceLock(context, args);
    if (sub == "unlock") return workspaceUnlock(context, args);
    if (sub == "create") return workspaceCreate(context, args);
    if (sub == "prune")  return workspacePrune(context);

    std::cerr << "unknown workspace command '" << sub << "'\n";
    printUsage(std::cerr);
    return 2;
}

} // namespace planrunner::cli
