#ifndef PLANRUNNER_CLI_COMMANDS_H
#define PLANRUNNER_CLI_COMMANDS_H

#include "cli/ArgParser.h"
#include "core/config/PlanRunnerConfig.h"
#include "core/plan/core/PlanStore.h"
#include "core/task/core/TaskStateMachine.h"
#include "core/vcs/interfaces/IVcsClient.h"
#include "core/workspace/core/WorkspaceLockManager.h"
#include "core/workspace/core/WorkspaceRegistry.h"
#include "planrunner/executor/CancellationToken.hpp"
#include <iosfwd>
#include <memory>

namespace planrunner::cli {

/**
 * @brief Services shared by every command, wired from the configuration
 */
struct AppContext {
    config::PlanRunnerConfig config;
    std::shared_ptr<core::vcs::IVcsClient> vcs;
    std::shared_ptr<core::plan::PlanStore> store;
    std::shared_ptr<core::task::TaskStateMachine> stateMachine;
    std::shared_ptr<core::workspace::WorkspaceRegistry> registry;
    std::shared_ptr<core::workspace::WorkspaceLockManager> locks;
    std::shared_ptr<executor::CancellationToken> cancellation;
};

/**
 * @brief Flags that take no value, for ArgParser
 */
std::set<std::string> booleanFlags();

void printUsage(std::ostream& out);

/**
 * @throws ConfigException for an unreadable or invalid configuration file
 */
AppContext buildContext(const ParsedArgs& args, std::shared_ptr<executor::CancellationToken> cancellation);

/**
 * @brief Run the command named by the first positional
 * @return process exit code
 */
int runCommand(AppContext& context, const ParsedArgs& args);

int runReady(AppContext& context, const ParsedArgs& args);
int runList(AppContext& context, const ParsedArgs& args);
int runValidate(AppContext& context, const ParsedArgs& args);
int runAgent(AppContext& context, const ParsedArgs& args);
int runReview(AppContext& context, const ParsedArgs& args);
int runWorkspace(AppContext& context, const ParsedArgs& args);

} // namespace planrunner::cli

#endif // PLANRUNNER_CLI_COMMANDS_H
