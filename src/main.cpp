#include "cli/ArgParser.h"
#include "cli/Commands.h"
#include "core/error/Exceptions.h"
#include "core/logging/Log.h"
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <memory>

using namespace planrunner;

namespace {

// Shared with the signal handler; cancel() is a lock-free atomic store
executor::CancellationToken* g_cancellation = nullptr;

void signalHandler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_cancellation != nullptr) {
        g_cancellation->cancel();
    }
}

spdlog::level::level_enum levelFrom(const std::string& text) {
    auto level = spdlog::level::from_str(text);
    if (level == spdlog::level::off && text != "off") {
        throw core::ValidationException("unknown log level '" + text + "'");
    }
    return level;
}

} // namespace

int main(int argc, char** argv) {
    cli::ArgParser parser(cli::booleanFlags());
    cli::ParsedArgs args;
    try {
        args = parser.parse(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const core::ValidationException& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }
    if (args.has("help") || args.positionals.empty()) {
        cli::printUsage(args.has("help") ? std::cout : std::cerr);
        return args.has("help") ? 0 : 2;
    }

    auto cancellation = executor::CancellationToken::create();
    g_cancellation = cancellation.get();
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int exitCode = 1;
    try {
        const auto cliLevel = args.value("log-level");
        core::logging::initializeLogger(levelFrom(cliLevel.value_or("info")));

        auto context = cli::buildContext(args, cancellation);

        // Configured logging applies once the config file is read
        if (!cliLevel || context.config.logFile) {
            core::logging::initializeLogger(levelFrom(cliLevel.value_or(context.config.logLevel)),
                                            context.config.logFile);
            // Module loggers are clones; drop them so they pick up the new sinks
            auto configured = spdlog::default_logger();
            spdlog::drop_all();
            spdlog::set_default_logger(configured);
        }

        exitCode = cli::runCommand(context, args);
    } catch (const core::PlanRunnerException& e) {
        spdlog::error("{}", e.what());
        exitCode = 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        exitCode = 1;
    }

    core::logging::shutdownLogger();
    g_cancellation = nullptr;
    return exitCode;
}
