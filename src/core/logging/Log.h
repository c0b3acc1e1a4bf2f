#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace planrunner::core::logging {

/**
 * Default logger setup
 *
 * Installs a logger writing to stderr (stdout carries command output such
 * as `review --print` JSON) and, optionally, to a log file.
 *
 * Preconditions:
 * - called once from main() before any module logger is requested
 *
 * Postconditions:
 * - spdlog::default_logger() is the "planrunner" logger
 * - Logger::get() clones created afterwards share its sinks and level
 *
 * Throws:
 * - spdlog::spdlog_ex if the log file cannot be opened
 */
inline void initializeLogger(spdlog::level::level_enum level,
                             const std::optional<std::string>& logFile = std::nullopt) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (logFile && !logFile->empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*logFile, false));
        }

        auto logger = std::make_shared<spdlog::logger>("planrunner", sinks.begin(), sinks.end());
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);

        logger->set_error_handler([](const std::string& msg) {
            std::cerr << "Logger error: " << msg << std::endl;
        });

        spdlog::set_default_logger(logger);
        spdlog::set_level(level);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        throw;
    }
}

/**
 * Flush and drop every registered logger before exit
 */
inline void shutdownLogger() {
    spdlog::shutdown();
}

}  // namespace planrunner::core::logging
