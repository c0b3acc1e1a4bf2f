#ifndef PLANRUNNER_CORE_LOGGING_LOGGER_H
#define PLANRUNNER_CORE_LOGGING_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <string>

namespace planrunner::core::logging {

/**
 * @brief Per-module logger access
 *
 * Returns a clone of the default logger named after the module, so the
 * module name shows up in every line while sinks and level stay global.
 */
class Logger {
public:
    static std::shared_ptr<spdlog::logger> get(const std::string& component) {
        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        auto existing = spdlog::get(component);
        if (existing) {
            return existing;
        }

        auto logger = spdlog::default_logger()->clone(component);
        spdlog::register_logger(logger);
        return logger;
    }
};

} // namespace planrunner::core::logging

#endif // PLANRUNNER_CORE_LOGGING_LOGGER_H
