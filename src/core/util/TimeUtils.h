#ifndef PLANRUNNER_CORE_UTIL_TIME_UTILS_H
#define PLANRUNNER_CORE_UTIL_TIME_UTILS_H

#include <chrono>
#include <optional>
#include <string>

namespace planrunner::core::util {

/**
 * @brief ISO-8601 UTC timestamp helpers
 *
 * Persisted timestamps are strings such as "2026-01-02T03:04:05.678Z"; they
 * sort lexicographically in time order, which the readiness sort relies on.
 */
class TimeUtils {
public:
    static std::string nowIso8601();

    static std::string toIso8601(std::chrono::system_clock::time_point timePoint);

    /**
     * @brief Parse "YYYY-MM-DDTHH:MM:SS[.mmm]Z"
     * @return std::nullopt if the text is not in that form
     */
    static std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& text);
};

} // namespace planrunner::core::util

#endif // PLANRUNNER_CORE_UTIL_TIME_UTILS_H
