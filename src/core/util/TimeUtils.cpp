#include "core/util/TimeUtils.h"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace planrunner::core::util {

std::string TimeUtils::nowIso8601() {
    return toIso8601(std::chrono::system_clock::now());
}

std::string TimeUtils::toIso8601(std::chrono::system_clock::time_point timePoint) {
    auto timeT = std::chrono::system_clock::to_time_t(timePoint);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timePoint.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm tm{};
    gmtime_r(&timeT, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> TimeUtils::parseIso8601(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        if (!digits.empty()) {
            digits = digits.substr(0, 3);
            while (digits.size() < 3) {
                digits.push_back('0');
            }
            millis = std::stoi(digits);
        }
    }

    if (ss.get() != 'Z') {
        return std::nullopt;
    }

    auto seconds = timegm(&tm);
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

} // namespace planrunner::core::util
