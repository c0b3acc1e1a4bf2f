#ifndef PLANRUNNER_CORE_UTIL_HASH_UTILS_H
#define PLANRUNNER_CORE_UTIL_HASH_UTILS_H

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace planrunner::core::util {

/**
 * @brief 64-bit FNV-1a, used for deterministic file names and fallback ids
 */
inline uint64_t fnv1a64(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

inline std::string fnv1a64Hex(const std::string& text) {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << fnv1a64(text);
    return oss.str();
}

} // namespace planrunner::core::util

#endif // PLANRUNNER_CORE_UTIL_HASH_UTILS_H
