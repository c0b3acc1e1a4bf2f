#ifndef PLANRUNNER_CORE_UTIL_FILE_UTILS_H
#define PLANRUNNER_CORE_UTIL_FILE_UTILS_H

#include <filesystem>
#include <optional>
#include <string>

namespace planrunner::core::util {

/**
 * @brief Directory probe outcome
 *
 * MISSING is returned only for "not found" class errors. Any other stat
 * failure (permission, unavailable mount) is UNKNOWN so callers do not
 * mistake an unreachable directory for a deleted one.
 */
enum class PathState {
    DIRECTORY,
    NOT_DIRECTORY,
    MISSING,
    UNKNOWN
};

/**
 * @brief File system helpers shared by the plan store and the workspace registry
 */
class FileUtils {
public:
    /**
     * @brief Read a whole file
     * @throws std::runtime_error if the file cannot be opened
     */
    static std::string readFile(const std::filesystem::path& path);

    /**
     * @brief Write a file through a sibling temp file and rename()
     *
     * A reader sees either the old or the new contents, never a partial
     * write. Parent directories are created as needed.
     *
     * @throws std::runtime_error on any I/O failure (the temp file is removed)
     */
    static void writeFileAtomic(const std::filesystem::path& path, const std::string& contents);

    /**
     * @brief Probe a directory with stat(2)
     * @param errorMessage receives strerror() text for UNKNOWN results
     */
    static PathState probeDirectory(const std::filesystem::path& path,
                                    std::string* errorMessage = nullptr);

    /**
     * @brief Expand a leading "~/" using $HOME
     */
    static std::filesystem::path expandHome(const std::string& path);

    /**
     * @brief Absolute, lexically normal path without a trailing separator
     */
    static std::string normalizePath(const std::filesystem::path& path);

    /**
     * @brief Resolve a possibly relative path against a base directory
     */
    static std::filesystem::path resolveAgainst(const std::filesystem::path& base,
                                                const std::string& path);

    /**
     * @brief $HOME, falling back to the passwd entry of the current user
     */
    static std::filesystem::path homeDirectory();
};

} // namespace planrunner::core::util

#endif // PLANRUNNER_CORE_UTIL_FILE_UTILS_H
