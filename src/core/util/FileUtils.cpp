#include "core/util/FileUtils.h"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <pwd.h>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace planrunner::core::util {

std::string FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

void FileUtils::writeFileAtomic(const fs::path& path, const std::string& contents) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create directory " + path.parent_path().string() +
                                     ": " + ec.message());
        }
    }

    std::string tempTemplate = path.string() + ".tmp.XXXXXX";
    int fd = mkstemp(tempTemplate.data());
    if (fd < 0) {
        throw std::runtime_error("Failed to create temp file for " + path.string() + ": " +
                                 std::strerror(errno));
    }

    const char* data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = std::strerror(errno);
            ::close(fd);
            ::unlink(tempTemplate.c_str());
            throw std::runtime_error("Failed to write " + tempTemplate + ": " + reason);
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0) {
        spdlog::warn("[FileUtils] fsync failed for {}: {}", tempTemplate, std::strerror(errno));
    }
    // mkstemp creates 0600 files; plan and registry files are ordinary user files
    if (::fchmod(fd, 0644) != 0) {
        spdlog::warn("[FileUtils] fchmod failed for {}: {}", tempTemplate, std::strerror(errno));
    }
    ::close(fd);

    if (std::rename(tempTemplate.c_str(), path.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        ::unlink(tempTemplate.c_str());
        throw std::runtime_error("Failed to rename " + tempTemplate + " to " + path.string() + ": " + reason);
    }
}

PathState FileUtils::probeDirectory(const fs::path& path, std::string* errorMessage) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            return PathState::MISSING;
        }
        if (errorMessage) {
            *errorMessage = std::strerror(err);
        }
        return PathState::UNKNOWN;
    }

    return S_ISDIR(st.st_mode) ? PathState::DIRECTORY : PathState::NOT_DIRECTORY;
}

fs::path FileUtils::homeDirectory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }
    return fs::current_path();
}

fs::path FileUtils::expandHome(const std::string& path) {
    if (path == "~") {
        return homeDirectory();
    }
    if (path.rfind("~/", 0) == 0) {
        return homeDirectory() / path.substr(2);
    }
    return fs::path(path);
}

std::string FileUtils::normalizePath(const fs::path& path) {
    fs::path absolute = path.is_absolute() ? path : fs::absolute(path);
    std::string normal = absolute.lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

fs::path FileUtils::resolveAgainst(const fs::path& base, const std::string& path) {
    fs::path expanded = expandHome(path);
    if (expanded.is_absolute()) {
        return expanded.lexically_normal();
    }
    return (base / expanded).lexically_normal();
}

} // namespace planrunner::core::util
