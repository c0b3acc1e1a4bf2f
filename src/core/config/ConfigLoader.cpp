#include "ConfigLoader.h"
#include "core/error/Exceptions.h"
#include "core/logging/Logger.h"
#include <fstream>
#include <sstream>

namespace planrunner {
namespace config {

using core::logging::Logger;

bool ConfigLoader::loadFromFile(const std::filesystem::path& file_path) {
    if (!std::filesystem::exists(file_path)) {
        Logger::get("config")->debug("[ConfigLoader] No configuration file at {}", file_path.string());
        return false;
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        Logger::get("config")->error("[ConfigLoader] Failed to open configuration file: {}", file_path.string());
        return false;
    }

    try {
        nlohmann::json parsed;
        file >> parsed;
        if (!parsed.is_object()) {
            Logger::get("config")->error("[ConfigLoader] {} does not contain a JSON object", file_path.string());
            return false;
        }
        config_ = std::move(parsed);
        source_path_ = file_path;
        Logger::get("config")->info("[ConfigLoader] Configuration loaded from: {}", file_path.string());
        return true;
    } catch (const nlohmann::json::exception& e) {
        Logger::get("config")->error("[ConfigLoader] Failed to parse JSON configuration from {}: {}",
                                     file_path.string(), e.what());
        return false;
    }
}

bool ConfigLoader::loadFromString(const std::string& json_str) {
    try {
        auto parsed = nlohmann::json::parse(json_str);
        if (!parsed.is_object()) {
            Logger::get("config")->error("[ConfigLoader] Configuration string is not a JSON object");
            return false;
        }
        config_ = std::move(parsed);
        source_path_.clear();
        return true;
    } catch (const nlohmann::json::exception& e) {
        Logger::get("config")->error("[ConfigLoader] Failed to parse JSON string: {}", e.what());
        return false;
    }
}

bool ConfigLoader::hasKey(const std::string& key_path) const {
    return navigateToKey(key_path) != nullptr;
}

nlohmann::json ConfigLoader::getSection(const std::string& key_path) const {
    const nlohmann::json* value = navigateToKey(key_path);
    if (value == nullptr) {
        throw core::ConfigException("key not found: " + key_path);
    }
    return *value;
}

std::vector<std::string> ConfigLoader::splitKeyPath(const std::string& key_path) {
    std::vector<std::string> keys;
    std::stringstream ss(key_path);
    std::string key;
    while (std::getline(ss, key, '.')) {
        if (!key.empty()) {
            keys.push_back(key);
        }
    }
    return keys;
}

const nlohmann::json* ConfigLoader::navigateToKey(const std::string& key_path) const {
    if (config_.empty()) {
        return nullptr;
    }

    const nlohmann::json* current = &config_;
    for (const auto& k : splitKeyPath(key_path)) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(k);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }

    return current;
}

} // namespace config
} // namespace planrunner
