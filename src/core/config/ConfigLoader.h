#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace planrunner {
namespace config {

/**
 * @brief JSON configuration file loader
 *
 * Holds one parsed JSON document and gives dot-path access to it, e.g.
 * getValue<std::string>("workspaceCreation.cloneLocation").
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration from a JSON file
     *
     * @return false if the file is missing or is not valid JSON
     */
    bool loadFromFile(const std::filesystem::path& file_path);

    /**
     * @brief Load configuration from a JSON string
     *
     * @return false if the text is not valid JSON or not an object
     */
    bool loadFromString(const std::string& json_str);

    const nlohmann::json& getJson() const { return config_; }

    /**
     * @brief Value at a dot-separated key path
     *
     * @return default_value when the key is absent or has a different type
     */
    template<typename T>
    T getValue(const std::string& key_path, const T& default_value = T{}) const;

    bool hasKey(const std::string& key_path) const;

    /**
     * @brief Sub-document at a key path
     * @throws ConfigException if the key is absent
     */
    nlohmann::json getSection(const std::string& key_path) const;

    /**
     * @brief Path of the file last loaded, empty for string input
     */
    const std::filesystem::path& sourcePath() const { return source_path_; }

    bool isLoaded() const { return !config_.empty(); }

    void clear() {
        config_.clear();
        source_path_.clear();
    }

private:
    nlohmann::json config_;
    std::filesystem::path source_path_;

    const nlohmann::json* navigateToKey(const std::string& key_path) const;

    static std::vector<std::string> splitKeyPath(const std::string& key_path);
};

template<typename T>
T ConfigLoader::getValue(const std::string& key_path, const T& default_value) const {
    const nlohmann::json* value = navigateToKey(key_path);
    if (value == nullptr || value->is_null()) {
        return default_value;
    }

    try {
        return value->get<T>();
    } catch (const nlohmann::json::exception&) {
        return default_value;
    }
}

} // namespace config
} // namespace planrunner
