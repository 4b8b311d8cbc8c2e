// config_manager.h - YAML configuration loading/saving
#pragma once

#include <string>

namespace qdevkit::app::core {

// Persistent application settings (config/qdevkit.yaml)
struct AppConfig {
    // Window
    int window_width = 1000;
    int window_height = 700;
    std::string theme = "dark";             // dark | light | high_contrast

    // JSON formatter
    int json_indent = 2;
    bool json_sort_keys = false;

    // UUID generator
    int uuid_version = 4;
    int uuid_quantity = 1;
    bool uuid_uppercase = false;
    bool uuid_with_dashes = true;

    // Hash generator
    std::string hash_algorithm = "sha256";

    // Timestamp converter
    std::string timestamp_unit = "auto";    // auto | seconds | milliseconds
    std::string timestamp_timezone = "UTC"; // UTC or a fixed offset such as +05:30

    // JSONPath filter
    std::string jsonpath_history_file;      // Empty = ~/.qdevkit_jsonpath_history.json
    int jsonpath_max_history = 20;

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager() = default;

    // Load config from YAML file into internal cache
    bool Load(const std::string& path);

    // Load config from YAML file
    bool LoadConfig(const std::string& path, AppConfig& config);

    // Save cached config to the file it was loaded from
    bool Save();

    // Save config to YAML file
    bool SaveConfig(const AppConfig& config, const std::string& path);

    const AppConfig& GetConfig() const { return cached_config_; }
    void SetConfig(const AppConfig& config) { cached_config_ = config; }

    const std::string& GetConfigPath() const { return last_loaded_path_; }

    static AppConfig GetDefaultConfig();

    // Replace out-of-range values with defaults; returns false if anything changed
    static bool Validate(AppConfig& config);

    // Get config file path (checks multiple locations)
    static std::string FindConfigFile();

private:
    std::string last_loaded_path_;
    AppConfig cached_config_;
};

} // namespace qdevkit::app::core
