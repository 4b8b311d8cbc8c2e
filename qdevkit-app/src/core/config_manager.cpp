// config_manager.cpp - YAML configuration implementation
#include "core/config_manager.h"
#include <qdevkit/hash_generator.h>
#include <qdevkit/timestamp_converter.h>
#include <qdevkit/uuid_generator.h>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>
#include <spdlog/spdlog.h>

namespace qdevkit::app::core {

ConfigManager::ConfigManager() {
    cached_config_ = GetDefaultConfig();
    spdlog::debug("ConfigManager created");
}

bool ConfigManager::Load(const std::string& path) {
    return LoadConfig(path, cached_config_);
}

bool ConfigManager::Save() {
    if (last_loaded_path_.empty()) {
        last_loaded_path_ = FindConfigFile();
    }
    return SaveConfig(cached_config_, last_loaded_path_);
}

bool ConfigManager::LoadConfig(const std::string& path, AppConfig& config) {
    // Remember the target even when the file does not exist yet, so Save() writes there
    last_loaded_path_ = path;

    try {
        if (!std::filesystem::exists(path)) {
            spdlog::warn("Config file not found: {}, using defaults", path);
            config = GetDefaultConfig();
            return true;
        }

        YAML::Node yaml = YAML::LoadFile(path);
        config = GetDefaultConfig();

        if (yaml["window"]) {
            auto window = yaml["window"];
            if (window["width"]) config.window_width = window["width"].as<int>();
            if (window["height"]) config.window_height = window["height"].as<int>();
            if (window["theme"]) config.theme = window["theme"].as<std::string>();
        }

        if (yaml["json"]) {
            auto json = yaml["json"];
            if (json["indent"]) config.json_indent = json["indent"].as<int>();
            if (json["sort_keys"]) config.json_sort_keys = json["sort_keys"].as<bool>();
        }

        if (yaml["uuid"]) {
            auto uuid = yaml["uuid"];
            if (uuid["version"]) config.uuid_version = uuid["version"].as<int>();
            if (uuid["quantity"]) config.uuid_quantity = uuid["quantity"].as<int>();
            if (uuid["uppercase"]) config.uuid_uppercase = uuid["uppercase"].as<bool>();
            if (uuid["with_dashes"]) config.uuid_with_dashes = uuid["with_dashes"].as<bool>();
        }

        if (yaml["hash"]) {
            auto hash = yaml["hash"];
            if (hash["algorithm"]) config.hash_algorithm = hash["algorithm"].as<std::string>();
        }

        if (yaml["timestamp"]) {
            auto ts = yaml["timestamp"];
            if (ts["unit"]) config.timestamp_unit = ts["unit"].as<std::string>();
            if (ts["timezone"]) config.timestamp_timezone = ts["timezone"].as<std::string>();
        }

        if (yaml["jsonpath"]) {
            auto jp = yaml["jsonpath"];
            if (jp["history_file"]) config.jsonpath_history_file = jp["history_file"].as<std::string>();
            if (jp["max_history"]) config.jsonpath_max_history = jp["max_history"].as<int>();
        }

        if (yaml["logging"]) {
            auto logging = yaml["logging"];
            if (logging["level"]) config.log_level = logging["level"].as<std::string>();
            if (logging["file"]) config.log_file = logging["file"].as<std::string>();
        }

        Validate(config);

        spdlog::info("Config loaded from: {}", path);
        return true;

    } catch (const YAML::Exception& e) {
        spdlog::error("Failed to parse config file: {}", e.what());
        config = GetDefaultConfig();
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        config = GetDefaultConfig();
        return false;
    }
}

bool ConfigManager::SaveConfig(const AppConfig& config, const std::string& path) {
    try {
        std::filesystem::path file_path(path);
        if (file_path.has_parent_path()) {
            std::filesystem::create_directories(file_path.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "window" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "width" << YAML::Value << config.window_width;
        out << YAML::Key << "height" << YAML::Value << config.window_height;
        out << YAML::Key << "theme" << YAML::Value << config.theme;
        out << YAML::EndMap;

        out << YAML::Key << "json" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "indent" << YAML::Value << config.json_indent;
        out << YAML::Key << "sort_keys" << YAML::Value << config.json_sort_keys;
        out << YAML::EndMap;

        out << YAML::Key << "uuid" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "version" << YAML::Value << config.uuid_version;
        out << YAML::Key << "quantity" << YAML::Value << config.uuid_quantity;
        out << YAML::Key << "uppercase" << YAML::Value << config.uuid_uppercase;
        out << YAML::Key << "with_dashes" << YAML::Value << config.uuid_with_dashes;
        out << YAML::EndMap;

        out << YAML::Key << "hash" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "algorithm" << YAML::Value << config.hash_algorithm;
        out << YAML::EndMap;

        out << YAML::Key << "timestamp" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "unit" << YAML::Value << config.timestamp_unit;
        out << YAML::Key << "timezone" << YAML::Value << config.timestamp_timezone;
        out << YAML::EndMap;

        out << YAML::Key << "jsonpath" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "history_file" << YAML::Value << config.jsonpath_history_file;
        out << YAML::Key << "max_history" << YAML::Value << config.jsonpath_max_history;
        out << YAML::EndMap;

        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config.log_level;
        out << YAML::Key << "file" << YAML::Value << config.log_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(path);
        if (!file.is_open()) {
            spdlog::error("Cannot open config file for writing: {}", path);
            return false;
        }
        file << out.c_str();
        file.close();

        spdlog::info("Config saved to: {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

AppConfig ConfigManager::GetDefaultConfig() {
    return AppConfig();
}

bool ConfigManager::Validate(AppConfig& config) {
    const AppConfig defaults;
    bool ok = true;

    if (config.window_width < 400 || config.window_height < 300) {
        spdlog::warn("Window size {}x{} too small, using {}x{}",
                     config.window_width, config.window_height,
                     defaults.window_width, defaults.window_height);
        config.window_width = defaults.window_width;
        config.window_height = defaults.window_height;
        ok = false;
    }

    if (config.theme != "dark" && config.theme != "light" && config.theme != "high_contrast") {
        spdlog::warn("Unknown theme '{}', using '{}'", config.theme, defaults.theme);
        config.theme = defaults.theme;
        ok = false;
    }

    if (config.json_indent != 2 && config.json_indent != 4) {
        spdlog::warn("json.indent must be 2 or 4 (got {}), using {}", config.json_indent, defaults.json_indent);
        config.json_indent = defaults.json_indent;
        ok = false;
    }

    if (config.uuid_version != 4 && config.uuid_version != 7) {
        spdlog::warn("uuid.version must be 4 or 7 (got {})", config.uuid_version);
        config.uuid_version = defaults.uuid_version;
        ok = false;
    }

    if (config.uuid_quantity < 1 || config.uuid_quantity > qdevkit::UuidGenerator::kMaxQuantity) {
        spdlog::warn("uuid.quantity {} out of range", config.uuid_quantity);
        config.uuid_quantity = defaults.uuid_quantity;
        ok = false;
    }

    if (config.hash_algorithm != "all" && !qdevkit::HashGenerator::ParseAlgorithm(config.hash_algorithm)) {
        spdlog::warn("Unknown hash algorithm '{}', using '{}'", config.hash_algorithm, defaults.hash_algorithm);
        config.hash_algorithm = defaults.hash_algorithm;
        ok = false;
    }

    if (!qdevkit::TimestampConverter::ParseUnit(config.timestamp_unit)) {
        spdlog::warn("Unknown timestamp unit '{}'", config.timestamp_unit);
        config.timestamp_unit = defaults.timestamp_unit;
        ok = false;
    }

    if (!qdevkit::TimestampConverter::ParseUtcOffset(config.timestamp_timezone)) {
        spdlog::warn("Unrecognized timezone '{}', using UTC", config.timestamp_timezone);
        config.timestamp_timezone = defaults.timestamp_timezone;
        ok = false;
    }

    if (config.jsonpath_max_history < 1) {
        spdlog::warn("jsonpath.max_history must be positive");
        config.jsonpath_max_history = defaults.jsonpath_max_history;
        ok = false;
    }

    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("Unknown log level '{}'", config.log_level);
        config.log_level = defaults.log_level;
        ok = false;
    }

    return ok;
}

std::string ConfigManager::FindConfigFile() {
    std::vector<std::string> paths = {
        "./config/qdevkit.yaml",
        "./qdevkit.yaml",
        "../config/qdevkit.yaml",
#ifdef _WIN32
        std::string(getenv("APPDATA") ? getenv("APPDATA") : "") + "/QDevKit/qdevkit.yaml",
#else
        std::string(getenv("HOME") ? getenv("HOME") : "") + "/.config/qdevkit/qdevkit.yaml",
#endif
    };

    for (const auto& path : paths) {
        if (!path.empty() && std::filesystem::exists(path)) {
            return path;
        }
    }

    return "./config/qdevkit.yaml";
}

} // namespace qdevkit::app::core
