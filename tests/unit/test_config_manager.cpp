#include <catch2/catch_test_macros.hpp>
#include "core/config_manager.h"
#include <filesystem>
#include <fstream>
#include <random>

using qdevkit::app::core::AppConfig;
using qdevkit::app::core::ConfigManager;
namespace fs = std::filesystem;

namespace {

fs::path ScratchPath(const std::string& name) {
    std::random_device rd;
    fs::path dir = fs::temp_directory_path() / ("qdevkit_config_" + std::to_string(rd()));
    fs::create_directories(dir);
    return dir / name;
}

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // namespace

TEST_CASE("Default configuration is valid", "[config]") {
    AppConfig config = ConfigManager::GetDefaultConfig();
    REQUIRE(config.theme == "dark");
    REQUIRE(config.json_indent == 2);
    REQUIRE(config.uuid_version == 4);
    REQUIRE(config.hash_algorithm == "sha256");
    REQUIRE(config.timestamp_unit == "auto");
    REQUIRE(config.jsonpath_max_history == 20);
    REQUIRE(ConfigManager::Validate(config));
}

TEST_CASE("Validate replaces out-of-range values", "[config]") {
    AppConfig config;

    SECTION("Window size") {
        config.window_width = 100;
        REQUIRE_FALSE(ConfigManager::Validate(config));
        REQUIRE(config.window_width == 1000);
        REQUIRE(config.window_height == 700);
    }

    SECTION("Theme and indent") {
        config.theme = "neon";
        config.json_indent = 3;
        REQUIRE_FALSE(ConfigManager::Validate(config));
        REQUIRE(config.theme == "dark");
        REQUIRE(config.json_indent == 2);
    }

    SECTION("UUID options") {
        config.uuid_version = 1;
        config.uuid_quantity = 5000;
        REQUIRE_FALSE(ConfigManager::Validate(config));
        REQUIRE(config.uuid_version == 4);
        REQUIRE(config.uuid_quantity == 1);
    }

    SECTION("Hash algorithm") {
        config.hash_algorithm = "crc32";
        REQUIRE_FALSE(ConfigManager::Validate(config));
        REQUIRE(config.hash_algorithm == "sha256");

        config.hash_algorithm = "all";
        REQUIRE(ConfigManager::Validate(config));
        REQUIRE(config.hash_algorithm == "all");
    }

    SECTION("Timestamp unit and zone") {
        config.timestamp_unit = "fortnights";
        config.timestamp_timezone = "Mars/Olympus";
        REQUIRE_FALSE(ConfigManager::Validate(config));
        REQUIRE(config.timestamp_unit == "auto");
        REQUIRE(config.timestamp_timezone == "UTC");

        config.timestamp_timezone = "+05:30";
        REQUIRE(ConfigManager::Validate(config));
        REQUIRE(config.timestamp_timezone == "+05:30");
    }

    SECTION("History size and log level") {
        config.jsonpath_max_history = 0;
        config.log_level = "chatty";
        REQUIRE_FALSE(ConfigManager::Validate(config));
        REQUIRE(config.jsonpath_max_history == 20);
        REQUIRE(config.log_level == "info");
    }
}

TEST_CASE("Config file round trip", "[config]") {
    fs::path file = ScratchPath("settings/qdevkit.yaml");

    AppConfig config;
    config.window_width = 1280;
    config.theme = "light";
    config.json_indent = 4;
    config.json_sort_keys = true;
    config.uuid_version = 7;
    config.uuid_quantity = 25;
    config.uuid_uppercase = true;
    config.hash_algorithm = "sha512";
    config.timestamp_unit = "milliseconds";
    config.timestamp_timezone = "-08:00";
    config.jsonpath_max_history = 50;
    config.log_level = "debug";

    ConfigManager manager;
    REQUIRE(manager.SaveConfig(config, file.string()));
    REQUIRE(fs::exists(file));

    AppConfig loaded;
    REQUIRE(manager.LoadConfig(file.string(), loaded));
    REQUIRE(loaded.window_width == 1280);
    REQUIRE(loaded.theme == "light");
    REQUIRE(loaded.json_indent == 4);
    REQUIRE(loaded.json_sort_keys);
    REQUIRE(loaded.uuid_version == 7);
    REQUIRE(loaded.uuid_quantity == 25);
    REQUIRE(loaded.uuid_uppercase);
    REQUIRE(loaded.uuid_with_dashes);
    REQUIRE(loaded.hash_algorithm == "sha512");
    REQUIRE(loaded.timestamp_unit == "milliseconds");
    REQUIRE(loaded.timestamp_timezone == "-08:00");
    REQUIRE(loaded.jsonpath_max_history == 50);
    REQUIRE(loaded.log_level == "debug");
    REQUIRE(manager.GetConfigPath() == file.string());

    std::error_code ec;
    fs::remove_all(file.parent_path().parent_path(), ec);
}

TEST_CASE("Config loading edge cases", "[config]") {
    ConfigManager manager;

    SECTION("Missing file gives defaults and remembers the path") {
        fs::path file = ScratchPath("missing.yaml");
        REQUIRE(manager.Load(file.string()));
        REQUIRE(manager.GetConfig().theme == "dark");
        REQUIRE(manager.GetConfigPath() == file.string());

        AppConfig changed = manager.GetConfig();
        changed.theme = "high_contrast";
        manager.SetConfig(changed);
        REQUIRE(manager.Save());
        REQUIRE(fs::exists(file));

        std::error_code ec;
        fs::remove_all(file.parent_path(), ec);
    }

    SECTION("Partial file keeps defaults for absent keys") {
        fs::path file = ScratchPath("partial.yaml");
        WriteFile(file, "hash:\n  algorithm: md5\nuuid:\n  quantity: 0\n");

        REQUIRE(manager.Load(file.string()));
        REQUIRE(manager.GetConfig().hash_algorithm == "md5");
        REQUIRE(manager.GetConfig().uuid_quantity == 1);
        REQUIRE(manager.GetConfig().json_indent == 2);

        std::error_code ec;
        fs::remove_all(file.parent_path(), ec);
    }

    SECTION("Malformed YAML falls back to defaults") {
        fs::path file = ScratchPath("broken.yaml");
        WriteFile(file, "window: [width: 10\n  height: {\n");

        AppConfig config;
        config.theme = "light";
        REQUIRE_FALSE(manager.LoadConfig(file.string(), config));
        REQUIRE(config.theme == "dark");

        std::error_code ec;
        fs::remove_all(file.parent_path(), ec);
    }

    SECTION("Wrong value type falls back to defaults") {
        fs::path file = ScratchPath("typed.yaml");
        WriteFile(file, "window:\n  width: wide\n");

        AppConfig config;
        REQUIRE_FALSE(manager.LoadConfig(file.string(), config));
        REQUIRE(config.window_width == 1000);

        std::error_code ec;
        fs::remove_all(file.parent_path(), ec);
    }
}
