// main.cpp - Entry point for qdevkit

#ifdef _WIN32
#define NOMINMAX
#define WIN32_LEAN_AND_MEAN
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include "core/config_manager.h"
#include "gui/application.h"
#include <qdevkit/qdevkit.h>

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  --config=PATH    Configuration file (default: config/qdevkit.yaml)\n"
              << "  --tool=NAME      Tool to open at startup: json, base64, uuid, jwt,\n"
              << "                   url, timestamp, hash, jsonpath, logs\n"
              << "  --verbose        Debug logging\n"
              << "  --version        Print version and exit\n"
              << "  --help           Show this help message\n"
              << std::endl;
}

struct LaunchOptions {
    std::string config_path;
    std::string tool;
    bool verbose = false;
};

LaunchOptions ParseArgs(int argc, char** argv) {
    LaunchOptions options;

    for (int i = 1; i < argc; ++i) {
        if (std::strncmp(argv[i], "--config=", 9) == 0) {
            options.config_path = argv[i] + 9;
        } else if (std::strncmp(argv[i], "--tool=", 7) == 0) {
            options.tool = argv[i] + 7;
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            options.verbose = true;
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "qdevkit " << qdevkit::GetVersionString() << std::endl;
            std::exit(0);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            std::exit(0);
        } else {
            spdlog::warn("Ignoring unknown option '{}'", argv[i]);
        }
    }

    return options;
}

// Level and optional log file from the config; --verbose wins over the level
void SetupLogging(const qdevkit::app::core::AppConfig& config, bool verbose) {
    spdlog::level::level_enum level = verbose ? spdlog::level::debug
                                              : spdlog::level::from_str(config.log_level);
    spdlog::set_level(level);

    if (config.log_file.empty()) {
        return;
    }

    try {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file);
        spdlog::default_logger()->sinks().push_back(file_sink);
        spdlog::info("Logging to {}", config.log_file);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Cannot open log file {}: {}", config.log_file, e.what());
    }
}

int main(int argc, char** argv) {
    LaunchOptions options = ParseArgs(argc, argv);
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    spdlog::info("QDevKit v{}", qdevkit::GetVersionString());

    qdevkit::app::core::ConfigManager config_manager;
    std::string config_path = options.config_path.empty()
        ? qdevkit::app::core::ConfigManager::FindConfigFile()
        : options.config_path;

    if (!config_manager.Load(config_path)) {
        spdlog::warn("Using default settings");
    }

    SetupLogging(config_manager.GetConfig(), options.verbose);

    qdevkit::app::gui::Application app(&config_manager, options.tool);
    return app.Run();
}
