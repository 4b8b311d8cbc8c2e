// main_window.h - Main window with sidebar navigation
#pragma once

#include "gui/console.h"
#include <memory>
#include <string>

namespace qdevkit::app::core {
    class ConfigManager;
}

namespace qdevkit::app::gui {

class ToolPanel;
class JsonFormatterPanel;
class Base64Panel;
class UuidGeneratorPanel;
class JwtDecoderPanel;
class UrlEncoderPanel;
class TimestampConverterPanel;
class HashGeneratorPanel;
class JsonPathFilterPanel;

class MainWindow {
public:
    explicit MainWindow(core::ConfigManager* config_manager = nullptr);
    ~MainWindow();

    void Render();

    // Select a tool by short name (json, base64, uuid, jwt, url, timestamp,
    // hash, jsonpath, logs). Returns false for unknown names.
    bool SelectTool(const std::string& name);

    // Push config values into every panel
    void ApplyConfig();

    // Collect panel and theme settings and write them to the config file
    bool SaveSettings();

    Console& GetConsole() { return console_; }

private:
    void RenderSidebar();
    void RenderStatusBar();
    void RenderCurrentPanel();

    enum class SidebarItem {
        JsonFormatter = 0,
        Base64,
        Uuid,
        Jwt,
        Url,
        Timestamp,
        Hash,
        JsonPath,
        Logs,
        COUNT
    };

    struct SidebarEntry {
        SidebarItem item;
        const char* key;
        const char* icon;
        const char* label;
        const char* tooltip;
    };

    static const SidebarEntry sidebar_entries_[];

    // Panel for the selected item, nullptr for the Logs view
    ToolPanel* CurrentPanel() const;

    // Panels
    std::unique_ptr<JsonFormatterPanel> json_formatter_;
    std::unique_ptr<Base64Panel> base64_;
    std::unique_ptr<UuidGeneratorPanel> uuid_generator_;
    std::unique_ptr<JwtDecoderPanel> jwt_decoder_;
    std::unique_ptr<UrlEncoderPanel> url_encoder_;
    std::unique_ptr<TimestampConverterPanel> timestamp_converter_;
    std::unique_ptr<HashGeneratorPanel> hash_generator_;
    std::unique_ptr<JsonPathFilterPanel> json_path_filter_;
    Console console_;

    // State
    SidebarItem selected_item_ = SidebarItem::JsonFormatter;
    std::string settings_status_;

    core::ConfigManager* config_manager_ = nullptr;
};

} // namespace qdevkit::app::gui
