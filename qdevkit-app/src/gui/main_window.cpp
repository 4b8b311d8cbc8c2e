// main_window.cpp - Main window implementation
#include "gui/main_window.h"
#include "gui/icons.h"
#include "gui/theme.h"
#include "gui/tool_panel.h"
#include "gui/panels/json_formatter_panel.h"
#include "gui/panels/base64_panel.h"
#include "gui/panels/uuid_generator_panel.h"
#include "gui/panels/jwt_decoder_panel.h"
#include "gui/panels/url_encoder_panel.h"
#include "gui/panels/timestamp_converter_panel.h"
#include "gui/panels/hash_generator_panel.h"
#include "gui/panels/json_path_filter_panel.h"
#include "core/config_manager.h"
#include <qdevkit/qdevkit.h>

#include <imgui.h>
#include <spdlog/spdlog.h>

namespace qdevkit::app::gui {

namespace {
constexpr float kSidebarWidth = 200.0f;
constexpr float kStatusBarHeight = 28.0f;
}

const MainWindow::SidebarEntry MainWindow::sidebar_entries_[] = {
    { SidebarItem::JsonFormatter, "json",      ICON_FA_CODE,        "JSON Formatter", "Format, minify and validate JSON" },
    { SidebarItem::Base64,        "base64",    ICON_FA_LOCK,        "Base64",         "Base64 encode and decode" },
    { SidebarItem::Uuid,          "uuid",      ICON_FA_FINGERPRINT, "UUID",           "Generate v4 and v7 UUIDs" },
    { SidebarItem::Jwt,           "jwt",       ICON_FA_ID_CARD,     "JWT Decoder",    "Inspect JWT header and claims" },
    { SidebarItem::Url,           "url",       ICON_FA_LINK,        "URL Encode",     "Percent-encode URL components" },
    { SidebarItem::Timestamp,     "timestamp", ICON_FA_CLOCK,       "Timestamp",      "Unix timestamps and dates" },
    { SidebarItem::Hash,          "hash",      ICON_FA_HASHTAG,     "Hash",           "MD5 and SHA digests" },
    { SidebarItem::JsonPath,      "jsonpath",  ICON_FA_FILTER,      "JSONPath",       "Query JSON with JSONPath" },
    { SidebarItem::Logs,          "logs",      ICON_FA_SCROLL,      "Logs",           "Application log" },
};

MainWindow::MainWindow(core::ConfigManager* config_manager)
    : config_manager_(config_manager) {
    spdlog::info("Creating MainWindow");

    json_formatter_ = std::make_unique<JsonFormatterPanel>();
    base64_ = std::make_unique<Base64Panel>();
    uuid_generator_ = std::make_unique<UuidGeneratorPanel>();
    jwt_decoder_ = std::make_unique<JwtDecoderPanel>();
    url_encoder_ = std::make_unique<UrlEncoderPanel>();
    timestamp_converter_ = std::make_unique<TimestampConverterPanel>();
    hash_generator_ = std::make_unique<HashGeneratorPanel>();
    json_path_filter_ = std::make_unique<JsonPathFilterPanel>();

    ApplyConfig();
}

MainWindow::~MainWindow() = default;

void MainWindow::ApplyConfig() {
    if (!config_manager_) {
        return;
    }

    const core::AppConfig& config = config_manager_->GetConfig();
    json_formatter_->ApplyConfig(config);
    uuid_generator_->ApplyConfig(config);
    timestamp_converter_->ApplyConfig(config);
    hash_generator_->ApplyConfig(config);
    json_path_filter_->ApplyConfig(config);
}

bool MainWindow::SaveSettings() {
    if (!config_manager_) {
        settings_status_ = "No configuration file";
        return false;
    }

    core::AppConfig config = config_manager_->GetConfig();
    json_formatter_->StoreConfig(config);
    uuid_generator_->StoreConfig(config);
    timestamp_converter_->StoreConfig(config);
    hash_generator_->StoreConfig(config);
    json_path_filter_->StoreConfig(config);
    config.theme = Theme::GetPresetKey(GetTheme().GetCurrentPreset());

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    config.window_width = static_cast<int>(viewport->Size.x);
    config.window_height = static_cast<int>(viewport->Size.y);

    config_manager_->SetConfig(config);
    if (!config_manager_->Save()) {
        settings_status_ = "Failed to save settings";
        return false;
    }

    settings_status_ = "Settings saved";
    spdlog::info("Settings saved to {}", config_manager_->GetConfigPath());
    return true;
}

bool MainWindow::SelectTool(const std::string& name) {
    for (const auto& entry : sidebar_entries_) {
        if (name == entry.key) {
            selected_item_ = entry.item;
            return true;
        }
    }
    return false;
}

ToolPanel* MainWindow::CurrentPanel() const {
    switch (selected_item_) {
        case SidebarItem::JsonFormatter: return json_formatter_.get();
        case SidebarItem::Base64:        return base64_.get();
        case SidebarItem::Uuid:          return uuid_generator_.get();
        case SidebarItem::Jwt:           return jwt_decoder_.get();
        case SidebarItem::Url:           return url_encoder_.get();
        case SidebarItem::Timestamp:     return timestamp_converter_.get();
        case SidebarItem::Hash:          return hash_generator_.get();
        case SidebarItem::JsonPath:      return json_path_filter_.get();
        default:                         return nullptr;
    }
}

void MainWindow::Render() {
    RenderSidebar();
    RenderCurrentPanel();
    RenderStatusBar();
}

void MainWindow::RenderSidebar() {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    Theme& theme = GetTheme();

    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(ImVec2(kSidebarWidth, viewport->WorkSize.y - kStatusBarHeight));

    ImGuiWindowFlags flags = ImGuiWindowFlags_NoTitleBar |
                             ImGuiWindowFlags_NoResize |
                             ImGuiWindowFlags_NoMove |
                             ImGuiWindowFlags_NoCollapse |
                             ImGuiWindowFlags_NoSavedSettings;

    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(8.0f, 8.0f));
    ImGui::PushStyleColor(ImGuiCol_WindowBg, theme.GetSidebarColor());

    if (ImGui::Begin("##Sidebar", nullptr, flags)) {
        // Header
        ImGui::PushFont(GetSafeFont(FONT_LARGE));
        ImGui::TextColored(theme.GetAccentColor(), ICON_FA_TOOLBOX);
        ImGui::SameLine();
        ImGui::Text("QDevKit");
        ImGui::PopFont();
        ImGui::TextDisabled("DEVELOPER TOOLS");

        ImGui::Separator();
        ImGui::Spacing();

        ImVec4 accent = theme.GetAccentColor();
        ImVec4 accent_hover(accent.x + 0.05f, accent.y + 0.05f, accent.z + 0.05f, 1.0f);

        for (const auto& entry : sidebar_entries_) {
            bool selected = (selected_item_ == entry.item);

            if (selected) {
                ImGui::PushStyleColor(ImGuiCol_Button, accent);
                ImGui::PushStyleColor(ImGuiCol_ButtonHovered, accent_hover);
            } else {
                ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0.0f, 0.0f, 0.0f, 0.0f));
                ImGui::PushStyleColor(ImGuiCol_ButtonHovered, ImGui::GetStyleColorVec4(ImGuiCol_FrameBgHovered));
            }

            // Full-width button
            ImGui::PushStyleVar(ImGuiStyleVar_ButtonTextAlign, ImVec2(0.0f, 0.5f));
            std::string label = std::string(entry.icon) + "  " + entry.label;

            if (ImGui::Button(label.c_str(), ImVec2(kSidebarWidth - 16.0f, 32.0f))) {
                selected_item_ = entry.item;
            }

            ImGui::PopStyleVar();
            ImGui::PopStyleColor(2);

            if (ImGui::IsItemHovered()) {
                ImGui::SetTooltip("%s", entry.tooltip);
            }
        }

        // Bottom section
        ImGui::SetCursorPosY(ImGui::GetWindowHeight() - 100.0f);
        ImGui::Separator();

        ImGui::Text(ICON_FA_PALETTE " Theme");
        ImGui::SetNextItemWidth(-1);
        if (theme.RenderThemeSelector()) {
            spdlog::info("Theme changed to {}", Theme::GetPresetName(theme.GetCurrentPreset()));
        }

        if (ImGui::Button(ICON_FA_FLOPPY_DISK " Save settings", ImVec2(-1, 0))) {
            SaveSettings();
        }
        if (!settings_status_.empty()) {
            ImGui::TextDisabled("%s", settings_status_.c_str());
        }
    }
    ImGui::End();

    ImGui::PopStyleColor();
    ImGui::PopStyleVar();
}

void MainWindow::RenderCurrentPanel() {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();

    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x + kSidebarWidth, viewport->WorkPos.y));
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x - kSidebarWidth,
                                    viewport->WorkSize.y - kStatusBarHeight));

    ImGuiWindowFlags flags = ImGuiWindowFlags_NoTitleBar |
                             ImGuiWindowFlags_NoResize |
                             ImGuiWindowFlags_NoMove |
                             ImGuiWindowFlags_NoCollapse |
                             ImGuiWindowFlags_NoSavedSettings;

    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(16.0f, 16.0f));

    if (ImGui::Begin("##MainContent", nullptr, flags)) {
        if (selected_item_ == SidebarItem::Logs) {
            console_.Render();
        } else if (ToolPanel* panel = CurrentPanel()) {
            panel->Render();
        } else {
            ImGui::Text("Select a tool from the sidebar");
        }
    }
    ImGui::End();

    ImGui::PopStyleVar();
}

void MainWindow::RenderStatusBar() {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    Theme& theme = GetTheme();

    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x,
                                   viewport->WorkPos.y + viewport->WorkSize.y - kStatusBarHeight));
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, kStatusBarHeight));

    ImGuiWindowFlags flags = ImGuiWindowFlags_NoTitleBar |
                             ImGuiWindowFlags_NoResize |
                             ImGuiWindowFlags_NoMove |
                             ImGuiWindowFlags_NoScrollbar |
                             ImGuiWindowFlags_NoSavedSettings;

    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(8.0f, 4.0f));
    ImGui::PushStyleColor(ImGuiCol_WindowBg, theme.GetStatusBarColor());

    if (ImGui::Begin("##StatusBar", nullptr, flags)) {
        // Left side - last outcome of the current tool
        ToolPanel* panel = CurrentPanel();
        if (panel && panel->GetStatusKind() != StatusKind::None) {
            switch (panel->GetStatusKind()) {
                case StatusKind::Success:
                    ImGui::TextColored(theme.GetSuccessColor(), ICON_FA_CIRCLE_CHECK);
                    break;
                case StatusKind::Warning:
                    ImGui::TextColored(theme.GetWarningColor(), ICON_FA_TRIANGLE_EXCLAMATION);
                    break;
                default:
                    ImGui::TextColored(theme.GetErrorColor(), ICON_FA_CIRCLE_XMARK);
                    break;
            }
            ImGui::SameLine();
            ImGui::TextUnformatted(panel->GetStatus().c_str());
        } else {
            ImGui::Text("%s Ready", ICON_FA_CIRCLE_CHECK);
        }

        // Right side - Version
        ImGui::SameLine(ImGui::GetWindowWidth() - 130);
        ImGui::TextDisabled("QDevKit v%s", qdevkit::GetVersionString());
    }
    ImGui::End();

    ImGui::PopStyleColor();
    ImGui::PopStyleVar();
}

} // namespace qdevkit::app::gui
