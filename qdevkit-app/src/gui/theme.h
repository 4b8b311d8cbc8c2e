// theme.h - Color presets for the QDevKit window
#pragma once

#include <imgui.h>
#include <optional>
#include <string>
#include <vector>

namespace qdevkit::app::gui {

/**
 * Available theme presets
 */
enum class ThemePreset {
    QDevKitDark,     // Default dark theme
    QDevKitLight,    // Light variant
    HighContrast,    // High contrast for accessibility
    COUNT
};

/**
 * Style metrics applied on top of a preset's colors
 */
struct ThemeConfig {
    float window_rounding = 6.0f;
    float frame_rounding = 4.0f;
    float popup_rounding = 6.0f;
    float scrollbar_rounding = 6.0f;
    float grab_rounding = 4.0f;
    float tab_rounding = 4.0f;

    float window_border_size = 1.0f;
    float frame_border_size = 0.0f;
    float popup_border_size = 1.0f;

    ImVec2 window_padding = ImVec2(8.0f, 8.0f);
    ImVec2 frame_padding = ImVec2(6.0f, 4.0f);
    ImVec2 item_spacing = ImVec2(8.0f, 6.0f);
    ImVec2 item_inner_spacing = ImVec2(4.0f, 4.0f);

    float scrollbar_size = 14.0f;
    float grab_min_size = 12.0f;
    float indent_spacing = 20.0f;
};

class Theme {
public:
    Theme() = default;

    void ApplyPreset(ThemePreset preset);
    ThemePreset GetCurrentPreset() const { return current_preset_; }

    static const char* GetPresetName(ThemePreset preset);
    static std::vector<ThemePreset> GetAvailablePresets();

    // Config file keys: "dark", "light", "high_contrast"
    static const char* GetPresetKey(ThemePreset preset);
    static std::optional<ThemePreset> ParsePresetKey(const std::string& key);

    void ApplyConfig(const ThemeConfig& config);
    const ThemeConfig& GetConfig() const { return config_; }

    // Combo box; returns true if the theme changed
    bool RenderThemeSelector();

    // Colors the panels use for status lines
    ImVec4 GetSuccessColor() const { return success_color_; }
    ImVec4 GetErrorColor() const { return error_color_; }
    ImVec4 GetWarningColor() const { return warning_color_; }
    ImVec4 GetSidebarColor() const { return sidebar_color_; }
    ImVec4 GetStatusBarColor() const { return status_bar_color_; }
    ImVec4 GetAccentColor() const { return accent_color_; }

private:
    struct Palette {
        ImVec4 bg_dark;
        ImVec4 bg_medium;
        ImVec4 bg_light;
        ImVec4 border;
        ImVec4 text;
        ImVec4 text_dim;
        ImVec4 accent;
        ImVec4 accent_hover;
        ImVec4 accent_active;
        ImVec4 success;
        ImVec4 warning;
        ImVec4 error;
        float button_alpha;
        bool light;
    };

    static Palette DarkPalette();
    static Palette LightPalette();
    static Palette HighContrastPalette();

    void ApplyPalette(const Palette& palette);
    void ApplyStyleConfig();

    ThemePreset current_preset_ = ThemePreset::QDevKitDark;
    ThemeConfig config_;

    ImVec4 accent_color_ = ImVec4(0.20f, 0.55f, 0.85f, 1.0f);
    ImVec4 success_color_ = ImVec4(0.30f, 0.80f, 0.30f, 1.0f);
    ImVec4 error_color_ = ImVec4(1.0f, 0.40f, 0.40f, 1.0f);
    ImVec4 warning_color_ = ImVec4(0.90f, 0.70f, 0.20f, 1.0f);
    ImVec4 sidebar_color_ = ImVec4(0.10f, 0.10f, 0.12f, 1.0f);
    ImVec4 status_bar_color_ = ImVec4(0.08f, 0.08f, 0.10f, 1.0f);
};

// Global theme instance
Theme& GetTheme();

} // namespace qdevkit::app::gui
