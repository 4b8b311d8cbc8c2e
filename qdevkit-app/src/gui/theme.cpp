// theme.cpp - Theme presets
#include "gui/theme.h"

namespace qdevkit::app::gui {

static Theme g_theme;

Theme& GetTheme() {
    return g_theme;
}

const char* Theme::GetPresetName(ThemePreset preset) {
    switch (preset) {
        case ThemePreset::QDevKitDark:   return "QDevKit Dark";
        case ThemePreset::QDevKitLight:  return "QDevKit Light";
        case ThemePreset::HighContrast:  return "High Contrast";
        default:                         return "Unknown";
    }
}

const char* Theme::GetPresetKey(ThemePreset preset) {
    switch (preset) {
        case ThemePreset::QDevKitLight:  return "light";
        case ThemePreset::HighContrast:  return "high_contrast";
        default:                         return "dark";
    }
}

std::optional<ThemePreset> Theme::ParsePresetKey(const std::string& key) {
    if (key == "dark") return ThemePreset::QDevKitDark;
    if (key == "light") return ThemePreset::QDevKitLight;
    if (key == "high_contrast") return ThemePreset::HighContrast;
    return std::nullopt;
}

std::vector<ThemePreset> Theme::GetAvailablePresets() {
    return {
        ThemePreset::QDevKitDark,
        ThemePreset::QDevKitLight,
        ThemePreset::HighContrast
    };
}

void Theme::ApplyPreset(ThemePreset preset) {
    current_preset_ = preset;

    switch (preset) {
        case ThemePreset::QDevKitLight:  ApplyPalette(LightPalette()); break;
        case ThemePreset::HighContrast:  ApplyPalette(HighContrastPalette()); break;
        default:                         ApplyPalette(DarkPalette()); break;
    }

    ApplyStyleConfig();
}

void Theme::ApplyConfig(const ThemeConfig& config) {
    config_ = config;
    ApplyStyleConfig();
}

void Theme::ApplyStyleConfig() {
    ImGuiStyle& style = ImGui::GetStyle();

    style.WindowRounding = config_.window_rounding;
    style.FrameRounding = config_.frame_rounding;
    style.PopupRounding = config_.popup_rounding;
    style.ScrollbarRounding = config_.scrollbar_rounding;
    style.GrabRounding = config_.grab_rounding;
    style.TabRounding = config_.tab_rounding;

    style.WindowBorderSize = config_.window_border_size;
    style.FrameBorderSize = config_.frame_border_size;
    style.PopupBorderSize = config_.popup_border_size;

    style.WindowPadding = config_.window_padding;
    style.FramePadding = config_.frame_padding;
    style.ItemSpacing = config_.item_spacing;
    style.ItemInnerSpacing = config_.item_inner_spacing;

    style.ScrollbarSize = config_.scrollbar_size;
    style.GrabMinSize = config_.grab_min_size;
    style.IndentSpacing = config_.indent_spacing;
}

bool Theme::RenderThemeSelector() {
    bool changed = false;

    if (ImGui::BeginCombo("##Theme", GetPresetName(current_preset_))) {
        for (auto preset : GetAvailablePresets()) {
            bool is_selected = (current_preset_ == preset);
            if (ImGui::Selectable(GetPresetName(preset), is_selected)) {
                ApplyPreset(preset);
                changed = true;
            }
            if (is_selected) {
                ImGui::SetItemDefaultFocus();
            }
        }
        ImGui::EndCombo();
    }

    return changed;
}

// ============================================================================
// Palettes
// ============================================================================

Theme::Palette Theme::DarkPalette() {
    Palette p;
    p.bg_dark       = ImVec4(0.08f, 0.08f, 0.10f, 1.00f);
    p.bg_medium     = ImVec4(0.12f, 0.12f, 0.15f, 1.00f);
    p.bg_light      = ImVec4(0.16f, 0.16f, 0.20f, 1.00f);
    p.border        = ImVec4(0.25f, 0.25f, 0.30f, 1.00f);
    p.text          = ImVec4(0.92f, 0.92f, 0.94f, 1.00f);
    p.text_dim      = ImVec4(0.60f, 0.60f, 0.65f, 1.00f);
    p.accent        = ImVec4(0.20f, 0.55f, 0.85f, 1.00f);
    p.accent_hover  = ImVec4(0.30f, 0.65f, 0.95f, 1.00f);
    p.accent_active = ImVec4(0.15f, 0.45f, 0.75f, 1.00f);
    p.success       = ImVec4(0.30f, 0.80f, 0.30f, 1.00f);
    p.warning       = ImVec4(0.90f, 0.70f, 0.20f, 1.00f);
    p.error         = ImVec4(1.00f, 0.40f, 0.40f, 1.00f);
    p.button_alpha  = 0.65f;
    p.light         = false;
    return p;
}

Theme::Palette Theme::LightPalette() {
    Palette p;
    p.bg_dark       = ImVec4(0.88f, 0.88f, 0.90f, 1.00f);
    p.bg_medium     = ImVec4(0.92f, 0.92f, 0.94f, 1.00f);
    p.bg_light      = ImVec4(0.96f, 0.96f, 0.97f, 1.00f);
    p.border        = ImVec4(0.75f, 0.75f, 0.78f, 1.00f);
    p.text          = ImVec4(0.10f, 0.10f, 0.12f, 1.00f);
    p.text_dim      = ImVec4(0.45f, 0.45f, 0.48f, 1.00f);
    p.accent        = ImVec4(0.20f, 0.50f, 0.80f, 1.00f);
    p.accent_hover  = ImVec4(0.25f, 0.55f, 0.85f, 1.00f);
    p.accent_active = ImVec4(0.15f, 0.40f, 0.70f, 1.00f);
    p.success       = ImVec4(0.10f, 0.55f, 0.20f, 1.00f);
    p.warning       = ImVec4(0.70f, 0.45f, 0.00f, 1.00f);
    p.error         = ImVec4(0.80f, 0.15f, 0.15f, 1.00f);
    p.button_alpha  = 1.00f;
    p.light         = true;
    return p;
}

Theme::Palette Theme::HighContrastPalette() {
    Palette p;
    p.bg_dark       = ImVec4(0.00f, 0.00f, 0.00f, 1.00f);
    p.bg_medium     = ImVec4(0.02f, 0.02f, 0.02f, 1.00f);
    p.bg_light      = ImVec4(0.10f, 0.10f, 0.10f, 1.00f);
    p.border        = ImVec4(1.00f, 1.00f, 1.00f, 1.00f);
    p.text          = ImVec4(1.00f, 1.00f, 1.00f, 1.00f);
    p.text_dim      = ImVec4(0.75f, 0.75f, 0.75f, 1.00f);
    p.accent        = ImVec4(1.00f, 0.85f, 0.00f, 1.00f);
    p.accent_hover  = ImVec4(1.00f, 0.95f, 0.30f, 1.00f);
    p.accent_active = ImVec4(0.85f, 0.70f, 0.00f, 1.00f);
    p.success       = ImVec4(0.00f, 1.00f, 0.00f, 1.00f);
    p.warning       = ImVec4(1.00f, 0.85f, 0.00f, 1.00f);
    p.error         = ImVec4(1.00f, 0.20f, 0.20f, 1.00f);
    p.button_alpha  = 0.45f;
    p.light         = false;
    return p;
}

void Theme::ApplyPalette(const Palette& p) {
    ImGuiStyle& style = ImGui::GetStyle();
    ImVec4* colors = style.Colors;

    auto with_alpha = [](const ImVec4& c, float a) { return ImVec4(c.x, c.y, c.z, a); };
    // Step toward the contrasting end: lighter on dark themes, darker on light ones
    float step = p.light ? -0.05f : 0.05f;
    auto shade = [step](const ImVec4& c, float n) {
        return ImVec4(c.x + step * n, c.y + step * n, c.z + step * n, c.w);
    };

    colors[ImGuiCol_Text]                   = p.text;
    colors[ImGuiCol_TextDisabled]           = p.text_dim;

    colors[ImGuiCol_WindowBg]               = p.bg_medium;
    colors[ImGuiCol_ChildBg]                = ImVec4(0.00f, 0.00f, 0.00f, 0.00f);
    colors[ImGuiCol_PopupBg]                = with_alpha(p.bg_dark, 0.98f);

    colors[ImGuiCol_Border]                 = p.border;
    colors[ImGuiCol_BorderShadow]           = ImVec4(0.00f, 0.00f, 0.00f, 0.00f);

    colors[ImGuiCol_FrameBg]                = p.bg_light;
    colors[ImGuiCol_FrameBgHovered]         = shade(p.bg_light, 1.0f);
    colors[ImGuiCol_FrameBgActive]          = shade(p.bg_light, 2.0f);

    colors[ImGuiCol_TitleBg]                = p.bg_dark;
    colors[ImGuiCol_TitleBgActive]          = p.bg_medium;
    colors[ImGuiCol_TitleBgCollapsed]       = with_alpha(p.bg_dark, 0.75f);
    colors[ImGuiCol_MenuBarBg]              = p.bg_dark;

    colors[ImGuiCol_ScrollbarBg]            = p.bg_dark;
    colors[ImGuiCol_ScrollbarGrab]          = shade(p.bg_light, 3.0f);
    colors[ImGuiCol_ScrollbarGrabHovered]   = shade(p.bg_light, 5.0f);
    colors[ImGuiCol_ScrollbarGrabActive]    = shade(p.bg_light, 7.0f);

    colors[ImGuiCol_CheckMark]              = p.accent;
    colors[ImGuiCol_SliderGrab]             = p.accent;
    colors[ImGuiCol_SliderGrabActive]       = p.accent_active;

    colors[ImGuiCol_Button]                 = with_alpha(p.accent, p.button_alpha);
    colors[ImGuiCol_ButtonHovered]          = p.accent_hover;
    colors[ImGuiCol_ButtonActive]           = p.accent_active;

    colors[ImGuiCol_Header]                 = with_alpha(p.accent, 0.30f);
    colors[ImGuiCol_HeaderHovered]          = with_alpha(p.accent, 0.50f);
    colors[ImGuiCol_HeaderActive]           = with_alpha(p.accent, 0.70f);

    colors[ImGuiCol_Separator]              = p.border;
    colors[ImGuiCol_SeparatorHovered]       = p.accent;
    colors[ImGuiCol_SeparatorActive]        = p.accent_active;

    colors[ImGuiCol_ResizeGrip]             = with_alpha(p.accent, 0.20f);
    colors[ImGuiCol_ResizeGripHovered]      = with_alpha(p.accent, 0.60f);
    colors[ImGuiCol_ResizeGripActive]       = p.accent;

    colors[ImGuiCol_Tab]                    = p.bg_light;
    colors[ImGuiCol_TabHovered]             = with_alpha(p.accent, 0.70f);
    colors[ImGuiCol_TabActive]              = with_alpha(p.accent, 0.90f);
    colors[ImGuiCol_TabUnfocused]           = p.bg_light;
    colors[ImGuiCol_TabUnfocusedActive]     = with_alpha(p.accent, 0.50f);

    colors[ImGuiCol_TableHeaderBg]          = p.bg_light;
    colors[ImGuiCol_TableBorderStrong]      = p.border;
    colors[ImGuiCol_TableBorderLight]       = with_alpha(p.border, 0.50f);
    colors[ImGuiCol_TableRowBg]             = ImVec4(0.00f, 0.00f, 0.00f, 0.00f);
    colors[ImGuiCol_TableRowBgAlt]          = p.light ? ImVec4(0.00f, 0.00f, 0.00f, 0.03f)
                                                      : ImVec4(1.00f, 1.00f, 1.00f, 0.03f);

    colors[ImGuiCol_TextSelectedBg]         = with_alpha(p.accent, 0.35f);
    colors[ImGuiCol_NavHighlight]           = p.accent;
    colors[ImGuiCol_ModalWindowDimBg]       = ImVec4(0.00f, 0.00f, 0.00f, 0.60f);

    accent_color_ = p.accent;
    success_color_ = p.success;
    warning_color_ = p.warning;
    error_color_ = p.error;
    sidebar_color_ = p.light ? shade(p.bg_dark, 1.0f) : shade(p.bg_dark, 0.4f);
    status_bar_color_ = p.bg_dark;
}

} // namespace qdevkit::app::gui
