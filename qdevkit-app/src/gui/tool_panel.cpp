// tool_panel.cpp - Base panel implementation
#include "gui/tool_panel.h"
#include "gui/icons.h"
#include "gui/theme.h"
#include <algorithm>
#include <cstring>
#include <spdlog/spdlog.h>

namespace qdevkit::app::gui {

ToolPanel::ToolPanel(const std::string& name, const char* icon)
    : name_(name), icon_(icon) {
}

void ToolPanel::RenderHeader(const char* subtitle) {
    ImGui::PushFont(GetSafeFont(FONT_LARGE));
    ImGui::Text("%s %s", icon_, name_.c_str());
    ImGui::PopFont();

    if (subtitle) {
        ImGui::TextDisabled("%s", subtitle);
    }
    ImGui::Separator();
    ImGui::Spacing();
}

void ToolPanel::RenderStatus() {
    if (status_.empty()) {
        return;
    }

    const Theme& theme = GetTheme();
    switch (status_kind_) {
        case StatusKind::Success:
            ImGui::PushStyleColor(ImGuiCol_Text, theme.GetSuccessColor());
            ImGui::TextWrapped("%s %s", ICON_FA_CIRCLE_CHECK, status_.c_str());
            ImGui::PopStyleColor();
            break;
        case StatusKind::Warning:
            ImGui::PushStyleColor(ImGuiCol_Text, theme.GetWarningColor());
            ImGui::TextWrapped("%s %s", ICON_FA_TRIANGLE_EXCLAMATION, status_.c_str());
            ImGui::PopStyleColor();
            break;
        case StatusKind::Error:
            ImGui::PushStyleColor(ImGuiCol_Text, theme.GetErrorColor());
            ImGui::TextWrapped("%s %s", ICON_FA_CIRCLE_XMARK, status_.c_str());
            ImGui::PopStyleColor();
            break;
        default:
            ImGui::TextDisabled("%s", status_.c_str());
            break;
    }
}

void ToolPanel::SetStatus(const std::string& message, StatusKind kind) {
    status_ = message;
    status_kind_ = kind;

    if (kind == StatusKind::Error) {
        spdlog::warn("{}: {}", name_, message);
    } else if (kind != StatusKind::None) {
        spdlog::info("{}: {}", name_, message);
    }
}

void ToolPanel::ClearStatus() {
    status_.clear();
    status_kind_ = StatusKind::None;
}

void ToolPanel::CopyToClipboard(const std::string& text, const char* what) {
    if (text.empty()) {
        SetStatus(std::string("Nothing to copy"), StatusKind::Warning);
        return;
    }
    ImGui::SetClipboardText(text.c_str());
    SetStatus(std::string(what) + " copied to clipboard", StatusKind::Success);
}

void ToolPanel::RenderReadOnlyText(const char* id, const std::string& text, const ImVec2& size) {
    ImGui::PushFont(GetSafeFont(FONT_MONO));
    // ReadOnly never writes through the pointer
    ImGui::InputTextMultiline(id, const_cast<char*>(text.c_str()), text.size() + 1, size,
                              ImGuiInputTextFlags_ReadOnly);
    ImGui::PopFont();
}

bool ToolPanel::CopyToBuffer(char* buffer, size_t size, const std::string& text) {
    if (size == 0) {
        return false;
    }
    size_t n = std::min(text.size(), size - 1);
    std::memcpy(buffer, text.data(), n);
    buffer[n] = '\0';
    if (n < text.size()) {
        spdlog::warn("Input truncated to {} bytes", n);
        return false;
    }
    return true;
}

} // namespace qdevkit::app::gui
