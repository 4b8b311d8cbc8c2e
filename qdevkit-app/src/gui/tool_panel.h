// tool_panel.h - Base class for the tool panels shown in the content area
#pragma once

#include <cstddef>
#include <string>
#include <imgui.h>

namespace qdevkit::app::core {
    struct AppConfig;
}

namespace qdevkit::app::gui {

// Safe font access helper - returns default font if index out of range
inline ImFont* GetSafeFont(int index) {
    ImGuiIO& io = ImGui::GetIO();
    if (index >= 0 && index < io.Fonts->Fonts.Size) {
        return io.Fonts->Fonts[index];
    }
    return io.Fonts->Fonts[0];
}

// Font indices
constexpr int FONT_REGULAR = 0;
constexpr int FONT_MONO = 1;
constexpr int FONT_LARGE = 2;

enum class StatusKind {
    None,
    Success,
    Warning,
    Error
};

class ToolPanel {
public:
    ToolPanel(const std::string& name, const char* icon);
    virtual ~ToolPanel() = default;

    virtual void Render() = 0;

    // Read defaults from / write current selections back to the config
    virtual void ApplyConfig(const core::AppConfig& config) { (void)config; }
    virtual void StoreConfig(core::AppConfig& config) const { (void)config; }

    const std::string& GetName() const { return name_; }
    const char* GetIcon() const { return icon_; }

    // Last outcome, mirrored in the status bar
    const std::string& GetStatus() const { return status_; }
    StatusKind GetStatusKind() const { return status_kind_; }

protected:
    // Large-font title row followed by a separator
    void RenderHeader(const char* subtitle = nullptr);

    // Colored outcome line (error text wraps)
    void RenderStatus();

    void SetStatus(const std::string& message, StatusKind kind);
    void SetError(const std::string& message) { SetStatus(message, StatusKind::Error); }
    void ClearStatus();

    void CopyToClipboard(const std::string& text, const char* what);

    // Monospace read-only multiline box; selectable so users can copy parts
    static void RenderReadOnlyText(const char* id, const std::string& text, const ImVec2& size);

    // Copy text into a fixed ImGui buffer; returns false if it had to be truncated
    static bool CopyToBuffer(char* buffer, size_t size, const std::string& text);

    std::string name_;
    const char* icon_;
    std::string status_;
    StatusKind status_kind_ = StatusKind::None;
};

} // namespace qdevkit::app::gui
