// console.cpp - In-app log viewer
#include "gui/console.h"
#include "gui/icons.h"
#include "gui/tool_panel.h"
#include <imgui.h>
#include <algorithm>
#include <cstdio>

namespace qdevkit::app::gui {

Console::Console()
    : start_time_(std::chrono::steady_clock::now()) {
}

void Console::Render() {
    ImGui::PushFont(GetSafeFont(FONT_LARGE));
    ImGui::Text("%s Logs", ICON_FA_SCROLL);
    ImGui::PopFont();
    ImGui::Separator();
    ImGui::Spacing();

    // Toolbar
    if (ImGui::Button(ICON_FA_TRASH " Clear")) {
        Clear();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_COPY " Copy")) {
        static const LogLevel kTabFilters[] = { LogLevel::Info, LogLevel::Warning, LogLevel::Error };
        const LogLevel* filter = selected_tab_ > 0 ? &kTabFilters[selected_tab_ - 1] : nullptr;
        ImGui::SetClipboardText(BuildText(filter).c_str());
    }
    ImGui::SameLine();
    ImGui::Checkbox("Auto-scroll", &auto_scroll_);
    ImGui::SameLine();
    ImGui::TextDisabled("| %zu info, %zu warn, %zu error",
                        CountLevel(LogLevel::Info), CountLevel(LogLevel::Warning),
                        CountLevel(LogLevel::Error));

    ImGui::Separator();

    if (ImGui::BeginTabBar("ConsoleTabs", ImGuiTabBarFlags_None)) {
        static const LogLevel info = LogLevel::Info;
        static const LogLevel warning = LogLevel::Warning;
        static const LogLevel error = LogLevel::Error;

        if (ImGui::BeginTabItem("All")) {
            selected_tab_ = 0;
            RenderLogTab("AllLogsRegion", nullptr);
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Info")) {
            selected_tab_ = 1;
            RenderLogTab("InfoLogsRegion", &info);
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Warnings")) {
            selected_tab_ = 2;
            RenderLogTab("WarningLogsRegion", &warning);
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Errors")) {
            selected_tab_ = 3;
            RenderLogTab("ErrorLogsRegion", &error);
            ImGui::EndTabItem();
        }
        ImGui::EndTabBar();
    }
}

void Console::RenderLogTab(const char* id, const LogLevel* filter) {
    ImGui::BeginChild(id, ImVec2(0, 0), true, ImGuiWindowFlags_HorizontalScrollbar);
    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing, ImVec2(4, 1));

    int count = 0;
    for (const auto& entry : items_) {
        if (filter && entry.level != *filter) {
            continue;
        }

        ImGui::PushStyleColor(ImGuiCol_Text, GetLevelColor(entry.level));
        if (filter) {
            ImGui::Text("[%.2fs] %s", entry.timestamp, entry.message.c_str());
        } else {
            ImGui::Text("[%.2fs] %s %s", entry.timestamp, GetLevelPrefix(entry.level),
                        entry.message.c_str());
        }
        ImGui::PopStyleColor();
        count++;
    }

    if (count == 0) {
        ImGui::TextDisabled("No messages");
    }

    if (auto_scroll_ && (scroll_to_bottom_ || ImGui::GetScrollY() >= ImGui::GetScrollMaxY())) {
        ImGui::SetScrollHereY(1.0f);
    }
    scroll_to_bottom_ = false;

    ImGui::PopStyleVar();
    ImGui::PopFont();
    ImGui::EndChild();
}

void Console::AddLog(const std::string& message, LogLevel level) {
    LogEntry entry;
    entry.message = message;
    entry.level = level;
    entry.timestamp = std::chrono::duration<float>(std::chrono::steady_clock::now() - start_time_).count();
    items_.push_back(std::move(entry));
    scroll_to_bottom_ = true;

    while (items_.size() > kMaxEntries) {
        items_.pop_front();
    }
}

void Console::Clear() {
    items_.clear();
}

size_t Console::CountLevel(LogLevel level) const {
    return static_cast<size_t>(std::count_if(items_.begin(), items_.end(),
        [level](const LogEntry& e) { return e.level == level; }));
}

std::string Console::BuildText(const LogLevel* filter) const {
    std::string text;
    char stamp[32];
    for (const auto& entry : items_) {
        if (filter && entry.level != *filter) continue;
        std::snprintf(stamp, sizeof(stamp), "[%.2fs] ", entry.timestamp);
        text += stamp;
        text += GetLevelPrefix(entry.level);
        text += ' ';
        text += entry.message;
        text += '\n';
    }
    return text;
}

const char* Console::GetLevelPrefix(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:   return "[DEBUG]";
        case LogLevel::Info:    return "[INFO]";
        case LogLevel::Warning: return "[WARN]";
        case LogLevel::Error:   return "[ERROR]";
        default:                return "[???]";
    }
}

ImVec4 Console::GetLevelColor(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:   return ImVec4(0.6f, 0.6f, 1.0f, 1.0f);
        case LogLevel::Warning: return ImVec4(1.0f, 0.8f, 0.0f, 1.0f);
        case LogLevel::Error:   return ImVec4(1.0f, 0.3f, 0.3f, 1.0f);
        default:                return ImGui::GetStyleColorVec4(ImGuiCol_Text);
    }
}

} // namespace qdevkit::app::gui
