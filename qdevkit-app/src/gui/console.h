// console.h - In-app log viewer fed by spdlog
#pragma once

#include <chrono>
#include <deque>
#include <string>

struct ImVec4;

namespace qdevkit::app::gui {

class Console {
public:
    enum class LogLevel {
        Debug,
        Info,
        Warning,
        Error
    };

    struct LogEntry {
        std::string message;
        LogLevel level;
        float timestamp;    // Seconds since the console was created
    };

    static constexpr size_t kMaxEntries = 1000;

    Console();
    ~Console() = default;

    // Draws into the current window (the main content area)
    void Render();

    void AddLog(const std::string& message, LogLevel level = LogLevel::Info);
    void AddDebug(const std::string& message) { AddLog(message, LogLevel::Debug); }
    void AddInfo(const std::string& message) { AddLog(message, LogLevel::Info); }
    void AddWarning(const std::string& message) { AddLog(message, LogLevel::Warning); }
    void AddError(const std::string& message) { AddLog(message, LogLevel::Error); }
    void Clear();

    const std::deque<LogEntry>& GetEntries() const { return items_; }
    size_t CountLevel(LogLevel level) const;

private:
    void RenderLogTab(const char* id, const LogLevel* filter);
    std::string BuildText(const LogLevel* filter) const;
    const char* GetLevelPrefix(LogLevel level) const;
    ImVec4 GetLevelColor(LogLevel level) const;

    std::deque<LogEntry> items_;
    std::chrono::steady_clock::time_point start_time_;
    bool scroll_to_bottom_ = false;
    bool auto_scroll_ = true;
    int selected_tab_ = 0;
};

} // namespace qdevkit::app::gui
