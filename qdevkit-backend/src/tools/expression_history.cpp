#include <qdevkit/expression_history.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace qdevkit {

using json = nlohmann::json;

namespace {
constexpr int kHistoryFormatVersion = 1;
}

ExpressionHistory::ExpressionHistory(size_t capacity)
    : capacity_(capacity > 0 ? capacity : kDefaultCapacity) {
}

void ExpressionHistory::Add(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return;
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    std::string expression = text.substr(first, last - first + 1);

    auto it = std::find(items_.begin(), items_.end(), expression);
    if (it != items_.end()) {
        items_.erase(it);
    }
    items_.insert(items_.begin(), expression);

    if (items_.size() > capacity_) {
        items_.resize(capacity_);
    }
}

void ExpressionHistory::Clear() {
    items_.clear();
}

void ExpressionHistory::SetCapacity(size_t capacity) {
    capacity_ = capacity > 0 ? capacity : kDefaultCapacity;
    if (items_.size() > capacity_) {
        items_.resize(capacity_);
    }
}

std::string ExpressionHistory::DefaultPath() {
    std::filesystem::path dir;
#ifdef _WIN32
    const char* profile = std::getenv("USERPROFILE");
    if (profile) dir = profile;
#else
    const char* home = std::getenv("HOME");
    if (home) dir = home;
#endif
    return (dir / ".qdevkit_jsonpath_history.json").string();
}

bool ExpressionHistory::Load(const std::string& path) {
    items_.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::debug("No JSONPath history at {}", path);
        return true;
    }

    try {
        json j;
        file >> j;

        // Older files stored a bare array
        const json* entries = nullptr;
        if (j.is_object() && j.contains("history")) {
            entries = &j["history"];
        } else if (j.is_array()) {
            entries = &j;
        }

        if (!entries || !entries->is_array()) {
            spdlog::warn("JSONPath history {} has an unexpected layout, starting empty", path);
            return false;
        }

        for (const auto& entry : *entries) {
            if (!entry.is_string()) continue;
            std::string expr = entry.get<std::string>();
            if (expr.empty() || std::find(items_.begin(), items_.end(), expr) != items_.end()) {
                continue;
            }
            items_.push_back(expr);
            if (items_.size() >= capacity_) break;
        }

        spdlog::debug("Loaded {} JSONPath history entries from {}", items_.size(), path);
        return true;
    } catch (const json::exception& e) {
        spdlog::warn("Failed to read JSONPath history {}: {}", path, e.what());
        items_.clear();
        return false;
    }
}

bool ExpressionHistory::Save(const std::string& path) const {
    try {
        json j;
        j["version"] = kHistoryFormatVersion;
        j["history"] = items_;

        std::filesystem::path target(path);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Cannot write JSONPath history to {}", path);
            return false;
        }
        file << j.dump(2);
        file.close();
        if (file.fail()) {
            spdlog::warn("Failed to write JSONPath history to {}", path);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save JSONPath history: {}", e.what());
        return false;
    }
}

} // namespace qdevkit
