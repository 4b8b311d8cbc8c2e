// json_path_filter_panel.cpp - JSONPath filter panel
#include "gui/panels/json_path_filter_panel.h"
#include "core/config_manager.h"
#include "gui/icons.h"
#include <qdevkit/json_path.h>
#include <imgui.h>
#include <spdlog/spdlog.h>

namespace qdevkit::app::gui {

JsonPathFilterPanel::JsonPathFilterPanel()
    : ToolPanel("JSONPath Filter", ICON_FA_FILTER),
      history_path_(ExpressionHistory::DefaultPath()) {
    spdlog::debug("JsonPathFilterPanel initialized");
}

void JsonPathFilterPanel::ApplyConfig(const core::AppConfig& config) {
    history_path_ = config.jsonpath_history_file.empty()
        ? ExpressionHistory::DefaultPath()
        : config.jsonpath_history_file;
    history_.SetCapacity(static_cast<size_t>(config.jsonpath_max_history));

    if (!history_.Load(history_path_)) {
        SetStatus("Expression history could not be read, starting empty", StatusKind::Warning);
    } else {
        spdlog::info("Loaded {} JSONPath expressions from {}", history_.Size(), history_path_);
    }
}

void JsonPathFilterPanel::StoreConfig(core::AppConfig& config) const {
    config.jsonpath_max_history = static_cast<int>(history_.Capacity());
}

void JsonPathFilterPanel::Render() {
    RenderHeader("Select values with $.store.book[*].author style paths");
    RenderExpressionRow();
    if (show_examples_) {
        RenderExamples();
    }
    ImGui::Spacing();

    float half = (ImGui::GetContentRegionAvail().y - 60.0f) * 0.5f;
    ImGui::Text("Input JSON");
    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::InputTextMultiline("##JSONPathInput", json_buffer_, sizeof(json_buffer_),
                              ImVec2(-1, half), ImGuiInputTextFlags_AllowTabInput);
    ImGui::PopFont();

    ImGui::Spacing();
    RenderStatus();

    ImGui::Text("Result");
    if (match_count_ >= 0) {
        ImGui::SameLine();
        ImGui::TextDisabled("(%d match%s)", match_count_, match_count_ == 1 ? "" : "es");
    }
    ImGui::SameLine();
    if (ImGui::SmallButton(ICON_FA_COPY "##CopyResult")) {
        CopyToClipboard(output_, "Result");
    }
    RenderReadOnlyText("##JSONPathOutput", output_, ImVec2(-1, -1));
}

void JsonPathFilterPanel::RenderExpressionRow() {
    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::SetNextItemWidth(-360);
    bool enter = ImGui::InputTextWithHint("##Expression", "$.items[*].name", expression_buffer_,
                                          sizeof(expression_buffer_),
                                          ImGuiInputTextFlags_EnterReturnsTrue);
    ImGui::PopFont();

    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_FILTER " Filter") || enter) {
        RunFilter();
    }

    ImGui::SameLine();
    ImGui::SetNextItemWidth(110);
    if (ImGui::BeginCombo("##History", ICON_FA_CLOCK_ROTATE_LEFT " History")) {
        if (history_.Size() == 0) {
            ImGui::TextDisabled("No history");
        }
        for (const std::string& item : history_.Items()) {
            if (ImGui::Selectable(item.c_str())) {
                CopyToBuffer(expression_buffer_, sizeof(expression_buffer_), item);
            }
        }
        if (history_.Size() > 0) {
            ImGui::Separator();
            if (ImGui::Selectable(ICON_FA_TRASH " Clear history")) {
                ClearHistory();
            }
        }
        ImGui::EndCombo();
    }

    ImGui::SameLine();
    ImGui::Checkbox("Examples", &show_examples_);
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_ERASER " Clear")) {
        ClearAll();
    }
}

void JsonPathFilterPanel::RenderExamples() {
    for (const auto& [expression, description] : JsonPath::GetExamples()) {
        ImGui::PushID(expression.c_str());
        ImGui::PushFont(GetSafeFont(FONT_MONO));
        if (ImGui::SmallButton(expression.c_str())) {
            CopyToBuffer(expression_buffer_, sizeof(expression_buffer_), expression);
        }
        ImGui::PopFont();
        ImGui::SameLine();
        ImGui::TextDisabled("%s", description.c_str());
        ImGui::PopID();
    }
}

void JsonPathFilterPanel::RunFilter() {
    if (json_buffer_[0] == '\0') {
        SetStatus("Please enter JSON data", StatusKind::Warning);
        return;
    }
    if (expression_buffer_[0] == '\0') {
        SetStatus("Please enter a JSONPath expression", StatusKind::Warning);
        return;
    }

    JsonPathResult result = JsonPath::Filter(json_buffer_, expression_buffer_);
    if (!result.success) {
        output_.clear();
        match_count_ = -1;
        SetError(result.error_message);
        return;
    }

    output_ = result.output;
    match_count_ = result.match_count;

    if (match_count_ == 0) {
        SetStatus("No matches", StatusKind::Warning);
        return;
    }

    // Only expressions that matched something are remembered
    history_.Add(result.expression);
    SaveHistory();
    SetStatus("Filter applied", StatusKind::Success);
}

void JsonPathFilterPanel::SaveHistory() {
    if (!history_.Save(history_path_)) {
        SetStatus("Could not save expression history to " + history_path_, StatusKind::Warning);
    }
}

void JsonPathFilterPanel::ClearHistory() {
    history_.Clear();
    SaveHistory();
    spdlog::info("JSONPath history cleared");
}

void JsonPathFilterPanel::ClearAll() {
    json_buffer_[0] = '\0';
    output_.clear();
    match_count_ = -1;
    ClearStatus();
}

} // namespace qdevkit::app::gui
