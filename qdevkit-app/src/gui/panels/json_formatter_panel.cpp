// json_formatter_panel.cpp - JSON formatter panel
#include "gui/panels/json_formatter_panel.h"
#include "core/config_manager.h"
#include "gui/icons.h"
#include <imgui.h>
#include <cstring>
#include <spdlog/spdlog.h>

namespace qdevkit::app::gui {

static const char* kSampleJson =
    "{\"name\":\"QDevKit\",\"version\":\"1.2.0\",\"tools\":[\"json\",\"base64\",\"uuid\"],"
    "\"settings\":{\"theme\":\"dark\",\"indent\":2},\"active\":true,\"plugins\":null}";

JsonFormatterPanel::JsonFormatterPanel()
    : ToolPanel("JSON Formatter", ICON_FA_CODE) {
    spdlog::debug("JsonFormatterPanel initialized");
}

void JsonFormatterPanel::ApplyConfig(const core::AppConfig& config) {
    indent_idx_ = (config.json_indent == 4) ? 1 : 0;
    sort_keys_ = config.json_sort_keys;
}

void JsonFormatterPanel::StoreConfig(core::AppConfig& config) const {
    config.json_indent = (indent_idx_ == 1) ? 4 : 2;
    config.json_sort_keys = sort_keys_;
}

void JsonFormatterPanel::Render() {
    RenderHeader("Format, minify and validate JSON documents");
    RenderToolbar();
    ImGui::Spacing();

    float half = (ImGui::GetContentRegionAvail().y - 60.0f) * 0.5f;
    RenderInputSection(half);
    ImGui::Spacing();
    RenderStatus();
    RenderOutputSection();
}

void JsonFormatterPanel::RenderToolbar() {
    if (ImGui::Button(ICON_FA_WAND_MAGIC_SPARKLES " Format")) {
        Format();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_COMPRESS " Minify")) {
        Minify();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_CHECK " Validate")) {
        Validate();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_COPY " Copy")) {
        CopyToClipboard(output_, "Output");
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_ERASER " Clear")) {
        ClearAll();
    }
    ImGui::SameLine();
    if (ImGui::Button("Sample")) {
        LoadSample();
    }

    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();

    const char* indents[] = { "2 spaces", "4 spaces" };
    ImGui::SetNextItemWidth(100);
    ImGui::Combo("Indent", &indent_idx_, indents, IM_ARRAYSIZE(indents));
    ImGui::SameLine();
    ImGui::Checkbox("Sort Keys", &sort_keys_);
}

void JsonFormatterPanel::RenderInputSection(float height) {
    ImGui::Text("Input JSON");
    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::InputTextMultiline("##JSONInput", input_buffer_, sizeof(input_buffer_),
                              ImVec2(-1, height), ImGuiInputTextFlags_AllowTabInput);
    ImGui::PopFont();
    ImGui::TextDisabled("%zu characters", std::strlen(input_buffer_));
}

void JsonFormatterPanel::RenderOutputSection() {
    ImGui::Text("Output");

    if (has_result_ && last_result_.success) {
        ImGui::SameLine();
        ImGui::TextDisabled("(%zu top-level keys, depth %d, %d objects, %d arrays)",
                            last_result_.keys.size(), last_result_.depth,
                            last_result_.object_count, last_result_.array_count);
    }

    RenderReadOnlyText("##JSONOutput", output_, ImVec2(-1, -1));
}

void JsonFormatterPanel::ShowResult(const JsonResult& result, const char* success_message) {
    last_result_ = result;
    has_result_ = true;

    if (result.success) {
        output_ = result.output;
        SetStatus(success_message, StatusKind::Success);
    } else {
        output_.clear();
        SetError(result.error_message);
    }
}

void JsonFormatterPanel::Format() {
    if (input_buffer_[0] == '\0') {
        SetStatus("Please enter JSON data", StatusKind::Warning);
        return;
    }

    JsonFormatOptions options;
    options.indent = (indent_idx_ == 1) ? 4 : 2;
    options.sort_keys = sort_keys_;

    ShowResult(JsonFormatter::Format(input_buffer_, options), "JSON formatted successfully");
}

void JsonFormatterPanel::Minify() {
    if (input_buffer_[0] == '\0') {
        SetStatus("Please enter JSON data", StatusKind::Warning);
        return;
    }

    ShowResult(JsonFormatter::Minify(input_buffer_), "JSON minified successfully");
}

void JsonFormatterPanel::Validate() {
    if (input_buffer_[0] == '\0') {
        SetStatus("Please enter JSON data", StatusKind::Warning);
        return;
    }

    JsonResult result = JsonFormatter::Validate(input_buffer_);
    last_result_ = result;
    has_result_ = true;

    if (result.success) {
        SetStatus("Valid JSON", StatusKind::Success);
    } else {
        SetError(result.error_message);
    }
}

void JsonFormatterPanel::LoadSample() {
    CopyToBuffer(input_buffer_, sizeof(input_buffer_), kSampleJson);
    ClearStatus();
}

void JsonFormatterPanel::ClearAll() {
    input_buffer_[0] = '\0';
    output_.clear();
    has_result_ = false;
    ClearStatus();
}

} // namespace qdevkit::app::gui
