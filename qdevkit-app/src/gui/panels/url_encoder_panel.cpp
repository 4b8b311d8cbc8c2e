// url_encoder_panel.cpp - URL encoder panel
#include "gui/panels/url_encoder_panel.h"
#include "gui/icons.h"
#include <imgui.h>
#include <cstring>
#include <spdlog/spdlog.h>

namespace qdevkit::app::gui {

UrlEncoderPanel::UrlEncoderPanel()
    : ToolPanel("URL Encode/Decode", ICON_FA_LINK) {
    spdlog::debug("UrlEncoderPanel initialized");
}

void UrlEncoderPanel::Render() {
    RenderHeader("Everything outside A-Z a-z 0-9 - _ . ~ is escaped as %XX");
    RenderToolbar();
    ImGui::Spacing();

    float half = (ImGui::GetContentRegionAvail().y - 60.0f) * 0.5f;
    ImGui::Text("Input");
    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::InputTextMultiline("##URLInput", input_buffer_, sizeof(input_buffer_),
                              ImVec2(-1, half));
    ImGui::PopFont();
    ImGui::TextDisabled("%zu bytes", std::strlen(input_buffer_));

    ImGui::Spacing();
    RenderStatus();

    ImGui::Text("Output");
    if (has_result_ && last_result_.success) {
        ImGui::SameLine();
        ImGui::TextDisabled("(%zu -> %zu bytes)", last_result_.input_size, last_result_.output_size);
    }
    RenderReadOnlyText("##URLOutput", output_, ImVec2(-1, -1));
}

void UrlEncoderPanel::RenderToolbar() {
    if (ImGui::Button(ICON_FA_LOCK " Encode")) {
        Encode();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_LOCK_OPEN " Decode")) {
        Decode();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_RIGHT_LEFT " Swap")) {
        Swap();
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
    ImGui::TextDisabled("|");
    ImGui::SameLine();
    ImGui::Checkbox("'+' for spaces", &plus_for_space_);
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Form encoding (application/x-www-form-urlencoded)");
    }
}

void UrlEncoderPanel::ShowResult(const CodecResult& result, const char* success_message) {
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

void UrlEncoderPanel::Encode() {
    if (input_buffer_[0] == '\0') {
        SetStatus("Please enter text to encode", StatusKind::Warning);
        return;
    }
    ShowResult(UrlCodec::Encode(input_buffer_, plus_for_space_), "URL encoded successfully");
}

void UrlEncoderPanel::Decode() {
    if (input_buffer_[0] == '\0') {
        SetStatus("Please enter text to decode", StatusKind::Warning);
        return;
    }
    ShowResult(UrlCodec::Decode(input_buffer_, plus_for_space_), "URL decoded successfully");
}

void UrlEncoderPanel::Swap() {
    if (!CopyToBuffer(input_buffer_, sizeof(input_buffer_), output_)) {
        SetStatus("Output too large to move into the input", StatusKind::Warning);
    }
    output_.clear();
    has_result_ = false;
}

void UrlEncoderPanel::ClearAll() {
    input_buffer_[0] = '\0';
    output_.clear();
    has_result_ = false;
    ClearStatus();
}

} // namespace qdevkit::app::gui
