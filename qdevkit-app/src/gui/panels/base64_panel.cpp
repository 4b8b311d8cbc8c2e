// base64_panel.cpp - Base64 panel
#include "gui/panels/base64_panel.h"
#include "gui/icons.h"
#include <imgui.h>
#include <cstdio>
#include <cstring>
#include <spdlog/spdlog.h>

namespace qdevkit::app::gui {

Base64Panel::Base64Panel()
    : ToolPanel("Base64 Encode/Decode", ICON_FA_LOCK) {
    spdlog::debug("Base64Panel initialized");
}

void Base64Panel::Render() {
    RenderHeader("Standard (RFC 4648) or URL-safe alphabet");
    RenderToolbar();
    ImGui::Spacing();

    float half = (ImGui::GetContentRegionAvail().y - 60.0f) * 0.5f;
    ImGui::Text("Input");
    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::InputTextMultiline("##Base64Input", input_buffer_, sizeof(input_buffer_),
                              ImVec2(-1, half));
    ImGui::PopFont();
    ImGui::TextDisabled("%zu bytes", std::strlen(input_buffer_));

    ImGui::Spacing();
    RenderStatus();
    RenderOutput();
}

void Base64Panel::RenderToolbar() {
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
    ImGui::Checkbox("URL-safe", &url_safe_);
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Use '-' and '_' instead of '+' and '/', without padding");
    }
}

void Base64Panel::RenderOutput() {
    ImGui::Text("Output");
    if (has_result_ && last_result_.success) {
        ImGui::SameLine();
        ImGui::TextDisabled("(%zu -> %zu bytes%s)", last_result_.input_size, last_result_.output_size,
                            last_result_.is_text ? "" : ", binary");
    }
    RenderReadOnlyText("##Base64Output", output_, ImVec2(-1, -1));
}

void Base64Panel::Encode() {
    if (input_buffer_[0] == '\0') {
        SetStatus("Please enter text to encode", StatusKind::Warning);
        return;
    }

    CodecResult result = url_safe_ ? Base64Codec::EncodeUrl(input_buffer_)
                                   : Base64Codec::Encode(input_buffer_);
    last_result_ = result;
    has_result_ = true;
    output_ = result.output;
    SetStatus("Text encoded successfully", StatusKind::Success);
}

void Base64Panel::Decode() {
    if (input_buffer_[0] == '\0') {
        SetStatus("Please enter Base64 data to decode", StatusKind::Warning);
        return;
    }

    CodecResult result = url_safe_ ? Base64Codec::DecodeUrl(input_buffer_)
                                   : Base64Codec::Decode(input_buffer_);
    last_result_ = result;
    has_result_ = true;

    if (!result.success) {
        output_.clear();
        SetError(result.error_message);
        return;
    }

    if (result.is_text) {
        output_ = result.output;
        SetStatus("Data decoded successfully", StatusKind::Success);
    } else {
        output_ = HexPreview(result.output, 512);
        SetStatus("Decoded data is binary, showing hex", StatusKind::Warning);
    }
}

void Base64Panel::Swap() {
    if (!CopyToBuffer(input_buffer_, sizeof(input_buffer_), output_)) {
        SetStatus("Output too large to move into the input", StatusKind::Warning);
    }
    output_.clear();
    has_result_ = false;
}

void Base64Panel::ClearAll() {
    input_buffer_[0] = '\0';
    output_.clear();
    has_result_ = false;
    ClearStatus();
}

std::string Base64Panel::HexPreview(const std::string& bytes, size_t max_bytes) {
    std::string out;
    char line[16];
    size_t shown = std::min(bytes.size(), max_bytes);

    for (size_t i = 0; i < shown; i++) {
        if (i % 16 == 0) {
            if (i > 0) out += '\n';
            std::snprintf(line, sizeof(line), "%08zx  ", i);
            out += line;
        }
        std::snprintf(line, sizeof(line), "%02x ", static_cast<unsigned char>(bytes[i]));
        out += line;
    }
    if (shown < bytes.size()) {
        out += "\n... (" + std::to_string(bytes.size() - shown) + " more bytes)";
    }
    return out;
}

} // namespace qdevkit::app::gui
