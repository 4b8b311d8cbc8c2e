// jwt_decoder_panel.cpp - JWT decoder panel
#include "gui/panels/jwt_decoder_panel.h"
#include "gui/icons.h"
#include "gui/theme.h"
#include <imgui.h>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace qdevkit::app::gui {

JwtDecoderPanel::JwtDecoderPanel()
    : ToolPanel("JWT Decoder", ICON_FA_ID_CARD) {
    spdlog::debug("JwtDecoderPanel initialized");
}

void JwtDecoderPanel::Render() {
    RenderHeader("Header and payload are decoded, the signature is not checked");
    RenderToolbar();
    ImGui::Spacing();

    ImGui::Text("Token");
    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::InputTextMultiline("##JWTInput", token_buffer_, sizeof(token_buffer_),
                              ImVec2(-1, 80));
    ImGui::PopFont();

    ImGui::Spacing();
    RenderStatus();

    if (!has_result_ || !result_.success) {
        return;
    }

    ImGui::TextColored(GetTheme().GetWarningColor(),
                       ICON_FA_TRIANGLE_EXCLAMATION " Signature NOT verified");
    if (result_.is_expired) {
        ImGui::SameLine();
        ImGui::TextColored(GetTheme().GetErrorColor(), ICON_FA_CLOCK " Token has expired");
    }

    RenderClaimsTable();
    ImGui::Spacing();
    RenderSections();
}

void JwtDecoderPanel::RenderToolbar() {
    if (ImGui::Button(ICON_FA_LOCK_OPEN " Decode")) {
        Decode();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_PASTE " Paste")) {
        PasteToken();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_ERASER " Clear")) {
        ClearAll();
    }
}

void JwtDecoderPanel::RenderClaimsTable() {
    ImGuiTableFlags flags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg |
                            ImGuiTableFlags_SizingStretchProp;
    if (ImGui::BeginTable("##JWTInfo", 2, flags)) {
        ImGui::TableSetupColumn("Claim", ImGuiTableColumnFlags_WidthFixed, 110.0f);
        ImGui::TableSetupColumn("Value", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableHeadersRow();

        for (const auto& [label, value] : result_.info) {
            ImGui::TableNextRow();
            ImGui::TableNextColumn();
            ImGui::TextUnformatted(label.c_str());
            ImGui::TableNextColumn();
            ImGui::TextWrapped("%s", value.c_str());
        }
        ImGui::EndTable();
    }
}

void JwtDecoderPanel::RenderSections() {
    float avail = ImGui::GetContentRegionAvail().y;
    float header_height = std::max(80.0f, avail * 0.3f);

    ImGui::Text("Header");
    ImGui::SameLine();
    if (ImGui::SmallButton(ICON_FA_COPY "##CopyHeader")) {
        CopyToClipboard(result_.header_json, "Header");
    }
    RenderReadOnlyText("##JWTHeader", result_.header_json, ImVec2(-1, header_height));

    ImGui::Text("Payload");
    ImGui::SameLine();
    if (ImGui::SmallButton(ICON_FA_COPY "##CopyPayload")) {
        CopyToClipboard(result_.payload_json, "Payload");
    }
    float payload_height = ImGui::GetContentRegionAvail().y - ImGui::GetFrameHeightWithSpacing() * 2.0f;
    RenderReadOnlyText("##JWTPayload", result_.payload_json, ImVec2(-1, std::max(80.0f, payload_height)));

    ImGui::Text("Signature");
    ImGui::SameLine();
    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::TextDisabled("%s", result_.signature.empty() ? "(empty)" : result_.signature.c_str());
    ImGui::PopFont();
}

void JwtDecoderPanel::Decode() {
    if (token_buffer_[0] == '\0') {
        SetStatus("Please enter a JWT token", StatusKind::Warning);
        return;
    }

    result_ = JwtDecoder::Decode(token_buffer_);
    has_result_ = true;

    if (!result_.success) {
        SetError(result_.error_message);
        return;
    }

    if (result_.is_expired) {
        SetStatus("JWT decoded (token expired)", StatusKind::Warning);
    } else {
        SetStatus("JWT decoded successfully", StatusKind::Success);
    }
}

void JwtDecoderPanel::PasteToken() {
    const char* clipboard = ImGui::GetClipboardText();
    if (!clipboard || clipboard[0] == '\0') {
        SetStatus("Clipboard is empty", StatusKind::Warning);
        return;
    }
    if (!CopyToBuffer(token_buffer_, sizeof(token_buffer_), clipboard)) {
        SetStatus("Clipboard text too long for the token field", StatusKind::Warning);
        return;
    }
    Decode();
}

void JwtDecoderPanel::ClearAll() {
    token_buffer_[0] = '\0';
    result_ = JwtDecodeResult();
    has_result_ = false;
    ClearStatus();
}

} // namespace qdevkit::app::gui
