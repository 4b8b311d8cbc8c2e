// hash_generator_panel.cpp - Hash generator panel
#include "gui/panels/hash_generator_panel.h"
#include "core/config_manager.h"
#include "gui/icons.h"
#include "gui/theme.h"
#include <imgui.h>
#include <cstring>
#include <spdlog/spdlog.h>

namespace qdevkit::app::gui {

namespace {

const char* kAlgorithmKeys[] = { "md5", "sha1", "sha256", "sha512", "all" };
const char* kAlgorithmLabels[] = { "MD5", "SHA-1", "SHA-256", "SHA-512", "All" };
constexpr int kAlgorithmCount = IM_ARRAYSIZE(kAlgorithmKeys);

} // namespace

HashGeneratorPanel::HashGeneratorPanel()
    : ToolPanel("Hash Generator", ICON_FA_HASHTAG) {
    spdlog::debug("HashGeneratorPanel initialized");
}

void HashGeneratorPanel::ApplyConfig(const core::AppConfig& config) {
    algorithm_idx_ = 2;
    if (config.hash_algorithm == "all") {
        algorithm_idx_ = kAlgorithmCount - 1;
    } else if (auto parsed = HashGenerator::ParseAlgorithm(config.hash_algorithm)) {
        algorithm_idx_ = static_cast<int>(*parsed);
    }
}

void HashGeneratorPanel::StoreConfig(core::AppConfig& config) const {
    config.hash_algorithm = SelectedAlgorithmKey();
}

const char* HashGeneratorPanel::SelectedAlgorithmKey() const {
    if (algorithm_idx_ < 0 || algorithm_idx_ >= kAlgorithmCount) {
        return "sha256";
    }
    return kAlgorithmKeys[algorithm_idx_];
}

void HashGeneratorPanel::Render() {
    RenderHeader("Digests of the UTF-8 input, lowercase hex");
    RenderToolbar();
    ImGui::Spacing();

    ImGui::Text("Input");
    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::InputTextMultiline("##HashInput", input_buffer_, sizeof(input_buffer_),
                              ImVec2(-1, ImGui::GetContentRegionAvail().y * 0.4f));
    ImGui::PopFont();
    ImGui::TextDisabled("%zu bytes", std::strlen(input_buffer_));

    ImGui::Spacing();
    RenderStatus();
    RenderResults();
    ImGui::Spacing();
    ImGui::Separator();
    RenderVerify();
}

void HashGeneratorPanel::RenderToolbar() {
    ImGui::SetNextItemWidth(120);
    ImGui::Combo("Algorithm", &algorithm_idx_, kAlgorithmLabels, kAlgorithmCount);
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_PLAY " Generate")) {
        Generate();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_ERASER " Clear")) {
        ClearAll();
    }
}

void HashGeneratorPanel::RenderResults() {
    if (!has_result_ || !result_.success) {
        return;
    }

    ImGuiTableFlags flags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg;
    if (ImGui::BeginTable("##HashResults", 3, flags)) {
        ImGui::TableSetupColumn("Algorithm", ImGuiTableColumnFlags_WidthFixed, 80.0f);
        ImGui::TableSetupColumn("Digest", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("##Copy", ImGuiTableColumnFlags_WidthFixed, 30.0f);
        ImGui::TableHeadersRow();

        for (HashAlgorithm alg : HashGenerator::AllAlgorithms()) {
            const std::string& digest = result_.Digest(alg);
            if (digest.empty()) continue;

            ImGui::PushID(static_cast<int>(alg));
            ImGui::TableNextRow();
            ImGui::TableNextColumn();
            ImGui::TextUnformatted(HashGenerator::AlgorithmLabel(alg));
            ImGui::TableNextColumn();
            ImGui::PushFont(GetSafeFont(FONT_MONO));
            ImGui::TextWrapped("%s", digest.c_str());
            ImGui::PopFont();
            ImGui::TableNextColumn();
            if (ImGui::SmallButton(ICON_FA_COPY)) {
                CopyToClipboard(digest, HashGenerator::AlgorithmLabel(alg));
            }
            ImGui::PopID();
        }
        ImGui::EndTable();
    }
    ImGui::TextDisabled("%zu bytes hashed in %.3f ms", result_.input_size, result_.compute_time_ms);
}

void HashGeneratorPanel::RenderVerify() {
    ImGui::Text(ICON_FA_MAGNIFYING_GLASS " Verify");
    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::SetNextItemWidth(-120);
    ImGui::InputTextWithHint("##ExpectedHash", "Expected digest (algorithm detected from length)",
                             expected_buffer_, sizeof(expected_buffer_));
    ImGui::PopFont();
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_CHECK " Verify")) {
        Verify();
    }

    if (!has_verify_result_ || !verify_result_.success) {
        return;
    }

    Theme& theme = GetTheme();
    if (verify_result_.matches) {
        ImGui::TextColored(theme.GetSuccessColor(), ICON_FA_CIRCLE_CHECK " %s digest matches",
                           verify_result_.algorithm.c_str());
    } else {
        ImGui::TextColored(theme.GetErrorColor(), ICON_FA_CIRCLE_XMARK " %s digest does not match",
                           verify_result_.algorithm.c_str());
    }
}

void HashGeneratorPanel::Generate() {
    result_ = HashGenerator::HashText(input_buffer_, SelectedAlgorithmKey());
    has_result_ = true;

    if (!result_.success) {
        SetError(result_.error_message);
        return;
    }
    SetStatus("Hash generated", StatusKind::Success);
}

void HashGeneratorPanel::Verify() {
    if (expected_buffer_[0] == '\0') {
        SetStatus("Please enter the expected hash", StatusKind::Warning);
        return;
    }

    verify_result_ = HashGenerator::VerifyHash(input_buffer_, expected_buffer_);
    has_verify_result_ = true;

    if (!verify_result_.success) {
        SetError(verify_result_.error_message);
    } else if (verify_result_.matches) {
        SetStatus("Hash matches", StatusKind::Success);
    } else {
        SetStatus("Hash does not match", StatusKind::Warning);
    }
}

void HashGeneratorPanel::ClearAll() {
    input_buffer_[0] = '\0';
    expected_buffer_[0] = '\0';
    has_result_ = false;
    has_verify_result_ = false;
    ClearStatus();
}

} // namespace qdevkit::app::gui
