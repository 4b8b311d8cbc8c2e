// uuid_generator_panel.cpp - UUID generator panel
#include "gui/panels/uuid_generator_panel.h"
#include "core/config_manager.h"
#include "gui/icons.h"
#include <qdevkit/uuid_generator.h>
#include <imgui.h>
#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

namespace qdevkit::app::gui {

UuidGeneratorPanel::UuidGeneratorPanel()
    : ToolPanel("UUID Generator", ICON_FA_FINGERPRINT) {
    spdlog::debug("UuidGeneratorPanel initialized");
}

void UuidGeneratorPanel::ApplyConfig(const core::AppConfig& config) {
    version_ = (config.uuid_version == 7) ? 7 : 4;
    quantity_ = std::clamp(config.uuid_quantity, 1, UuidGenerator::kMaxQuantity);
    uppercase_ = config.uuid_uppercase;
    with_dashes_ = config.uuid_with_dashes;
}

void UuidGeneratorPanel::StoreConfig(core::AppConfig& config) const {
    config.uuid_version = version_;
    config.uuid_quantity = quantity_;
    config.uuid_uppercase = uppercase_;
    config.uuid_with_dashes = with_dashes_;
}

void UuidGeneratorPanel::Render() {
    RenderHeader("RFC 9562 identifiers, random (v4) or time-ordered (v7)");
    RenderOptions();
    ImGui::Spacing();
    RenderStatus();
    RenderResults();
}

void UuidGeneratorPanel::RenderOptions() {
    ImGui::Text("Version:");
    ImGui::SameLine();
    ImGui::RadioButton("v4 (random)", &version_, 4);
    ImGui::SameLine();
    ImGui::RadioButton("v7 (time-ordered)", &version_, 7);

    ImGui::SetNextItemWidth(120);
    if (ImGui::InputInt("Quantity", &quantity_)) {
        quantity_ = std::clamp(quantity_, 1, UuidGenerator::kMaxQuantity);
    }
    ImGui::SameLine();
    ImGui::Checkbox("Uppercase", &uppercase_);
    ImGui::SameLine();
    ImGui::Checkbox("Dashes", &with_dashes_);

    ImGui::Spacing();
    if (ImGui::Button(ICON_FA_PLAY " Generate")) {
        Generate();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_COPY " Copy All")) {
        CopyAll();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_ERASER " Clear")) {
        ClearAll();
    }
}

void UuidGeneratorPanel::RenderResults() {
    ImGui::Text("Generated");
    if (!uuids_.empty()) {
        ImGui::SameLine();
        ImGui::TextDisabled("(%zu x v%d)", uuids_.size(), generated_version_);
    }

    ImGui::BeginChild("##UUIDList", ImVec2(-1, -1), true);
    ImGui::PushFont(GetSafeFont(FONT_MONO));

    ImGuiListClipper clipper;
    clipper.Begin(static_cast<int>(uuids_.size()));
    while (clipper.Step()) {
        for (int i = clipper.DisplayStart; i < clipper.DisplayEnd; i++) {
            ImGui::PushID(i);
            if (ImGui::SmallButton(ICON_FA_COPY)) {
                CopyToClipboard(uuids_[i], "UUID");
            }
            ImGui::SameLine();
            ImGui::TextUnformatted(uuids_[i].c_str());
            ImGui::PopID();
        }
    }

    ImGui::PopFont();
    ImGui::EndChild();
}

void UuidGeneratorPanel::Generate() {
    UuidOptions options;
    options.version = version_;
    options.quantity = quantity_;
    options.uppercase = uppercase_;
    options.with_dashes = with_dashes_;

    UuidResult result = UuidGenerator::Generate(options);
    if (!result.success) {
        uuids_.clear();
        SetError(result.error_message);
        return;
    }

    uuids_ = std::move(result.uuids);
    generated_version_ = result.version;
    SetStatus("Generated " + std::to_string(uuids_.size()) + " UUID" +
              (uuids_.size() == 1 ? "" : "s"), StatusKind::Success);
}

void UuidGeneratorPanel::CopyAll() {
    std::string text;
    for (size_t i = 0; i < uuids_.size(); i++) {
        if (i > 0) text += '\n';
        text += uuids_[i];
    }
    CopyToClipboard(text, uuids_.size() == 1 ? "UUID" : "UUIDs");
}

void UuidGeneratorPanel::ClearAll() {
    uuids_.clear();
    ClearStatus();
}

} // namespace qdevkit::app::gui
