// timestamp_converter_panel.cpp - Timestamp converter panel
#include "gui/panels/timestamp_converter_panel.h"
#include "core/config_manager.h"
#include "gui/icons.h"
#include <imgui.h>
#include <spdlog/spdlog.h>

namespace qdevkit::app::gui {

TimestampConverterPanel::TimestampConverterPanel()
    : ToolPanel("Timestamp Converter", ICON_FA_CLOCK) {
    spdlog::debug("TimestampConverterPanel initialized");
}

void TimestampConverterPanel::ApplyConfig(const core::AppConfig& config) {
    auto unit = TimestampConverter::ParseUnit(config.timestamp_unit);
    unit_idx_ = !unit ? 0 : static_cast<int>(*unit);
    CopyToBuffer(zone_buffer_, sizeof(zone_buffer_), config.timestamp_timezone);
}

void TimestampConverterPanel::StoreConfig(core::AppConfig& config) const {
    config.timestamp_unit = TimestampConverter::UnitName(SelectedUnit());
    if (TimestampConverter::ParseUtcOffset(zone_buffer_)) {
        config.timestamp_timezone = zone_buffer_;
    }
}

void TimestampConverterPanel::Render() {
    RenderHeader("Seconds or milliseconds since 1970-01-01 00:00:00 UTC");
    RenderZoneRow();
    ImGui::Separator();
    RenderTimestampSection();
    ImGui::Spacing();
    RenderDateSection();
    ImGui::Spacing();

    RenderStatus();
    ImGui::Text("Result");
    ImGui::SameLine();
    if (ImGui::SmallButton(ICON_FA_COPY "##CopyResult")) {
        CopyToClipboard(output_, "Result");
    }
    RenderReadOnlyText("##TimestampOutput", output_, ImVec2(-1, -1));
}

void TimestampConverterPanel::RenderZoneRow() {
    ImGui::Text("Timezone:");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(120);
    ImGui::InputText("##Zone", zone_buffer_, sizeof(zone_buffer_));
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("UTC or a fixed offset such as +05:30, -0800, +2");
    }
    ImGui::SameLine();
    ImGui::TextDisabled("Current: %lld", static_cast<long long>(TimestampConverter::CurrentUnixSeconds()));
}

void TimestampConverterPanel::RenderTimestampSection() {
    ImGui::Text(ICON_FA_ARROW_DOWN " Timestamp to date");

    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::SetNextItemWidth(220);
    bool enter = ImGui::InputTextWithHint("##Timestamp", "1700000000", timestamp_buffer_,
                                          sizeof(timestamp_buffer_),
                                          ImGuiInputTextFlags_EnterReturnsTrue);
    ImGui::PopFont();

    ImGui::SameLine();
    const char* units[] = { "Auto", "Seconds", "Milliseconds" };
    ImGui::SetNextItemWidth(120);
    ImGui::Combo("##Unit", &unit_idx_, units, IM_ARRAYSIZE(units));
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_CLOCK_ROTATE_LEFT " Now##Timestamp")) {
        FillCurrentTimestamp();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_PLAY " Convert##Timestamp") || enter) {
        ConvertTimestamp();
    }
}

void TimestampConverterPanel::RenderDateSection() {
    ImGui::Text(ICON_FA_ARROW_UP " Date to timestamp");

    ImGui::PushFont(GetSafeFont(FONT_MONO));
    ImGui::SetNextItemWidth(348);
    bool enter = ImGui::InputTextWithHint("##Date", "2024-01-15 14:30:00", date_buffer_,
                                          sizeof(date_buffer_),
                                          ImGuiInputTextFlags_EnterReturnsTrue);
    ImGui::PopFont();

    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_CALENDAR " Now##Date")) {
        FillCurrentDate();
    }
    ImGui::SameLine();
    if (ImGui::Button(ICON_FA_PLAY " Convert##Date") || enter) {
        ConvertDate();
    }
}

TimestampUnit TimestampConverterPanel::SelectedUnit() const {
    switch (unit_idx_) {
        case 1: return TimestampUnit::Seconds;
        case 2: return TimestampUnit::Milliseconds;
        default: return TimestampUnit::Auto;
    }
}

bool TimestampConverterPanel::ResolveOffset(int& offset_minutes) {
    auto offset = TimestampConverter::ParseUtcOffset(zone_buffer_);
    if (!offset) {
        output_.clear();
        SetStatus(std::string("Unknown timezone '") + zone_buffer_ + "'. Use UTC or an offset like +05:30",
                  StatusKind::Warning);
        return false;
    }
    offset_minutes = *offset;
    return true;
}

void TimestampConverterPanel::ConvertTimestamp() {
    if (timestamp_buffer_[0] == '\0') {
        SetStatus("Please enter a timestamp", StatusKind::Warning);
        return;
    }

    int offset = 0;
    if (!ResolveOffset(offset)) {
        return;
    }

    TimestampResult result = TimestampConverter::ToDate(timestamp_buffer_, SelectedUnit(), offset);
    if (!result.success) {
        output_.clear();
        SetError(result.error_message);
        return;
    }

    output_ = TimestampConverter::FormatReport(result);
    SetStatus("Timestamp converted", StatusKind::Success);
}

void TimestampConverterPanel::ConvertDate() {
    if (date_buffer_[0] == '\0') {
        SetStatus("Please enter a date", StatusKind::Warning);
        return;
    }

    int offset = 0;
    if (!ResolveOffset(offset)) {
        return;
    }

    TimestampResult result = TimestampConverter::FromDate(date_buffer_, offset);
    if (!result.success) {
        output_.clear();
        SetError(result.error_message);
        return;
    }

    output_ = TimestampConverter::FormatReport(result);
    SetStatus("Date converted", StatusKind::Success);
}

void TimestampConverterPanel::FillCurrentTimestamp() {
    if (unit_idx_ == 2) {
        CopyToBuffer(timestamp_buffer_, sizeof(timestamp_buffer_),
                     std::to_string(TimestampConverter::CurrentUnixMillis()));
    } else {
        CopyToBuffer(timestamp_buffer_, sizeof(timestamp_buffer_),
                     std::to_string(TimestampConverter::CurrentUnixSeconds()));
    }
    ConvertTimestamp();
}

void TimestampConverterPanel::FillCurrentDate() {
    int offset = 0;
    if (!ResolveOffset(offset)) {
        return;
    }

    // "YYYY-MM-DD HH:MM:SS" in the selected zone
    TimestampResult now = TimestampConverter::FromEpochMillis(
        TimestampConverter::CurrentUnixMillis(), offset);
    CopyToBuffer(date_buffer_, sizeof(date_buffer_), now.utc.substr(0, 19));
    ConvertDate();
}

} // namespace qdevkit::app::gui
