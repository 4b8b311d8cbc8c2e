// timestamp_converter_panel.h - Unix timestamps <-> calendar dates
#pragma once

#include "gui/tool_panel.h"
#include <qdevkit/timestamp_converter.h>
#include <string>

namespace qdevkit::app::gui {

class TimestampConverterPanel : public ToolPanel {
public:
    TimestampConverterPanel();
    void Render() override;

    void ApplyConfig(const core::AppConfig& config) override;
    void StoreConfig(core::AppConfig& config) const override;

private:
    void RenderZoneRow();
    void RenderTimestampSection();
    void RenderDateSection();

    void ConvertTimestamp();
    void ConvertDate();
    void FillCurrentTimestamp();
    void FillCurrentDate();

    // Offset from the timezone field; reports an error and returns false if unparseable
    bool ResolveOffset(int& offset_minutes);
    TimestampUnit SelectedUnit() const;

    char timestamp_buffer_[64] = {0};
    char date_buffer_[128] = {0};
    char zone_buffer_[32] = "UTC";
    int unit_idx_ = 0;              // 0 = auto, 1 = seconds, 2 = milliseconds

    std::string output_;
};

} // namespace qdevkit::app::gui
