// uuid_generator_panel.h - Random (v4) and time-ordered (v7) UUIDs
#pragma once

#include "gui/tool_panel.h"
#include <string>
#include <vector>

namespace qdevkit::app::gui {

class UuidGeneratorPanel : public ToolPanel {
public:
    UuidGeneratorPanel();
    void Render() override;

    void ApplyConfig(const core::AppConfig& config) override;
    void StoreConfig(core::AppConfig& config) const override;

private:
    void RenderOptions();
    void RenderResults();

    void Generate();
    void CopyAll();
    void ClearAll();

    int version_ = 4;
    int quantity_ = 1;
    bool uppercase_ = false;
    bool with_dashes_ = true;

    std::vector<std::string> uuids_;
    int generated_version_ = 4;
};

} // namespace qdevkit::app::gui
