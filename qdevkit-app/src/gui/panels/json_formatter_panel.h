// json_formatter_panel.h - Pretty-print, minify and validate JSON
#pragma once

#include "gui/tool_panel.h"
#include <qdevkit/json_formatter.h>
#include <string>

namespace qdevkit::app::gui {

class JsonFormatterPanel : public ToolPanel {
public:
    JsonFormatterPanel();
    void Render() override;

    void ApplyConfig(const core::AppConfig& config) override;
    void StoreConfig(core::AppConfig& config) const override;

private:
    void RenderToolbar();
    void RenderInputSection(float height);
    void RenderOutputSection();

    void Format();
    void Minify();
    void Validate();
    void LoadSample();
    void ClearAll();

    // Apply a transform result to the output and status line
    void ShowResult(const JsonResult& result, const char* success_message);

    char input_buffer_[65536] = {0};
    int indent_idx_ = 0;          // 0 = 2 spaces, 1 = 4 spaces
    bool sort_keys_ = false;

    std::string output_;
    JsonResult last_result_;
    bool has_result_ = false;
};

} // namespace qdevkit::app::gui
