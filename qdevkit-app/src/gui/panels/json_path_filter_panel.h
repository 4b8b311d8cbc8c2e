// json_path_filter_panel.h - Query JSON documents with JSONPath expressions
#pragma once

#include "gui/tool_panel.h"
#include <qdevkit/expression_history.h>
#include <string>

namespace qdevkit::app::gui {

class JsonPathFilterPanel : public ToolPanel {
public:
    JsonPathFilterPanel();
    void Render() override;

    // Loads the expression history from the configured file
    void ApplyConfig(const core::AppConfig& config) override;
    void StoreConfig(core::AppConfig& config) const override;

    const ExpressionHistory& GetHistory() const { return history_; }

private:
    void RenderExpressionRow();
    void RenderExamples();

    void RunFilter();
    void ClearAll();
    void ClearHistory();
    void SaveHistory();

    char json_buffer_[65536] = {0};
    char expression_buffer_[512] = "$";

    ExpressionHistory history_;
    std::string history_path_;
    bool show_examples_ = false;

    std::string output_;
    int match_count_ = -1;
};

} // namespace qdevkit::app::gui
