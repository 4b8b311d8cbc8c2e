// url_encoder_panel.h - Percent-encoding for URL components
#pragma once

#include "gui/tool_panel.h"
#include <qdevkit/url_codec.h>
#include <string>

namespace qdevkit::app::gui {

class UrlEncoderPanel : public ToolPanel {
public:
    UrlEncoderPanel();
    void Render() override;

private:
    void RenderToolbar();

    void Encode();
    void Decode();
    void Swap();
    void ClearAll();
    void ShowResult(const CodecResult& result, const char* success_message);

    char input_buffer_[65536] = {0};
    bool plus_for_space_ = false;

    std::string output_;
    CodecResult last_result_;
    bool has_result_ = false;
};

} // namespace qdevkit::app::gui
