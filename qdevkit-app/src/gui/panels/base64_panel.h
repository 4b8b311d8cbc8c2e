// base64_panel.h - Base64 / Base64url encode and decode
#pragma once

#include "gui/tool_panel.h"
#include <qdevkit/base64_codec.h>
#include <string>

namespace qdevkit::app::gui {

class Base64Panel : public ToolPanel {
public:
    Base64Panel();
    void Render() override;

private:
    void RenderToolbar();
    void RenderOutput();

    void Encode();
    void Decode();
    void Swap();
    void ClearAll();

    // Hex dump shown when decoded bytes are not UTF-8 text
    static std::string HexPreview(const std::string& bytes, size_t max_bytes);

    char input_buffer_[65536] = {0};
    bool url_safe_ = false;

    std::string output_;
    CodecResult last_result_;
    bool has_result_ = false;
};

} // namespace qdevkit::app::gui
