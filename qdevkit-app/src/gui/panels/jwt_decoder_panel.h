// jwt_decoder_panel.h - Inspect JSON Web Tokens without verifying them
#pragma once

#include "gui/tool_panel.h"
#include <qdevkit/jwt_decoder.h>

namespace qdevkit::app::gui {

class JwtDecoderPanel : public ToolPanel {
public:
    JwtDecoderPanel();
    void Render() override;

private:
    void RenderToolbar();
    void RenderClaimsTable();
    void RenderSections();

    void Decode();
    void PasteToken();
    void ClearAll();

    char token_buffer_[16384] = {0};

    JwtDecodeResult result_;
    bool has_result_ = false;
};

} // namespace qdevkit::app::gui
