// hash_generator_panel.h - MD5 / SHA-1 / SHA-256 / SHA-512 digests
#pragma once

#include "gui/tool_panel.h"
#include <qdevkit/hash_generator.h>
#include <string>

namespace qdevkit::app::gui {

class HashGeneratorPanel : public ToolPanel {
public:
    HashGeneratorPanel();
    void Render() override;

    void ApplyConfig(const core::AppConfig& config) override;
    void StoreConfig(core::AppConfig& config) const override;

private:
    void RenderToolbar();
    void RenderResults();
    void RenderVerify();

    void Generate();
    void Verify();
    void ClearAll();

    // Index into the algorithm combo; the last entry selects every algorithm
    int algorithm_idx_ = 2;
    const char* SelectedAlgorithmKey() const;

    char input_buffer_[65536] = {0};
    char expected_buffer_[160] = {0};

    HashResult result_;
    bool has_result_ = false;
    HashVerifyResult verify_result_;
    bool has_verify_result_ = false;
};

} // namespace qdevkit::app::gui
