#pragma once

#include "api_export.h"
#include "tool_error.h"
#include <string>

namespace qdevkit {

// Result of an encode/decode transform (shared by the Base64 and URL codecs)
struct QDEVKIT_API CodecResult {
    std::string output;
    size_t input_size = 0;              // Bytes consumed
    size_t output_size = 0;             // Bytes produced
    bool is_text = true;                // Output is valid UTF-8
    bool success = false;
    ToolErrorKind error = ToolErrorKind::None;
    std::string error_message;
};

class QDEVKIT_API Base64Codec {
public:
    /**
     * Encode bytes with the standard alphabet and '=' padding (RFC 4648)
     * @param data Raw bytes (any content)
     */
    static CodecResult Encode(const std::string& data);

    /**
     * Decode standard Base64. ASCII whitespace is skipped; any other byte
     * outside the alphabet, a bad length, or misplaced padding fails with
     * InvalidEncoding.
     */
    static CodecResult Decode(const std::string& text);

    /**
     * Encode with the URL-safe alphabet ('-' and '_')
     * @param pad Append '=' padding (JWT segments never carry it)
     */
    static CodecResult EncodeUrl(const std::string& data, bool pad = false);

    /**
     * Decode the URL-safe alphabet; missing padding is restored first
     */
    static CodecResult DecodeUrl(const std::string& text);

    // True when bytes form well-formed UTF-8
    static bool IsValidUtf8(const std::string& bytes);

private:
    static CodecResult EncodeWith(const std::string& data, const char* alphabet, bool pad);
    static CodecResult DecodeWith(const std::string& text, bool url_safe);
};

} // namespace qdevkit
