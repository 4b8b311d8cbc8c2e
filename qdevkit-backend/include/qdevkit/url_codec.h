#pragma once

#include "api_export.h"
#include "base64_codec.h"
#include <string>

namespace qdevkit {

// RFC 3986 percent-encoding
class QDEVKIT_API UrlCodec {
public:
    /**
     * Percent-encode every byte outside the unreserved set (A-Z a-z 0-9 - . _ ~)
     * @param text Input text
     * @param plus_for_space Emit '+' for spaces instead of %20 (form encoding)
     */
    static CodecResult Encode(const std::string& text, bool plus_for_space = false);

    /**
     * Decode %XX sequences. A '%' not followed by two hex digits fails with
     * InvalidEncoding.
     * @param plus_for_space Turn '+' into a space before decoding
     */
    static CodecResult Decode(const std::string& text, bool plus_for_space = false);

    static bool IsUnreserved(unsigned char c);
};

} // namespace qdevkit
