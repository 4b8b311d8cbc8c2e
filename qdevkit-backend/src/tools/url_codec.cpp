#include <qdevkit/url_codec.h>

namespace qdevkit {

static const char* kHexDigits = "0123456789ABCDEF";

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool UrlCodec::IsUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

CodecResult UrlCodec::Encode(const std::string& text, bool plus_for_space) {
    CodecResult result;
    result.input_size = text.size();
    result.output.reserve(text.size() * 3);

    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (IsUnreserved(c)) {
            result.output += ch;
        } else if (c == ' ' && plus_for_space) {
            result.output += '+';
        } else {
            result.output += '%';
            result.output += kHexDigits[c >> 4];
            result.output += kHexDigits[c & 0x0F];
        }
    }

    result.output_size = result.output.size();
    result.success = true;
    return result;
}

CodecResult UrlCodec::Decode(const std::string& text, bool plus_for_space) {
    CodecResult result;
    result.input_size = text.size();
    result.output.reserve(text.size());

    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];

        if (c == '%') {
            int hi = (i + 1 < text.size()) ? hex_value(text[i + 1]) : -1;
            int lo = (i + 2 < text.size()) ? hex_value(text[i + 2]) : -1;
            if (hi < 0 || lo < 0) {
                result.output.clear();
                result.error = ToolErrorKind::InvalidEncoding;
                result.error_message = "Malformed percent-encoding at offset " + std::to_string(i) +
                                       ": '%' must be followed by two hex digits";
                return result;
            }
            result.output += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else if (c == '+' && plus_for_space) {
            result.output += ' ';
        } else {
            result.output += c;
        }
    }

    result.output_size = result.output.size();
    result.is_text = Base64Codec::IsValidUtf8(result.output);
    result.success = true;
    return result;
}

} // namespace qdevkit
