#include <qdevkit/base64_codec.h>
#include <cstdint>
#include <cstdio>
#include <vector>

namespace qdevkit {

// ========== Alphabets ==========

static const char* kStandardAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

static const char* kUrlSafeAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789-_";

static inline bool is_skippable(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Sextet value of c in the chosen alphabet, -1 if it is not a member
static int sextet_value(unsigned char c, bool url_safe) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (url_safe) {
        if (c == '-') return 62;
        if (c == '_') return 63;
    } else {
        if (c == '+') return 62;
        if (c == '/') return 63;
    }
    return -1;
}

static std::string describe_char(unsigned char c) {
    char buf[16];
    if (c >= 0x20 && c < 0x7F) {
        std::snprintf(buf, sizeof(buf), "'%c'", c);
    } else {
        std::snprintf(buf, sizeof(buf), "0x%02X", c);
    }
    return buf;
}

static CodecResult encoding_error(const std::string& message) {
    CodecResult result;
    result.error = ToolErrorKind::InvalidEncoding;
    result.error_message = message;
    return result;
}

// ========== Encoding ==========

CodecResult Base64Codec::Encode(const std::string& data) {
    return EncodeWith(data, kStandardAlphabet, true);
}

CodecResult Base64Codec::EncodeUrl(const std::string& data, bool pad) {
    return EncodeWith(data, kUrlSafeAlphabet, pad);
}

CodecResult Base64Codec::EncodeWith(const std::string& data, const char* alphabet, bool pad) {
    CodecResult result;
    result.input_size = data.size();

    std::string& out = result.output;
    out.reserve(((data.size() + 2) / 3) * 4);

    int i = 0;
    unsigned char char_array_3[3];
    unsigned char char_array_4[4];

    for (unsigned char byte : data) {
        char_array_3[i++] = byte;
        if (i == 3) {
            char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
            char_array_4[1] = ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
            char_array_4[2] = ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);
            char_array_4[3] = char_array_3[2] & 0x3f;

            for (int k = 0; k < 4; k++) {
                out += alphabet[char_array_4[k]];
            }
            i = 0;
        }
    }

    if (i) {
        for (int j = i; j < 3; j++) {
            char_array_3[j] = '\0';
        }

        char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
        char_array_4[1] = ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
        char_array_4[2] = ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);

        for (int j = 0; j < i + 1; j++) {
            out += alphabet[char_array_4[j]];
        }

        if (pad) {
            while (i++ < 3) {
                out += '=';
            }
        }
    }

    result.output_size = out.size();
    result.is_text = true;
    result.success = true;
    return result;
}

// ========== Decoding ==========

CodecResult Base64Codec::Decode(const std::string& text) {
    return DecodeWith(text, false);
}

CodecResult Base64Codec::DecodeUrl(const std::string& text) {
    return DecodeWith(text, true);
}

CodecResult Base64Codec::DecodeWith(const std::string& text, bool url_safe) {
    // Compact the input, remembering where each symbol came from
    std::vector<unsigned char> symbols;
    std::vector<size_t> offsets;
    symbols.reserve(text.size());
    offsets.reserve(text.size());

    for (size_t pos = 0; pos < text.size(); pos++) {
        unsigned char c = static_cast<unsigned char>(text[pos]);
        if (is_skippable(c)) continue;
        symbols.push_back(c);
        offsets.push_back(pos);
    }

    // Trailing padding run
    size_t padding = 0;
    while (padding < symbols.size() && symbols[symbols.size() - 1 - padding] == '=') {
        padding++;
    }
    size_t data_len = symbols.size() - padding;

    if (padding > 2) {
        return encoding_error("Invalid Base64 padding: " + std::to_string(padding) +
                              " '=' characters (at most 2 allowed)");
    }

    for (size_t k = 0; k < data_len; k++) {
        unsigned char c = symbols[k];
        if (c == '=') {
            return encoding_error("Unexpected padding at offset " + std::to_string(offsets[k]));
        }
        if (sextet_value(c, url_safe) < 0) {
            return encoding_error("Invalid " + std::string(url_safe ? "Base64url" : "Base64") +
                                  " character " + describe_char(c) +
                                  " at offset " + std::to_string(offsets[k]));
        }
    }

    if (url_safe) {
        // Padding is optional; only a lone trailing sextet is impossible
        if (data_len % 4 == 1) {
            return encoding_error("Invalid Base64url length " + std::to_string(data_len));
        }
        if (padding > 0 && (data_len + padding) % 4 != 0) {
            return encoding_error("Invalid Base64url padding");
        }
    } else {
        if (symbols.size() % 4 != 0) {
            return encoding_error("Invalid Base64 length " + std::to_string(symbols.size()) +
                                  " (must be a multiple of 4)");
        }
    }

    CodecResult result;
    result.input_size = text.size();
    std::string& out = result.output;
    out.reserve((data_len / 4) * 3 + 2);

    int i = 0;
    unsigned char char_array_4[4];
    unsigned char char_array_3[3];

    for (size_t k = 0; k < data_len; k++) {
        char_array_4[i++] = static_cast<unsigned char>(sextet_value(symbols[k], url_safe));
        if (i == 4) {
            char_array_3[0] = (char_array_4[0] << 2) + ((char_array_4[1] & 0x30) >> 4);
            char_array_3[1] = ((char_array_4[1] & 0xf) << 4) + ((char_array_4[2] & 0x3c) >> 2);
            char_array_3[2] = ((char_array_4[2] & 0x3) << 6) + char_array_4[3];

            out.append(reinterpret_cast<const char*>(char_array_3), 3);
            i = 0;
        }
    }

    if (i) {
        for (int j = i; j < 4; j++) {
            char_array_4[j] = 0;
        }

        char_array_3[0] = (char_array_4[0] << 2) + ((char_array_4[1] & 0x30) >> 4);
        char_array_3[1] = ((char_array_4[1] & 0xf) << 4) + ((char_array_4[2] & 0x3c) >> 2);

        out.append(reinterpret_cast<const char*>(char_array_3), static_cast<size_t>(i - 1));
    }

    result.output_size = out.size();
    result.is_text = IsValidUtf8(out);
    result.success = true;
    return result;
}

bool Base64Codec::IsValidUtf8(const std::string& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t extra;
        uint32_t code_point;

        if (c < 0x80) {
            i++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= bytes.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; k++) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += extra + 1;
    }
    return true;
}

} // namespace qdevkit
