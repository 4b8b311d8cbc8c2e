#pragma once

#include "api_export.h"
#include "tool_error.h"
#include <string>
#include <vector>

namespace qdevkit {

struct QDEVKIT_API JsonFormatOptions {
    int indent = 2;                     // 0..8 spaces
    bool sort_keys = false;             // Otherwise input key order is kept
    bool ensure_ascii = false;          // Escape non-ASCII as \uXXXX
};

// JSON Result
struct QDEVKIT_API JsonResult {
    std::string output;                 // Formatted or minified text
    bool is_valid = false;
    int error_line = -1;                // 1-based, -1 when unknown
    int error_column = -1;
    std::string error_detail;           // Raw parser message
    std::vector<std::string> keys;      // Top-level keys
    int depth = 0;                      // Maximum nesting depth
    int object_count = 0;
    int array_count = 0;
    int string_count = 0;
    int number_count = 0;
    int bool_count = 0;
    int null_count = 0;
    bool success = false;
    ToolErrorKind error = ToolErrorKind::None;
    std::string error_message;
};

class QDEVKIT_API JsonFormatter {
public:
    static constexpr int kMaxIndent = 8;

    /**
     * Pretty-print JSON
     * @param json_text Input JSON string
     * @param options Indentation, key sorting and ASCII escaping
     * @return JsonResult with output, ParseError on malformed input
     */
    static JsonResult Format(const std::string& json_text, const JsonFormatOptions& options = {});

    /**
     * Minify JSON (remove all insignificant whitespace)
     */
    static JsonResult Minify(const std::string& json_text);

    /**
     * Validate and analyze JSON; output holds the 2-space pretty form
     */
    static JsonResult Validate(const std::string& json_text);

    // Convert a parser byte offset (1-based) into line/column
    static void OffsetToLineColumn(const std::string& text, size_t byte_offset, int& line, int& column);
};

} // namespace qdevkit
