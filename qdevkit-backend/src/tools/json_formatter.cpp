#include <qdevkit/json_formatter.h>
#include <algorithm>
#include <cctype>
#include <functional>
#include <nlohmann/json.hpp>

namespace qdevkit {

namespace {

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

// "[json.exception.parse_error.101] parse error at line 1, column 6: syntax error ..."
// -> "syntax error ..."
std::string CleanParserMessage(const std::string& what) {
    auto pos = what.find("parse error");
    if (pos != std::string::npos) {
        auto colon = what.find(": ", pos);
        if (colon != std::string::npos) {
            return what.substr(colon + 2);
        }
    }
    return what;
}

template <typename Json>
void Analyze(const Json& j, int depth, JsonResult& result) {
    result.depth = std::max(result.depth, depth);

    if (j.is_object()) {
        result.object_count++;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (depth == 0) {
                result.keys.push_back(it.key());
            }
            Analyze(it.value(), depth + 1, result);
        }
    } else if (j.is_array()) {
        result.array_count++;
        for (const auto& item : j) {
            Analyze(item, depth + 1, result);
        }
    } else if (j.is_string()) {
        result.string_count++;
    } else if (j.is_number()) {
        result.number_count++;
    } else if (j.is_boolean()) {
        result.bool_count++;
    } else if (j.is_null()) {
        result.null_count++;
    }
}

// Parse with Json (ordered or sorted), then hand the document to emit().
// Returns false with the error fields filled when parsing fails.
template <typename Json>
bool ParseInto(const std::string& json_text, JsonResult& result,
               const std::function<void(const Json&)>& emit) {
    if (IsBlank(json_text)) {
        result.error = ToolErrorKind::ParseError;
        result.error_message = "Invalid JSON: input is empty";
        return false;
    }

    try {
        Json json = Json::parse(json_text);
        result.is_valid = true;
        emit(json);
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        int line = -1;
        int column = -1;
        JsonFormatter::OffsetToLineColumn(json_text, e.byte, line, column);

        result.is_valid = false;
        result.error_line = line;
        result.error_column = column;
        result.error_detail = e.what();
        result.error = ToolErrorKind::ParseError;
        result.error_message = "Invalid JSON at line " + std::to_string(line) +
                               ", column " + std::to_string(column) + ": " +
                               CleanParserMessage(e.what());
        return false;
    } catch (const nlohmann::json::exception& e) {
        // dump() refuses strings it cannot re-encode
        result.error = ToolErrorKind::ParseError;
        result.error_detail = e.what();
        result.error_message = std::string("Invalid JSON: ") + e.what();
        return false;
    }
}

} // namespace

void JsonFormatter::OffsetToLineColumn(const std::string& text, size_t byte_offset, int& line, int& column) {
    line = 1;
    column = 1;

    size_t end = std::min(byte_offset > 0 ? byte_offset - 1 : 0, text.size());
    for (size_t i = 0; i < end; i++) {
        if (text[i] == '\n') {
            line++;
            column = 1;
        } else {
            column++;
        }
    }
}

JsonResult JsonFormatter::Format(const std::string& json_text, const JsonFormatOptions& options) {
    JsonResult result;

    if (options.indent < 0 || options.indent > kMaxIndent) {
        result.error = ToolErrorKind::InvalidArgument;
        result.error_message = "Indent must be between 0 and " + std::to_string(kMaxIndent);
        return result;
    }

    bool ok;
    if (options.sort_keys) {
        // nlohmann::json stores objects in std::map, so keys come out sorted
        ok = ParseInto<nlohmann::json>(json_text, result, [&](const nlohmann::json& json) {
            result.output = json.dump(options.indent, ' ', options.ensure_ascii);
            Analyze(json, 0, result);
        });
    } else {
        ok = ParseInto<nlohmann::ordered_json>(json_text, result, [&](const nlohmann::ordered_json& json) {
            result.output = json.dump(options.indent, ' ', options.ensure_ascii);
            Analyze(json, 0, result);
        });
    }

    result.success = ok;
    return result;
}

JsonResult JsonFormatter::Minify(const std::string& json_text) {
    JsonResult result;

    result.success = ParseInto<nlohmann::ordered_json>(json_text, result,
        [&](const nlohmann::ordered_json& json) {
            result.output = json.dump();
            Analyze(json, 0, result);
        });

    return result;
}

JsonResult JsonFormatter::Validate(const std::string& json_text) {
    JsonFormatOptions options;
    options.indent = 2;
    return Format(json_text, options);
}

} // namespace qdevkit
