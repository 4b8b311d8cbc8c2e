#include <catch2/catch_test_macros.hpp>
#include <qdevkit/json_formatter.h>

using qdevkit::JsonFormatOptions;
using qdevkit::JsonFormatter;
using qdevkit::JsonResult;
using qdevkit::ToolErrorKind;

TEST_CASE("JSON pretty printing", "[json]") {
    SECTION("Two-space indent by default") {
        JsonResult result = JsonFormatter::Format("{\"a\":1}");
        REQUIRE(result.success);
        REQUIRE(result.output == "{\n  \"a\": 1\n}");
    }

    SECTION("Four-space indent") {
        JsonFormatOptions options;
        options.indent = 4;
        REQUIRE(JsonFormatter::Format("[1,2]", options).output == "[\n    1,\n    2\n]");
    }

    SECTION("Input key order is kept") {
        REQUIRE(JsonFormatter::Format("{\"b\":1,\"a\":2}").output == "{\n  \"b\": 1,\n  \"a\": 2\n}");
    }

    SECTION("Keys sorted on request") {
        JsonFormatOptions options;
        options.sort_keys = true;
        REQUIRE(JsonFormatter::Format("{\"b\":1,\"a\":2}", options).output ==
                "{\n  \"a\": 2,\n  \"b\": 1\n}");
    }

    SECTION("Non-ASCII text is kept unless escaping is requested") {
        REQUIRE(JsonFormatter::Format("\"caf\xc3\xa9\"").output == "\"caf\xc3\xa9\"");

        JsonFormatOptions options;
        options.ensure_ascii = true;
        REQUIRE(JsonFormatter::Format("\"caf\xc3\xa9\"", options).output == "\"caf\\u00e9\"");
    }

    SECTION("Indent out of range") {
        JsonFormatOptions options;
        options.indent = 9;
        JsonResult result = JsonFormatter::Format("{}", options);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::InvalidArgument);
    }
}

TEST_CASE("JSON minify", "[json]") {
    SECTION("Whitespace is removed") {
        JsonResult result = JsonFormatter::Minify("{\n  \"a\" : [ 1, 2 ],\n  \"b\" : null\n}");
        REQUIRE(result.success);
        REQUIRE(result.output == "{\"a\":[1,2],\"b\":null}");
    }

    SECTION("Minified output is stable and reformats to the same document") {
        std::string text = "{ \"name\": \"x\", \"list\": [true, false, 1.5, \"s\"], \"obj\": {} }";
        std::string once = JsonFormatter::Minify(text).output;
        REQUIRE(JsonFormatter::Minify(once).output == once);
        REQUIRE(JsonFormatter::Minify(JsonFormatter::Format(text).output).output == once);
    }
}

TEST_CASE("JSON structure statistics", "[json]") {
    JsonResult result = JsonFormatter::Validate(
        "{\"name\":\"x\",\"tags\":[\"a\",\"b\"],\"meta\":{\"ok\":true,\"n\":null,\"v\":3}}");

    REQUIRE(result.success);
    REQUIRE(result.is_valid);
    std::vector<std::string> expected_keys = {"name", "tags", "meta"};
    REQUIRE(result.keys == expected_keys);
    REQUIRE(result.object_count == 2);
    REQUIRE(result.array_count == 1);
    REQUIRE(result.string_count == 3);
    REQUIRE(result.number_count == 1);
    REQUIRE(result.bool_count == 1);
    REQUIRE(result.null_count == 1);
    REQUIRE(result.depth == 2);
}

TEST_CASE("JSON parse errors", "[json]") {
    SECTION("Trailing comma reports a position") {
        JsonResult result = JsonFormatter::Format("{\"a\":1,}");
        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(result.error == ToolErrorKind::ParseError);
        REQUIRE(result.error_line == 1);
        REQUIRE(result.error_column > 1);
        REQUIRE(result.error_message.find("Invalid JSON at line 1") == 0);
    }

    SECTION("Errors on later lines") {
        JsonResult result = JsonFormatter::Validate("{\n  \"a\": 1,\n  \"b\": ]\n}");
        REQUIRE(result.error == ToolErrorKind::ParseError);
        REQUIRE(result.error_line == 3);
    }

    SECTION("Empty input") {
        JsonResult result = JsonFormatter::Minify("   ");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::ParseError);
    }

    SECTION("Failed transforms produce no output") {
        REQUIRE(JsonFormatter::Format("{oops}").output.empty());
    }
}

TEST_CASE("Byte offsets map to line and column", "[json]") {
    int line = 0;
    int column = 0;
    JsonFormatter::OffsetToLineColumn("ab\ncd", 5, line, column);
    REQUIRE(line == 2);
    REQUIRE(column == 2);

    JsonFormatter::OffsetToLineColumn("abc", 1, line, column);
    REQUIRE(line == 1);
    REQUIRE(column == 1);
}
