#include <catch2/catch_test_macros.hpp>
#include <qdevkit/base64_codec.h>

using qdevkit::Base64Codec;
using qdevkit::CodecResult;
using qdevkit::ToolErrorKind;

TEST_CASE("Base64 encoding", "[base64]") {
    SECTION("Standard alphabet with padding") {
        REQUIRE(Base64Codec::Encode("hello").output == "aGVsbG8=");
        REQUIRE(Base64Codec::Encode("hi").output == "aGk=");
        REQUIRE(Base64Codec::Encode("abc").output == "YWJj");
    }

    SECTION("Empty input") {
        CodecResult result = Base64Codec::Encode("");
        REQUIRE(result.success);
        REQUIRE(result.output.empty());
    }

    SECTION("URL-safe alphabet drops padding") {
        std::string bytes = "\xfb\xff";
        REQUIRE(Base64Codec::Encode(bytes).output == "+/8=");
        REQUIRE(Base64Codec::EncodeUrl(bytes).output == "-_8");
        REQUIRE(Base64Codec::EncodeUrl(bytes, true).output == "-_8=");
    }

    SECTION("Sizes are reported") {
        CodecResult result = Base64Codec::Encode("hello");
        REQUIRE(result.input_size == 5);
        REQUIRE(result.output_size == 8);
    }
}

TEST_CASE("Base64 decoding", "[base64]") {
    SECTION("Valid text") {
        CodecResult result = Base64Codec::Decode("aGVsbG8=");
        REQUIRE(result.success);
        REQUIRE(result.output == "hello");
        REQUIRE(result.is_text);
    }

    SECTION("Whitespace and line breaks are ignored") {
        CodecResult result = Base64Codec::Decode("aGVs\r\nbG8=\n");
        REQUIRE(result.success);
        REQUIRE(result.output == "hello");
    }

    SECTION("Binary output is flagged") {
        CodecResult result = Base64Codec::Decode("/w==");
        REQUIRE(result.success);
        REQUIRE(result.output == std::string("\xff"));
        REQUIRE_FALSE(result.is_text);
    }

    SECTION("URL-safe input with or without padding") {
        REQUIRE(Base64Codec::DecodeUrl("-_8").output == "\xfb\xff");
        REQUIRE(Base64Codec::DecodeUrl("-_8=").output == "\xfb\xff");
        REQUIRE(Base64Codec::DecodeUrl("aGVsbG8").output == "hello");
    }
}

TEST_CASE("Base64 rejects malformed input", "[base64]") {
    SECTION("Character outside the alphabet") {
        CodecResult result = Base64Codec::Decode("aGV*bG8=");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::InvalidEncoding);
        REQUIRE(result.error_message.find("offset 3") != std::string::npos);
    }

    SECTION("Length not a multiple of four") {
        CodecResult result = Base64Codec::Decode("aGVsbG8");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::InvalidEncoding);
    }

    SECTION("Padding in the middle") {
        REQUIRE(Base64Codec::Decode("aG=sbG8=").error == ToolErrorKind::InvalidEncoding);
    }

    SECTION("Too much padding") {
        REQUIRE(Base64Codec::Decode("aG===").error == ToolErrorKind::InvalidEncoding);
    }

    SECTION("Standard alphabet symbols in URL-safe mode") {
        REQUIRE_FALSE(Base64Codec::DecodeUrl("+/8=").success);
    }

    SECTION("Lone trailing symbol in URL-safe mode") {
        REQUIRE(Base64Codec::DecodeUrl("aGVsb").error == ToolErrorKind::InvalidEncoding);
    }
}

TEST_CASE("Base64 round trip keeps arbitrary bytes", "[base64]") {
    std::string bytes;
    for (int i = 0; i < 256; i++) {
        bytes += static_cast<char>(i);
    }

    CodecResult standard = Base64Codec::Decode(Base64Codec::Encode(bytes).output);
    REQUIRE(standard.success);
    REQUIRE(standard.output == bytes);

    CodecResult url = Base64Codec::DecodeUrl(Base64Codec::EncodeUrl(bytes).output);
    REQUIRE(url.success);
    REQUIRE(url.output == bytes);
}

TEST_CASE("UTF-8 validation", "[base64]") {
    REQUIRE(Base64Codec::IsValidUtf8("plain ascii"));
    REQUIRE(Base64Codec::IsValidUtf8("caf\xc3\xa9"));
    REQUIRE(Base64Codec::IsValidUtf8("\xf0\x9f\x98\x80"));
    REQUIRE_FALSE(Base64Codec::IsValidUtf8("\xc3"));
    REQUIRE_FALSE(Base64Codec::IsValidUtf8("\xc0\xaf"));      // overlong
    REQUIRE_FALSE(Base64Codec::IsValidUtf8("\xed\xa0\x80"));  // surrogate
}
