#include <catch2/catch_test_macros.hpp>
#include <qdevkit/url_codec.h>

using qdevkit::CodecResult;
using qdevkit::ToolErrorKind;
using qdevkit::UrlCodec;

TEST_CASE("URL encoding", "[url]") {
    SECTION("Reserved characters are escaped") {
        REQUIRE(UrlCodec::Encode("a b&c").output == "a%20b%26c");
        REQUIRE(UrlCodec::Encode("key=value/path?x").output == "key%3Dvalue%2Fpath%3Fx");
    }

    SECTION("Unreserved characters pass through") {
        REQUIRE(UrlCodec::Encode("AZaz09-_.~").output == "AZaz09-_.~");
    }

    SECTION("UTF-8 bytes use uppercase hex") {
        REQUIRE(UrlCodec::Encode("caf\xc3\xa9").output == "caf%C3%A9");
    }

    SECTION("Form encoding uses '+' for spaces") {
        REQUIRE(UrlCodec::Encode("a b", true).output == "a+b");
        REQUIRE(UrlCodec::Encode("a+b", true).output == "a%2Bb");
    }
}

TEST_CASE("URL decoding", "[url]") {
    SECTION("Percent escapes in either case") {
        REQUIRE(UrlCodec::Decode("a%20b%26c").output == "a b&c");
        REQUIRE(UrlCodec::Decode("caf%c3%a9").output == "caf\xc3\xa9");
    }

    SECTION("'+' is literal unless form decoding") {
        REQUIRE(UrlCodec::Decode("a+b").output == "a+b");
        REQUIRE(UrlCodec::Decode("a+b", true).output == "a b");
    }

    SECTION("Round trip") {
        std::string text = "https://example.com/search?q=c++ & more";
        REQUIRE(UrlCodec::Decode(UrlCodec::Encode(text).output).output == text);
    }
}

TEST_CASE("URL decoding rejects malformed escapes", "[url]") {
    SECTION("Truncated escape") {
        CodecResult result = UrlCodec::Decode("abc%2");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::InvalidEncoding);
        REQUIRE(result.error_message.find("offset 3") != std::string::npos);
    }

    SECTION("Non-hex digits") {
        REQUIRE(UrlCodec::Decode("%zz").error == ToolErrorKind::InvalidEncoding);
    }

    SECTION("Bare percent sign") {
        REQUIRE_FALSE(UrlCodec::Decode("100%").success);
    }
}
