#include <catch2/catch_test_macros.hpp>
#include <qdevkit/jwt_decoder.h>
#include <cstdint>

using qdevkit::JwtDecodeResult;
using qdevkit::JwtDecoder;
using qdevkit::ToolErrorKind;

namespace {

const std::string kHeader = "eyJhbGciOiJIUzI1NiIsInR5cCI6IkpXVCJ9";
const std::string kSignature = "SflKxwRJSMeKKF2QT4fwpMeJf36POk6yJV_adQssw5c";

// {"sub":"1234567890","name":"John Doe","iat":1516239022}
const std::string kBasicPayload =
    "eyJzdWIiOiIxMjM0NTY3ODkwIiwibmFtZSI6IkpvaG4gRG9lIiwiaWF0IjoxNTE2MjM5MDIyfQ";

// {"iss":"https://auth.example.com","aud":["api","web"],"exp":1000000000,
//  "nbf":999999000.5,"jti":"abc-123"}
const std::string kExpiredPayload =
    "eyJpc3MiOiJodHRwczovL2F1dGguZXhhbXBsZS5jb20iLCJhdWQiOlsiYXBpIiwid2ViIl0sImV4cCI6"
    "MTAwMDAwMDAwMCwibmJmIjo5OTk5OTkwMDAuNSwianRpIjoiYWJjLTEyMyJ9";

// {"sub":"user","exp":4102444800}
const std::string kFuturePayload = "eyJzdWIiOiJ1c2VyIiwiZXhwIjo0MTAyNDQ0ODAwfQ";

// {"sub":"user","exp":9223372036854775807,"iat":-9223372036854775807}
const std::string kHugeDatesPayload =
    "eyJzdWIiOiJ1c2VyIiwiZXhwIjo5MjIzMzcyMDM2ODU0Nzc1ODA3LCJpYXQiOi05MjIzMzcyMDM2ODU0Nzc1ODA3fQ";

std::string FindInfo(const JwtDecodeResult& result, const std::string& label) {
    for (const auto& [name, value] : result.info) {
        if (name == label) return value;
    }
    return std::string();
}

} // namespace

TEST_CASE("JWT decoding", "[jwt]") {
    JwtDecodeResult result = JwtDecoder::Decode(kHeader + "." + kBasicPayload + "." + kSignature);

    REQUIRE(result.success);
    REQUIRE(result.algorithm == "HS256");
    REQUIRE(result.type == "JWT");
    REQUIRE(result.header_json == "{\n  \"alg\": \"HS256\",\n  \"typ\": \"JWT\"\n}");
    REQUIRE(result.payload_json ==
            "{\n  \"sub\": \"1234567890\",\n  \"name\": \"John Doe\",\n  \"iat\": 1516239022\n}");
    REQUIRE(result.signature == kSignature);
    REQUIRE_FALSE(result.signature_verified);

    REQUIRE(result.subject == std::string("1234567890"));
    REQUIRE(result.issued_at == 1516239022);
    REQUIRE_FALSE(result.expires_at.has_value());
    REQUIRE_FALSE(result.is_expired);
    REQUIRE(FindInfo(result, "Issued At") == "2018-01-18 01:30:22 UTC");
}

TEST_CASE("JWT registered claims", "[jwt]") {
    SECTION("Expired token with audience list and fractional dates") {
        JwtDecodeResult result = JwtDecoder::Decode(kHeader + "." + kExpiredPayload + "." + kSignature);
        REQUIRE(result.success);
        REQUIRE(result.issuer == std::string("https://auth.example.com"));
        REQUIRE(result.audience.size() == 2);
        REQUIRE(result.audience[1] == "web");
        REQUIRE(result.jwt_id == std::string("abc-123"));
        REQUIRE(result.expires_at == 1000000000);
        REQUIRE(result.not_before == 999999000);
        REQUIRE(result.is_expired);

        REQUIRE(FindInfo(result, "Audience") == "api, web");
        REQUIRE(FindInfo(result, "Expires") == "2001-09-09 01:46:40 UTC (expired)");
        REQUIRE(FindInfo(result, "Not Before") == "2001-09-09 01:30:00 UTC");
    }

    SECTION("Token valid until 2100") {
        JwtDecodeResult result = JwtDecoder::Decode(kHeader + "." + kFuturePayload + "." + kSignature);
        REQUIRE(result.success);
        REQUIRE_FALSE(result.is_expired);
        REQUIRE(FindInfo(result, "Expires") == "2100-01-01 00:00:00 UTC");
    }

    SECTION("Missing alg and typ") {
        // {"alg":"none"} header, no typ
        JwtDecodeResult result = JwtDecoder::Decode("eyJhbGciOiJub25lIn0." + kBasicPayload + ".");
        REQUIRE(result.success);
        REQUIRE(result.algorithm == "none");
        REQUIRE(result.type == "N/A");
        REQUIRE(result.signature.empty());
    }

    SECTION("Claims with unexpected types are skipped") {
        // {"iss":42,"sub":"s"}
        JwtDecodeResult result = JwtDecoder::Decode(kHeader + ".eyJpc3MiOjQyLCJzdWIiOiJzIn0." + kSignature);
        REQUIRE(result.success);
        REQUIRE_FALSE(result.issuer.has_value());
        REQUIRE(result.subject == std::string("s"));
    }

    SECTION("Surrounding whitespace is ignored") {
        JwtDecodeResult result = JwtDecoder::Decode("  " + kHeader + "." + kBasicPayload + "." + kSignature + "\n");
        REQUIRE(result.success);
    }
}

TEST_CASE("JWT dates outside the calendar range show the raw value", "[jwt]") {
    JwtDecodeResult result = JwtDecoder::Decode(kHeader + "." + kHugeDatesPayload + "." + kSignature);

    REQUIRE(result.success);
    REQUIRE(result.expires_at == INT64_C(9223372036854775807));
    REQUIRE_FALSE(result.is_expired);
    REQUIRE(FindInfo(result, "Expires") == "9223372036854775807");
    REQUIRE(FindInfo(result, "Issued At") == "-9223372036854775807");
}

TEST_CASE("Malformed JWTs", "[jwt]") {
    SECTION("Two segments") {
        JwtDecodeResult result = JwtDecoder::Decode("abc.def");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::MalformedToken);
        REQUIRE(result.error_message.find("found 2") != std::string::npos);
    }

    SECTION("Four segments") {
        REQUIRE(JwtDecoder::Decode("a.b.c.d").error == ToolErrorKind::MalformedToken);
    }

    SECTION("Empty token") {
        REQUIRE(JwtDecoder::Decode("   ").error == ToolErrorKind::MalformedToken);
    }

    SECTION("Header is not base64url") {
        JwtDecodeResult result = JwtDecoder::Decode("a*b." + kBasicPayload + "." + kSignature);
        REQUIRE(result.error == ToolErrorKind::MalformedToken);
        REQUIRE(result.error_message.find("Invalid JWT header") == 0);
    }

    SECTION("Payload is not JSON") {
        // "not json"
        JwtDecodeResult result = JwtDecoder::Decode(kHeader + ".bm90IGpzb24." + kSignature);
        REQUIRE(result.error == ToolErrorKind::MalformedToken);
        REQUIRE(result.error_message.find("Invalid JWT payload") == 0);
    }

    SECTION("Payload is JSON but not an object") {
        // [1,2]
        JwtDecodeResult result = JwtDecoder::Decode(kHeader + ".WzEsMl0." + kSignature);
        REQUIRE(result.error == ToolErrorKind::MalformedToken);
    }
}

TEST_CASE("JWT segment splitting keeps empty parts", "[jwt]") {
    auto segments = JwtDecoder::SplitSegments("a..c");
    REQUIRE(segments.size() == 3);
    REQUIRE(segments[1].empty());
    REQUIRE(JwtDecoder::SplitSegments("").size() == 1);
}
