#include <qdevkit/jwt_decoder.h>
#include <qdevkit/base64_codec.h>
#include <qdevkit/timestamp_converter.h>
#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace qdevkit {

using jwt_traits = jwt::traits::nlohmann_json;

namespace {

std::string Trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    return text.substr(start, end - start);
}

JwtDecodeResult TokenError(const std::string& message) {
    JwtDecodeResult result;
    result.error = ToolErrorKind::MalformedToken;
    result.error_message = message;
    return result;
}

// Base64url-decode one segment and parse it as a JSON object
bool DecodeSegment(const std::string& segment, const char* name,
                   nlohmann::ordered_json& out, std::string& error) {
    CodecResult raw = Base64Codec::DecodeUrl(segment);
    if (!raw.success) {
        error = std::string("Invalid JWT ") + name + ": " + raw.error_message;
        return false;
    }

    try {
        out = nlohmann::ordered_json::parse(raw.output);
    } catch (const nlohmann::json::parse_error& e) {
        error = std::string("Invalid JWT ") + name + ": not valid JSON (" + e.what() + ")";
        return false;
    }

    if (!out.is_object()) {
        error = std::string("Invalid JWT ") + name + ": expected a JSON object";
        return false;
    }
    return true;
}

// 0001-01-01T00:00:00Z .. 9999-12-31T23:59:59Z
constexpr int64_t kMinClaimSeconds = -62135596800LL;
constexpr int64_t kMaxClaimSeconds = 253402300799LL;

// NumericDate claims may be integers or fractional seconds
template <typename Json>
std::optional<int64_t> NumericDate(const Json& value) {
    if (value.is_number_integer()) {
        return value.template get<int64_t>();
    }
    if (value.is_number_float()) {
        double seconds = value.template get<double>();
        if (std::isfinite(seconds) && std::fabs(seconds) < 1e15) {
            return static_cast<int64_t>(std::floor(seconds));
        }
    }
    return std::nullopt;
}

template <typename Json>
std::optional<std::string> StringClaim(const Json& payload, const char* key) {
    auto it = payload.find(key);
    if (it != payload.end() && it->is_string()) {
        return it->template get<std::string>();
    }
    return std::nullopt;
}

std::string FormatClaimDate(int64_t seconds) {
    // Beyond year 9999 the millisecond count would not fit; show the raw value
    if (seconds > kMaxClaimSeconds || seconds < kMinClaimSeconds) {
        return std::to_string(seconds);
    }
    TimestampResult ts = TimestampConverter::FromEpochMillis(seconds * 1000);
    return ts.success ? ts.utc : std::to_string(seconds);
}

// Registered claims straight from the parsed payload, used when jwt-cpp
// refuses the token (for example a signature segment that is not base64url)
void ReadClaims(const nlohmann::ordered_json& payload, JwtDecodeResult& result) {
    result.issuer = StringClaim(payload, "iss");
    result.subject = StringClaim(payload, "sub");
    result.jwt_id = StringClaim(payload, "jti");

    auto aud = payload.find("aud");
    if (aud != payload.end()) {
        if (aud->is_string()) {
            result.audience.push_back(aud->get<std::string>());
        } else if (aud->is_array()) {
            for (const auto& entry : *aud) {
                if (entry.is_string()) result.audience.push_back(entry.get<std::string>());
            }
        }
    }

    auto date = [&](const char* key) -> std::optional<int64_t> {
        auto it = payload.find(key);
        return it != payload.end() ? NumericDate(*it) : std::nullopt;
    };
    result.expires_at = date("exp");
    result.not_before = date("nbf");
    result.issued_at = date("iat");
}

void ReadClaims(const jwt::decoded_jwt<jwt_traits>& decoded, JwtDecodeResult& result) {
    if (decoded.has_issuer()) result.issuer = decoded.get_issuer();
    if (decoded.has_subject()) result.subject = decoded.get_subject();
    if (decoded.has_id()) result.jwt_id = decoded.get_id();

    if (decoded.has_audience()) {
        for (const auto& aud : decoded.get_audience()) {
            result.audience.push_back(aud);
        }
    }

    if (decoded.has_expires_at()) result.expires_at = NumericDate(decoded.get_payload_claim("exp").to_json());
    if (decoded.has_not_before()) result.not_before = NumericDate(decoded.get_payload_claim("nbf").to_json());
    if (decoded.has_issued_at()) result.issued_at = NumericDate(decoded.get_payload_claim("iat").to_json());
}

} // namespace

std::vector<std::string> JwtDecoder::SplitSegments(const std::string& token) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t dot = token.find('.', start);
        if (dot == std::string::npos) {
            segments.push_back(token.substr(start));
            break;
        }
        segments.push_back(token.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

JwtDecodeResult JwtDecoder::Decode(const std::string& token) {
    std::string compact = Trim(token);
    if (compact.empty()) {
        return TokenError("Invalid JWT format: token is empty");
    }

    std::vector<std::string> segments = SplitSegments(compact);
    if (segments.size() != 3) {
        return TokenError("Invalid JWT format. Expected 3 parts separated by dots, found " +
                          std::to_string(segments.size()));
    }

    nlohmann::ordered_json header;
    nlohmann::ordered_json payload;
    std::string error;

    if (!DecodeSegment(segments[0], "header", header, error) ||
        !DecodeSegment(segments[1], "payload", payload, error)) {
        return TokenError(error);
    }

    JwtDecodeResult result;
    result.header_json = header.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    result.payload_json = payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    result.signature = segments[2];

    if (auto alg = StringClaim(header, "alg")) result.algorithm = *alg;
    if (auto typ = StringClaim(header, "typ")) result.type = *typ;

    try {
        auto decoded = jwt::decode<jwt_traits>(compact);
        ReadClaims(decoded, result);
    } catch (const std::exception& e) {
        spdlog::debug("jwt-cpp could not decode token ({}), reading raw payload claims", e.what());
        result.issuer.reset();
        result.subject.reset();
        result.jwt_id.reset();
        result.audience.clear();
        ReadClaims(payload, result);
    }

    int64_t now = TimestampConverter::CurrentUnixSeconds();
    result.is_expired = result.expires_at.has_value() && *result.expires_at < now;

    // Display rows
    result.info.emplace_back("Algorithm", result.algorithm);
    result.info.emplace_back("Type", result.type);
    if (result.issuer) result.info.emplace_back("Issuer", *result.issuer);
    if (result.subject) result.info.emplace_back("Subject", *result.subject);
    if (!result.audience.empty()) {
        std::string joined;
        for (const auto& aud : result.audience) {
            if (!joined.empty()) joined += ", ";
            joined += aud;
        }
        result.info.emplace_back("Audience", joined);
    }
    if (result.expires_at) {
        result.info.emplace_back("Expires", FormatClaimDate(*result.expires_at) +
                                            (result.is_expired ? " (expired)" : ""));
    }
    if (result.not_before) result.info.emplace_back("Not Before", FormatClaimDate(*result.not_before));
    if (result.issued_at) result.info.emplace_back("Issued At", FormatClaimDate(*result.issued_at));
    if (result.jwt_id) result.info.emplace_back("JWT ID", *result.jwt_id);

    spdlog::debug("Decoded JWT alg={} typ={} ({} claims)", result.algorithm, result.type, payload.size());

    result.success = true;
    return result;
}

} // namespace qdevkit
