#pragma once

#include "api_export.h"
#include "tool_error.h"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qdevkit {

// Decoded JWT. Nothing here is verified: the signature segment is reported
// verbatim and signature_verified is always false.
struct QDEVKIT_API JwtDecodeResult {
    std::string header_json;            // Pretty-printed header object
    std::string payload_json;           // Pretty-printed payload object
    std::string signature;              // Raw base64url signature segment

    std::string algorithm = "N/A";      // header.alg
    std::string type = "N/A";           // header.typ
    std::optional<std::string> issuer;
    std::optional<std::string> subject;
    std::vector<std::string> audience;
    std::optional<int64_t> expires_at;  // Unix seconds
    std::optional<int64_t> not_before;
    std::optional<int64_t> issued_at;
    std::optional<std::string> jwt_id;
    bool is_expired = false;
    bool signature_verified = false;

    // Label/value rows for display ("Issuer", "https://...")
    std::vector<std::pair<std::string, std::string>> info;

    bool success = false;
    ToolErrorKind error = ToolErrorKind::None;
    std::string error_message;
};

class QDEVKIT_API JwtDecoder {
public:
    /**
     * Structurally decode a JWT without verifying it
     * @param token Compact serialization header.payload.signature
     * @return JwtDecodeResult, MalformedToken naming the failing segment
     */
    static JwtDecodeResult Decode(const std::string& token);

    // Split on '.', keeping empty segments
    static std::vector<std::string> SplitSegments(const std::string& token);
};

} // namespace qdevkit
