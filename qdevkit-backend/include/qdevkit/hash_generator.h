#pragma once

#include "api_export.h"
#include "tool_error.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qdevkit {

enum class HashAlgorithm {
    MD5,
    SHA1,
    SHA256,
    SHA512
};

// Hash Result
struct QDEVKIT_API HashResult {
    size_t input_size = 0;              // Size in bytes
    std::string md5_hash;
    std::string sha1_hash;
    std::string sha256_hash;
    std::string sha512_hash;
    std::string algorithm;              // Normalized name: "md5", ..., "all"
    double compute_time_ms = 0.0;       // Time to compute
    bool success = false;
    ToolErrorKind error = ToolErrorKind::None;
    std::string error_message;

    // Digest for one algorithm (empty if it was not computed)
    const std::string& Digest(HashAlgorithm algorithm) const;
};

// Hash verification result
struct QDEVKIT_API HashVerifyResult {
    bool matches = false;
    std::string algorithm;              // Detected from the expected digest length
    std::string computed_hash;
    bool success = false;
    ToolErrorKind error = ToolErrorKind::None;
    std::string error_message;
};

class QDEVKIT_API HashGenerator {
public:
    /**
     * Compute digests of text
     * @param text Input bytes
     * @param algorithm "md5", "sha1", "sha256", "sha512" or "all" (dashes and
     *        case are ignored, so "SHA-256" is accepted)
     * @return HashResult, UnsupportedAlgorithm for any other name
     */
    static HashResult HashText(const std::string& text, const std::string& algorithm = "sha256");

    // Single algorithm, lowercase hex
    static std::string ComputeDigest(const std::string& data, HashAlgorithm algorithm);

    /**
     * Verify a digest; the algorithm is inferred from the digest length
     * (32 MD5, 40 SHA-1, 64 SHA-256, 128 SHA-512). Comparison ignores case.
     */
    static HashVerifyResult VerifyHash(const std::string& text, const std::string& expected_hash);

    static std::optional<HashAlgorithm> ParseAlgorithm(const std::string& name);
    static const char* AlgorithmName(HashAlgorithm algorithm);      // "md5"
    static const char* AlgorithmLabel(HashAlgorithm algorithm);     // "MD5", "SHA-256"
    static size_t DigestHexLength(HashAlgorithm algorithm);
    static std::vector<HashAlgorithm> AllAlgorithms();

private:
    static std::string BytesToHex(const unsigned char* bytes, size_t length);
};

} // namespace qdevkit
