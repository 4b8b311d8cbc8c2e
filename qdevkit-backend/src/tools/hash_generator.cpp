#include <qdevkit/hash_generator.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <memory>
#include <sstream>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace qdevkit {

static std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static const EVP_MD* digest_for(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD5:    return EVP_md5();
        case HashAlgorithm::SHA1:   return EVP_sha1();
        case HashAlgorithm::SHA256: return EVP_sha256();
        case HashAlgorithm::SHA512: return EVP_sha512();
    }
    return nullptr;
}

const std::string& HashResult::Digest(HashAlgorithm algorithm) const {
    switch (algorithm) {
        case HashAlgorithm::MD5:    return md5_hash;
        case HashAlgorithm::SHA1:   return sha1_hash;
        case HashAlgorithm::SHA256: return sha256_hash;
        case HashAlgorithm::SHA512: return sha512_hash;
    }
    return sha256_hash;
}

// ============================================================================
// Algorithm metadata
// ============================================================================

std::optional<HashAlgorithm> HashGenerator::ParseAlgorithm(const std::string& name) {
    std::string key = to_lower(name);
    key.erase(std::remove(key.begin(), key.end(), '-'), key.end());

    if (key == "md5") return HashAlgorithm::MD5;
    if (key == "sha1") return HashAlgorithm::SHA1;
    if (key == "sha256") return HashAlgorithm::SHA256;
    if (key == "sha512") return HashAlgorithm::SHA512;
    return std::nullopt;
}

const char* HashGenerator::AlgorithmName(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD5:    return "md5";
        case HashAlgorithm::SHA1:   return "sha1";
        case HashAlgorithm::SHA256: return "sha256";
        case HashAlgorithm::SHA512: return "sha512";
    }
    return "unknown";
}

const char* HashGenerator::AlgorithmLabel(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD5:    return "MD5";
        case HashAlgorithm::SHA1:   return "SHA-1";
        case HashAlgorithm::SHA256: return "SHA-256";
        case HashAlgorithm::SHA512: return "SHA-512";
    }
    return "Unknown";
}

size_t HashGenerator::DigestHexLength(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD5:    return 32;
        case HashAlgorithm::SHA1:   return 40;
        case HashAlgorithm::SHA256: return 64;
        case HashAlgorithm::SHA512: return 128;
    }
    return 0;
}

std::vector<HashAlgorithm> HashGenerator::AllAlgorithms() {
    return {
        HashAlgorithm::MD5,
        HashAlgorithm::SHA1,
        HashAlgorithm::SHA256,
        HashAlgorithm::SHA512
    };
}

// ============================================================================
// Digest computation
// ============================================================================

std::string HashGenerator::BytesToHex(const unsigned char* bytes, size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; i++) {
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string HashGenerator::ComputeDigest(const std::string& data, HashAlgorithm algorithm) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), digest_for(algorithm), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        spdlog::error("OpenSSL digest failed for {}", AlgorithmLabel(algorithm));
        return std::string();
    }

    return BytesToHex(hash, hash_len);
}

HashResult HashGenerator::HashText(const std::string& text, const std::string& algorithm) {
    HashResult result;
    result.input_size = text.size();

    std::vector<HashAlgorithm> selected;
    if (to_lower(algorithm) == "all") {
        result.algorithm = "all";
        selected = AllAlgorithms();
    } else if (auto parsed = ParseAlgorithm(algorithm)) {
        result.algorithm = AlgorithmName(*parsed);
        selected.push_back(*parsed);
    } else {
        result.algorithm = algorithm;
        result.error = ToolErrorKind::UnsupportedAlgorithm;
        result.error_message = "Unsupported hash algorithm: '" + algorithm +
                               "' (expected md5, sha1, sha256, sha512 or all)";
        return result;
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (HashAlgorithm alg : selected) {
        std::string digest = ComputeDigest(text, alg);
        if (digest.empty()) {
            result.error = ToolErrorKind::UnsupportedAlgorithm;
            result.error_message = std::string(AlgorithmLabel(alg)) +
                                   " is not available from the OpenSSL provider";
            return result;
        }

        switch (alg) {
            case HashAlgorithm::MD5:    result.md5_hash = digest; break;
            case HashAlgorithm::SHA1:   result.sha1_hash = digest; break;
            case HashAlgorithm::SHA256: result.sha256_hash = digest; break;
            case HashAlgorithm::SHA512: result.sha512_hash = digest; break;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    result.compute_time_ms = std::chrono::duration<double, std::milli>(end - start).count();

    result.success = true;
    return result;
}

HashVerifyResult HashGenerator::VerifyHash(const std::string& text, const std::string& expected_hash) {
    HashVerifyResult result;

    std::string expected = to_lower(expected_hash);
    expected.erase(std::remove_if(expected.begin(), expected.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   expected.end());

    bool is_hex = !expected.empty() &&
                  std::all_of(expected.begin(), expected.end(),
                              [](unsigned char c) { return std::isxdigit(c); });
    if (!is_hex) {
        result.error = ToolErrorKind::InvalidArgument;
        result.error_message = "Expected hash must be a hexadecimal string";
        return result;
    }

    std::optional<HashAlgorithm> algorithm;
    for (HashAlgorithm alg : AllAlgorithms()) {
        if (DigestHexLength(alg) == expected.size()) {
            algorithm = alg;
            break;
        }
    }

    if (!algorithm) {
        result.error = ToolErrorKind::InvalidArgument;
        result.error_message = "Invalid hash length. Expected 32 (MD5), 40 (SHA-1), "
                               "64 (SHA-256), or 128 (SHA-512) characters.";
        return result;
    }

    result.algorithm = AlgorithmName(*algorithm);
    result.computed_hash = ComputeDigest(text, *algorithm);
    result.matches = (result.computed_hash == expected);
    result.success = true;
    return result;
}

} // namespace qdevkit
