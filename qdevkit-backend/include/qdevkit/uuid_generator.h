#pragma once

#include "api_export.h"
#include "tool_error.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qdevkit {

// 128-bit identifier, bytes in network (big-endian) order
struct QDEVKIT_API Uuid {
    std::array<uint8_t, 16> bytes{};

    int Version() const { return bytes[6] >> 4; }

    // Top two bits of byte 8 (binary 10 for RFC 4122 / RFC 9562 ids)
    int Variant() const { return bytes[8] >> 6; }

    // 48-bit Unix millisecond prefix (meaningful for version 7 only)
    uint64_t TimestampMs() const;

    // Canonical lowercase 8-4-4-4-12 form
    std::string ToString() const;

    // Accepts the dashed form or 32 bare hex digits, either case
    static std::optional<Uuid> Parse(const std::string& text);

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return bytes != other.bytes; }
    bool operator<(const Uuid& other) const { return bytes < other.bytes; }
};

struct QDEVKIT_API UuidOptions {
    int version = 4;            // 4 (random) or 7 (time-ordered)
    int quantity = 1;           // 1..1000
    bool uppercase = false;
    bool with_dashes = true;
};

// UUID batch result
struct QDEVKIT_API UuidResult {
    std::vector<std::string> uuids;
    int version = 4;
    bool success = false;
    ToolErrorKind error = ToolErrorKind::None;
    std::string error_message;
};

class QDEVKIT_API UuidGenerator {
public:
    static constexpr int kMaxQuantity = 1000;

    /**
     * Generate a random UUID (version 4, RFC 4122)
     * @return Uuid with version nibble 4 and variant bits 10
     */
    static Uuid GenerateV4();

    /**
     * Generate a time-ordered UUID (version 7, RFC 9562) from the system clock
     * @return Uuid whose first 48 bits are the current Unix time in ms
     */
    static Uuid GenerateV7();

    /**
     * Generate a version 7 UUID for an explicit timestamp
     * @param unix_ms Milliseconds since the Unix epoch (truncated to 48 bits)
     */
    static Uuid GenerateV7At(uint64_t unix_ms);

    /**
     * Generate a batch of formatted UUIDs
     * @param options Version, quantity and formatting flags
     * @return UuidResult with one string per generated id
     */
    static UuidResult Generate(const UuidOptions& options);

    // Render with optional uppercase hex and dash removal
    static std::string Format(const Uuid& uuid, bool uppercase, bool with_dashes);
};

} // namespace qdevkit
