#include <qdevkit/uuid_generator.h>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <spdlog/spdlog.h>

namespace qdevkit {

namespace {

std::mt19937_64& RandomEngine() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    return gen;
}

void FillRandom(Uuid& uuid, size_t first_byte) {
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t part1 = dist(RandomEngine());
    uint64_t part2 = dist(RandomEngine());

    for (size_t i = first_byte; i < 16; i++) {
        uint64_t& source = (i < 8) ? part1 : part2;
        uuid.bytes[i] = static_cast<uint8_t>(source >> (8 * (i % 8)));
    }
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// ============================================================================
// Uuid
// ============================================================================

uint64_t Uuid::TimestampMs() const {
    uint64_t ms = 0;
    for (int i = 0; i < 6; i++) {
        ms = (ms << 8) | bytes[i];
    }
    return ms;
}

std::string Uuid::ToString() const {
    return UuidGenerator::Format(*this, false, true);
}

std::optional<Uuid> Uuid::Parse(const std::string& text) {
    std::string hex;
    hex.reserve(32);

    if (text.size() == 36) {
        for (size_t i = 0; i < text.size(); i++) {
            bool dash_slot = (i == 8 || i == 13 || i == 18 || i == 23);
            if (dash_slot != (text[i] == '-')) {
                return std::nullopt;
            }
            if (!dash_slot) hex.push_back(text[i]);
        }
    } else if (text.size() == 32) {
        hex = text;
    } else {
        return std::nullopt;
    }

    Uuid uuid;
    for (size_t i = 0; i < 16; i++) {
        int hi = HexValue(hex[2 * i]);
        int lo = HexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        uuid.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return uuid;
}

// ============================================================================
// UuidGenerator
// ============================================================================

Uuid UuidGenerator::GenerateV4() {
    Uuid uuid;
    FillRandom(uuid, 0);

    // xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y in {8, 9, a, b}
    uuid.bytes[6] = static_cast<uint8_t>((uuid.bytes[6] & 0x0F) | 0x40);
    uuid.bytes[8] = static_cast<uint8_t>((uuid.bytes[8] & 0x3F) | 0x80);
    return uuid;
}

Uuid UuidGenerator::GenerateV7() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    return GenerateV7At(static_cast<uint64_t>(ms));
}

Uuid UuidGenerator::GenerateV7At(uint64_t unix_ms) {
    Uuid uuid;
    FillRandom(uuid, 6);

    // 48-bit big-endian timestamp in bytes 0-5
    for (int i = 0; i < 6; i++) {
        uuid.bytes[i] = static_cast<uint8_t>(unix_ms >> (8 * (5 - i)));
    }

    uuid.bytes[6] = static_cast<uint8_t>((uuid.bytes[6] & 0x0F) | 0x70);
    uuid.bytes[8] = static_cast<uint8_t>((uuid.bytes[8] & 0x3F) | 0x80);
    return uuid;
}

UuidResult UuidGenerator::Generate(const UuidOptions& options) {
    UuidResult result;
    result.version = options.version;

    if (options.version != 4 && options.version != 7) {
        result.error = ToolErrorKind::InvalidArgument;
        result.error_message = "Unsupported UUID version " + std::to_string(options.version) +
                               " (expected 4 or 7)";
        return result;
    }

    if (options.quantity < 1 || options.quantity > kMaxQuantity) {
        result.error = ToolErrorKind::InvalidArgument;
        result.error_message = "Quantity must be between 1 and " + std::to_string(kMaxQuantity);
        return result;
    }

    result.uuids.reserve(options.quantity);
    for (int i = 0; i < options.quantity; i++) {
        Uuid uuid = (options.version == 7) ? GenerateV7() : GenerateV4();
        result.uuids.push_back(Format(uuid, options.uppercase, options.with_dashes));
    }

    spdlog::debug("Generated {} UUID v{}", options.quantity, options.version);
    result.success = true;
    return result;
}

std::string UuidGenerator::Format(const Uuid& uuid, bool uppercase, bool with_dashes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    if (uppercase) {
        oss << std::uppercase;
    }

    for (size_t i = 0; i < uuid.bytes.size(); i++) {
        if (with_dashes && (i == 4 || i == 6 || i == 8 || i == 10)) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(uuid.bytes[i]);
    }

    return oss.str();
}

} // namespace qdevkit
