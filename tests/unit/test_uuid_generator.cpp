#include <catch2/catch_test_macros.hpp>
#include <qdevkit/uuid_generator.h>
#include <cctype>
#include <set>

using qdevkit::Uuid;
using qdevkit::UuidGenerator;
using qdevkit::UuidOptions;
using qdevkit::UuidResult;

static bool IsCanonical(const std::string& text) {
    if (text.size() != 36) return false;
    for (size_t i = 0; i < text.size(); i++) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(text[i])) ||
                   std::isupper(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

TEST_CASE("UUID v4 layout", "[uuid]") {
    for (int i = 0; i < 100; i++) {
        Uuid uuid = UuidGenerator::GenerateV4();
        REQUIRE(uuid.Version() == 4);
        REQUIRE(uuid.Variant() == 2);

        std::string text = uuid.ToString();
        REQUIRE(IsCanonical(text));
        REQUIRE(text[14] == '4');
        REQUIRE(std::string("89ab").find(text[19]) != std::string::npos);
    }
}

TEST_CASE("UUID v4 values are distinct", "[uuid]") {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; i++) {
        seen.insert(UuidGenerator::GenerateV4().ToString());
    }
    REQUIRE(seen.size() == 1000);
}

TEST_CASE("UUID v7 layout", "[uuid]") {
    const uint64_t ms = 1700000000123ULL;
    Uuid uuid = UuidGenerator::GenerateV7At(ms);

    REQUIRE(uuid.Version() == 7);
    REQUIRE(uuid.Variant() == 2);
    REQUIRE(uuid.TimestampMs() == ms);
    REQUIRE(uuid.ToString().substr(0, 13) == "018bcfe5-687b");
}

TEST_CASE("UUID v7 orders by timestamp", "[uuid]") {
    Uuid earlier = UuidGenerator::GenerateV7At(1700000000000ULL);
    Uuid later = UuidGenerator::GenerateV7At(1700000000001ULL);

    REQUIRE(earlier < later);
    REQUIRE(earlier.ToString() < later.ToString());

    // Current-time v7 ids carry the clock reading
    Uuid now = UuidGenerator::GenerateV7();
    REQUIRE(now.TimestampMs() > 1700000000000ULL);
}

TEST_CASE("UUID parsing and formatting", "[uuid]") {
    auto parsed = Uuid::Parse("550E8400-E29B-41D4-A716-446655440000");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->ToString() == "550e8400-e29b-41d4-a716-446655440000");
    REQUIRE(parsed->Version() == 4);

    REQUIRE(UuidGenerator::Format(*parsed, true, false) == "550E8400E29B41D4A716446655440000");
    REQUIRE(Uuid::Parse("550e8400e29b41d4a716446655440000") == parsed);

    REQUIRE_FALSE(Uuid::Parse("550e8400-e29b-41d4-a716").has_value());
    REQUIRE_FALSE(Uuid::Parse("550e8400-e29b-41d4-a716-44665544000g").has_value());
    REQUIRE_FALSE(Uuid::Parse("550e8400e-29b-41d4-a716-446655440000").has_value());
}

TEST_CASE("UUID batch generation", "[uuid]") {
    SECTION("Options are applied") {
        UuidOptions options;
        options.version = 7;
        options.quantity = 5;
        options.uppercase = true;
        options.with_dashes = false;

        UuidResult result = UuidGenerator::Generate(options);
        REQUIRE(result.success);
        REQUIRE(result.uuids.size() == 5);
        for (const auto& text : result.uuids) {
            REQUIRE(text.size() == 32);
            REQUIRE(text[12] == '7');
            REQUIRE(text.find_first_of("abcdef-") == std::string::npos);
        }
    }

    SECTION("Quantity limits") {
        UuidOptions options;
        options.quantity = 0;
        REQUIRE_FALSE(UuidGenerator::Generate(options).success);

        options.quantity = UuidGenerator::kMaxQuantity + 1;
        REQUIRE_FALSE(UuidGenerator::Generate(options).success);

        options.quantity = UuidGenerator::kMaxQuantity;
        REQUIRE(UuidGenerator::Generate(options).uuids.size() == 1000);
    }

    SECTION("Unknown version") {
        UuidOptions options;
        options.version = 5;
        UuidResult result = UuidGenerator::Generate(options);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == qdevkit::ToolErrorKind::InvalidArgument);
    }
}
