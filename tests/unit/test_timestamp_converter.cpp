#include <catch2/catch_test_macros.hpp>
#include <qdevkit/timestamp_converter.h>
#include <cstdint>

using qdevkit::CivilTime;
using qdevkit::TimestampConverter;
using qdevkit::TimestampResult;
using qdevkit::TimestampUnit;
using qdevkit::ToolErrorKind;

TEST_CASE("Timestamp to date", "[timestamp]") {
    SECTION("Seconds") {
        TimestampResult result = TimestampConverter::ToDate("1700000000");
        REQUIRE(result.success);
        REQUIRE(result.unit_used == TimestampUnit::Seconds);
        REQUIRE(result.epoch_seconds == 1700000000);
        REQUIRE(result.iso8601 == "2023-11-14T22:13:20Z");
        REQUIRE(result.utc == "2023-11-14 22:13:20 UTC");
        REQUIRE(result.rfc2822 == "Tue, 14 Nov 2023 22:13:20 GMT");
        REQUIRE(result.date_only == "2023-11-14");
        REQUIRE(result.day_first == "14/11/2023 22:13:20");
        REQUIRE(result.long_form == "Tuesday, November 14, 2023");
    }

    SECTION("Milliseconds detected automatically") {
        TimestampResult result = TimestampConverter::ToDate("1700000000123");
        REQUIRE(result.success);
        REQUIRE(result.unit_used == TimestampUnit::Milliseconds);
        REQUIRE(result.epoch_millis == 1700000000123);
        REQUIRE(result.iso8601 == "2023-11-14T22:13:20.123Z");
    }

    SECTION("Explicit unit overrides detection") {
        TimestampResult result = TimestampConverter::ToDate("1700000000", TimestampUnit::Milliseconds);
        REQUIRE(result.success);
        REQUIRE(result.iso8601 == "1970-01-20T16:13:20Z");
    }

    SECTION("Fractional and negative seconds") {
        REQUIRE(TimestampConverter::ToDate("1.5").iso8601 == "1970-01-01T00:00:01.500Z");
        TimestampResult before_epoch = TimestampConverter::ToDate("-1");
        REQUIRE(before_epoch.iso8601 == "1969-12-31T23:59:59Z");
        REQUIRE(before_epoch.epoch_seconds == -1);
    }

    SECTION("Surrounding whitespace") {
        REQUIRE(TimestampConverter::ToDate("  0 \n").iso8601 == "1970-01-01T00:00:00Z");
    }

    SECTION("Fixed UTC offset") {
        TimestampResult result = TimestampConverter::ToDate("1700000000", TimestampUnit::Auto, 330);
        REQUIRE(result.success);
        REQUIRE(result.epoch_seconds == 1700000000);
        REQUIRE(result.iso8601 == "2023-11-15T03:43:20+05:30");
        REQUIRE(result.rfc2822 == "Wed, 15 Nov 2023 03:43:20 +0530");
    }
}

TEST_CASE("Timestamp range limits", "[timestamp]") {
    SECTION("First and last supported seconds") {
        REQUIRE(TimestampConverter::ToDate("-62135596800", TimestampUnit::Seconds).iso8601 ==
                "0001-01-01T00:00:00Z");
        REQUIRE(TimestampConverter::ToDate("253402300799", TimestampUnit::Seconds).iso8601 ==
                "9999-12-31T23:59:59Z");
    }

    SECTION("Past year 9999") {
        TimestampResult result = TimestampConverter::ToDate("253402300800", TimestampUnit::Seconds);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::InvalidTimestamp);
    }

    SECTION("Millisecond value above the maximum") {
        TimestampResult result = TimestampConverter::ToDate("99999999999999");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message == "Timestamp value is too large");
    }
}

TEST_CASE("Epoch milliseconds near the integer limits", "[timestamp]") {
    SECTION("Values beyond year 9999 are rejected before the offset is applied") {
        TimestampResult result = TimestampConverter::FromEpochMillis(INT64_MAX, 60);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::InvalidTimestamp);

        result = TimestampConverter::FromEpochMillis(INT64_MIN, -60);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::InvalidTimestamp);
    }

    SECTION("Offsets wider than fourteen hours are rejected") {
        TimestampResult result = TimestampConverter::FromEpochMillis(0, 15 * 60);
        REQUIRE_FALSE(result.success);
    }

    SECTION("Last supported millisecond still converts") {
        TimestampResult result = TimestampConverter::FromEpochMillis(253402300799999LL);
        REQUIRE(result.success);
        REQUIRE(result.iso8601 == "9999-12-31T23:59:59.999Z");
    }
}

TEST_CASE("Invalid timestamps", "[timestamp]") {
    for (const char* input : { "", "abc", "12abc", "1e400", "nan", "0x10" }) {
        TimestampResult result = TimestampConverter::ToDate(input);
        INFO("input: " << input);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::InvalidTimestamp);
    }
}

TEST_CASE("Date to timestamp", "[timestamp]") {
    SECTION("Supported layouts") {
        REQUIRE(TimestampConverter::FromDate("2024-01-15").epoch_seconds == 1705276800);
        REQUIRE(TimestampConverter::FromDate("2024-01-15 14:30:00").epoch_seconds == 1705329000);
        REQUIRE(TimestampConverter::FromDate("2024/01/15 14:30:00").epoch_seconds == 1705329000);
        REQUIRE(TimestampConverter::FromDate("15/01/2024").epoch_seconds == 1705276800);
        REQUIRE(TimestampConverter::FromDate("15-01-2024 14:30:00").epoch_seconds == 1705329000);
        REQUIRE(TimestampConverter::FromDate("January 15, 2024").epoch_seconds == 1705276800);
        REQUIRE(TimestampConverter::FromDate("jan 15, 2024 14:30:00").epoch_seconds == 1705329000);
    }

    SECTION("ISO 8601") {
        REQUIRE(TimestampConverter::FromDate("2024-01-15T14:30:00Z").epoch_seconds == 1705329000);
        REQUIRE(TimestampConverter::FromDate("2024-01-15T14:30").epoch_seconds == 1705329000);

        TimestampResult with_ms = TimestampConverter::FromDate("2024-01-15T14:30:00.250Z");
        REQUIRE(with_ms.epoch_millis == 1705329000250);
    }

    SECTION("Offset in the input wins over the selected zone") {
        TimestampResult result = TimestampConverter::FromDate("2024-01-15T14:30:00+05:30", 60);
        REQUIRE(result.success);
        REQUIRE(result.epoch_seconds == 1705309200);
        REQUIRE(result.utc_offset_minutes == 330);
    }

    SECTION("Naive dates use the selected zone") {
        REQUIRE(TimestampConverter::FromDate("2024-01-15 14:30:00", 60).epoch_seconds == 1705325400);
    }

    SECTION("Leap days") {
        REQUIRE(TimestampConverter::FromDate("2000-02-29").epoch_seconds == 951782400);
        REQUIRE_FALSE(TimestampConverter::FromDate("2023-02-29").success);
    }

    SECTION("Unparseable or impossible dates") {
        for (const char* input : { "", "not a date", "2024-13-01", "2024-01-15 25:00:00", "2024-01-15T14:30:00+99:00" }) {
            TimestampResult result = TimestampConverter::FromDate(input);
            INFO("input: " << input);
            REQUIRE_FALSE(result.success);
            REQUIRE(result.error == ToolErrorKind::InvalidTimestamp);
        }
    }
}

TEST_CASE("UTC offsets", "[timestamp]") {
    REQUIRE(TimestampConverter::ParseUtcOffset("UTC") == 0);
    REQUIRE(TimestampConverter::ParseUtcOffset("") == 0);
    REQUIRE(TimestampConverter::ParseUtcOffset("+05:30") == 330);
    REQUIRE(TimestampConverter::ParseUtcOffset("-0800") == -480);
    REQUIRE(TimestampConverter::ParseUtcOffset("+2") == 120);
    REQUIRE(TimestampConverter::ParseUtcOffset("UTC-3") == -180);
    REQUIRE_FALSE(TimestampConverter::ParseUtcOffset("+15:00").has_value());
    REQUIRE_FALSE(TimestampConverter::ParseUtcOffset("Europe/Paris").has_value());

    REQUIRE(TimestampConverter::FormatUtcOffset(330) == "+05:30");
    REQUIRE(TimestampConverter::FormatUtcOffset(-480, false) == "-0800");
}

TEST_CASE("Unit names", "[timestamp]") {
    REQUIRE(TimestampConverter::ParseUnit("ms") == TimestampUnit::Milliseconds);
    REQUIRE(TimestampConverter::ParseUnit("Seconds") == TimestampUnit::Seconds);
    REQUIRE(TimestampConverter::ParseUnit("auto") == TimestampUnit::Auto);
    REQUIRE_FALSE(TimestampConverter::ParseUnit("minutes").has_value());
    REQUIRE(std::string(TimestampConverter::UnitName(TimestampUnit::Milliseconds)) == "milliseconds");
}

TEST_CASE("Calendar arithmetic", "[timestamp]") {
    REQUIRE(TimestampConverter::DaysFromCivil(1970, 1, 1) == 0);
    REQUIRE(TimestampConverter::DaysFromCivil(2000, 3, 1) == 11017);
    REQUIRE(TimestampConverter::DaysFromCivil(1969, 12, 31) == -1);

    CivilTime t = TimestampConverter::CivilFromMillis(-1);
    REQUIRE(t.year == 1969);
    REQUIRE(t.month == 12);
    REQUIRE(t.day == 31);
    REQUIRE(t.millisecond == 999);
    REQUIRE(t.weekday == 3);

    REQUIRE(TimestampConverter::DaysInMonth(1900, 2) == 28);
    REQUIRE(TimestampConverter::DaysInMonth(2000, 2) == 29);
    REQUIRE_FALSE(TimestampConverter::IsValidDate(0, 1, 1));
}

TEST_CASE("Converter report", "[timestamp]") {
    std::string report = TimestampConverter::FormatReport(TimestampConverter::ToDate("1700000000"));
    REQUIRE(report.find("Input: 1700000000 (seconds)") == 0);
    REQUIRE(report.find("UTC: 2023-11-14 22:13:20 UTC") != std::string::npos);
    REQUIRE(report.find("ISO 8601: 2023-11-14T22:13:20Z") != std::string::npos);
    REQUIRE(report.find("RFC 2822: Tue, 14 Nov 2023 22:13:20 GMT") != std::string::npos);

    std::string from_date = TimestampConverter::FormatReport(TimestampConverter::FromDate("2024-01-15"));
    REQUIRE(from_date.find("Seconds: 1705276800") != std::string::npos);
    REQUIRE(from_date.find("Milliseconds: 1705276800000") != std::string::npos);

    REQUIRE(TimestampConverter::FormatReport(TimestampConverter::ToDate("oops")).empty());
}
