#pragma once

#include "api_export.h"
#include "tool_error.h"
#include <cstdint>
#include <optional>
#include <string>

namespace qdevkit {

enum class TimestampUnit {
    Auto,           // |value| >= 1e11 is read as milliseconds
    Seconds,
    Milliseconds
};

// Broken-down calendar time (proleptic Gregorian)
struct QDEVKIT_API CivilTime {
    int year = 1970;
    int month = 1;          // 1..12
    int day = 1;            // 1..31
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;
    int weekday = 4;        // 0 = Sunday
};

// Timestamp Result
struct QDEVKIT_API TimestampResult {
    std::string input;
    TimestampUnit unit_used = TimestampUnit::Seconds;
    int64_t epoch_seconds = 0;          // Floor of epoch_millis / 1000
    int64_t epoch_millis = 0;
    int utc_offset_minutes = 0;

    std::string iso8601;                // 2023-11-14T22:13:20Z
    std::string utc;                    // 2023-11-14 22:13:20 UTC
    std::string rfc2822;                // Tue, 14 Nov 2023 22:13:20 GMT
    std::string date_only;              // 2023-11-14
    std::string day_first;              // 14/11/2023 22:13:20
    std::string long_form;              // Tuesday, November 14, 2023

    bool from_date = false;             // Produced by FromDate
    bool success = false;
    ToolErrorKind error = ToolErrorKind::None;
    std::string error_message;
};

class QDEVKIT_API TimestampConverter {
public:
    static constexpr int64_t kMaxMillis = 9999999999999LL;
    static constexpr double kAutoMillisThreshold = 1e11;

    /**
     * Convert a numeric epoch to calendar forms
     * @param input Integer or decimal text, optional sign
     * @param unit Seconds, milliseconds or magnitude-based detection
     * @param utc_offset_minutes Display zone as a fixed offset from UTC
     * @return TimestampResult, InvalidTimestamp on bad or out-of-range input
     */
    static TimestampResult ToDate(const std::string& input,
                                  TimestampUnit unit = TimestampUnit::Auto,
                                  int utc_offset_minutes = 0);

    // Same conversion from an already-known millisecond count
    static TimestampResult FromEpochMillis(int64_t epoch_millis, int utc_offset_minutes = 0);

    /**
     * Parse a calendar date/time into an epoch
     * @param input One of the supported layouts or ISO 8601
     * @param utc_offset_minutes Zone assumed when the input carries none
     */
    static TimestampResult FromDate(const std::string& input, int utc_offset_minutes = 0);

    // Multi-line text shown by the converter panel
    static std::string FormatReport(const TimestampResult& result);

    // "UTC", "Z", "+05:30", "-0800", "+2" -> minutes east of UTC
    static std::optional<int> ParseUtcOffset(const std::string& text);
    static std::string FormatUtcOffset(int minutes, bool with_colon = true);

    static int64_t CurrentUnixSeconds();
    static int64_t CurrentUnixMillis();

    // Calendar arithmetic on the proleptic Gregorian calendar
    static int64_t DaysFromCivil(int year, int month, int day);
    static CivilTime CivilFromMillis(int64_t epoch_millis);
    static bool IsValidDate(int year, int month, int day);
    static int DaysInMonth(int year, int month);

    static const char* UnitName(TimestampUnit unit);
    static std::optional<TimestampUnit> ParseUnit(const std::string& name);

private:
    static void FillFormats(TimestampResult& result);
};

} // namespace qdevkit
