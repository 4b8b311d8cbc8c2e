#include <qdevkit/timestamp_converter.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <spdlog/spdlog.h>

namespace qdevkit {

namespace {

constexpr int64_t kMillisPerDay = 86400000LL;

// 0001-01-01T00:00:00Z and 9999-12-31T23:59:59.999Z
constexpr int64_t kMinSupportedMillis = -62135596800000LL;
constexpr int64_t kMaxSupportedMillis = 253402300799999LL;

// Widest fixed offset in use (UTC+14:00)
constexpr int kMaxOffsetMinutes = 14 * 60;

const char* kWeekdayNames[] = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"
};

const char* kMonthNames[] = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

const char* kDateLayouts[] = {
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%d",
    "%Y/%m/%d %H:%M:%S",
    "%Y/%m/%d",
    "%d/%m/%Y %H:%M:%S",
    "%d/%m/%Y",
    "%d-%m-%Y %H:%M:%S",
    "%d-%m-%Y",
    "%B %d, %Y %H:%M:%S",
    "%B %d, %Y",
};

std::string Trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    return text.substr(start, end - start);
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

int64_t FloorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

TimestampResult TimestampError(const std::string& input, const std::string& message) {
    TimestampResult result;
    result.input = input;
    result.error = ToolErrorKind::InvalidTimestamp;
    result.error_message = message;
    return result;
}

// Fields collected while matching an input against a layout
struct ParsedDate {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;
    bool has_offset = false;
    int offset_minutes = 0;
};

bool ReadNumber(const std::string& s, size_t& pos, int min_digits, int max_digits, int& value) {
    int digits = 0;
    value = 0;
    while (pos < s.size() && digits < max_digits && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        value = value * 10 + (s[pos] - '0');
        pos++;
        digits++;
    }
    return digits >= min_digits;
}

bool ReadMonthName(const std::string& s, size_t& pos, int& month) {
    size_t end = pos;
    while (end < s.size() && std::isalpha(static_cast<unsigned char>(s[end]))) end++;
    std::string word = ToLower(s.substr(pos, end - pos));
    if (word.empty()) return false;

    for (int i = 0; i < 12; i++) {
        std::string full = ToLower(kMonthNames[i]);
        if (word == full || word == full.substr(0, 3)) {
            month = i + 1;
            pos = end;
            return true;
        }
    }
    return false;
}

// Minimal strptime: %Y %m %d %H %M %S %B, a space matches one or more spaces,
// every other character must match literally, and the whole input is consumed.
bool MatchLayout(const std::string& input, const char* layout, ParsedDate& out) {
    ParsedDate parsed;
    size_t pos = 0;

    for (const char* f = layout; *f; f++) {
        if (*f == '%') {
            f++;
            bool ok = false;
            switch (*f) {
                case 'Y': ok = ReadNumber(input, pos, 4, 4, parsed.year); break;
                case 'm': ok = ReadNumber(input, pos, 1, 2, parsed.month); break;
                case 'd': ok = ReadNumber(input, pos, 1, 2, parsed.day); break;
                case 'H': ok = ReadNumber(input, pos, 1, 2, parsed.hour); break;
                case 'M': ok = ReadNumber(input, pos, 1, 2, parsed.minute); break;
                case 'S': ok = ReadNumber(input, pos, 1, 2, parsed.second); break;
                case 'B': ok = ReadMonthName(input, pos, parsed.month); break;
                default: return false;
            }
            if (!ok) return false;
        } else if (*f == ' ') {
            if (pos >= input.size() || input[pos] != ' ') return false;
            while (pos < input.size() && input[pos] == ' ') pos++;
        } else {
            if (pos >= input.size() || input[pos] != *f) return false;
            pos++;
        }
    }

    if (pos != input.size()) return false;
    out = parsed;
    return true;
}

// YYYY-MM-DD[Tt ]HH:MM[:SS[.fff...]][Z|z|+HH:MM|-HH:MM|+HHMM|+HH]
bool MatchIso8601(const std::string& input, ParsedDate& out) {
    ParsedDate parsed;
    size_t pos = 0;

    auto expect = [&](char c) {
        if (pos < input.size() && input[pos] == c) {
            pos++;
            return true;
        }
        return false;
    };

    if (!ReadNumber(input, pos, 4, 4, parsed.year) || !expect('-') ||
        !ReadNumber(input, pos, 2, 2, parsed.month) || !expect('-') ||
        !ReadNumber(input, pos, 2, 2, parsed.day)) {
        return false;
    }

    if (pos < input.size()) {
        char sep = input[pos];
        if (sep != 'T' && sep != 't' && sep != ' ') return false;
        pos++;

        if (!ReadNumber(input, pos, 2, 2, parsed.hour) || !expect(':') ||
            !ReadNumber(input, pos, 2, 2, parsed.minute)) {
            return false;
        }

        if (expect(':')) {
            if (!ReadNumber(input, pos, 2, 2, parsed.second)) return false;

            if (expect('.') || expect(',')) {
                // Keep millisecond precision, ignore further digits
                int digits = 0;
                int ms = 0;
                while (pos < input.size() && std::isdigit(static_cast<unsigned char>(input[pos]))) {
                    if (digits < 3) ms = ms * 10 + (input[pos] - '0');
                    digits++;
                    pos++;
                }
                if (digits == 0) return false;
                for (int d = digits; d < 3; d++) ms *= 10;
                parsed.millisecond = ms;
            }
        }

        if (pos < input.size()) {
            if (input[pos] == 'Z' || input[pos] == 'z') {
                parsed.has_offset = true;
                parsed.offset_minutes = 0;
                pos++;
            } else if (input[pos] == '+' || input[pos] == '-') {
                auto offset = TimestampConverter::ParseUtcOffset(input.substr(pos));
                if (!offset) return false;
                parsed.has_offset = true;
                parsed.offset_minutes = *offset;
                pos = input.size();
            }
        }
    }

    if (pos != input.size()) return false;
    out = parsed;
    return true;
}

std::string Pad(int value, int width) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%0*d", width, value);
    return buf;
}

} // namespace

// ============================================================================
// Calendar arithmetic
// ============================================================================

int64_t TimestampConverter::DaysFromCivil(int year, int month, int day) {
    // Days since 1970-01-01, proleptic Gregorian, eras of 400 years
    int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;                                      // [0, 399]
    int64_t mp = (month + 9) % 12;                                    // March = 0
    int64_t doy = (153 * mp + 2) / 5 + day - 1;                       // [0, 365]
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;              // [0, 146096]
    return era * 146097 + doe - 719468;
}

CivilTime TimestampConverter::CivilFromMillis(int64_t epoch_millis) {
    int64_t days = FloorDiv(epoch_millis, kMillisPerDay);
    int64_t ms_of_day = epoch_millis - days * kMillisPerDay;

    int64_t z = days + 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t day = doy - (153 * mp + 2) / 5 + 1;
    int64_t month = mp < 10 ? mp + 3 : mp - 9;
    int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);

    CivilTime civil;
    civil.year = static_cast<int>(year);
    civil.month = static_cast<int>(month);
    civil.day = static_cast<int>(day);
    civil.hour = static_cast<int>(ms_of_day / 3600000);
    civil.minute = static_cast<int>((ms_of_day / 60000) % 60);
    civil.second = static_cast<int>((ms_of_day / 1000) % 60);
    civil.millisecond = static_cast<int>(ms_of_day % 1000);

    // 1970-01-01 was a Thursday
    int64_t weekday = (days + 4) % 7;
    civil.weekday = static_cast<int>(weekday < 0 ? weekday + 7 : weekday);
    return civil;
}

int TimestampConverter::DaysInMonth(int year, int month) {
    static const int days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month < 1 || month > 12) return 0;
    bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    return (month == 2 && leap) ? 29 : days[month - 1];
}

bool TimestampConverter::IsValidDate(int year, int month, int day) {
    return year >= 1 && year <= 9999 &&
           month >= 1 && month <= 12 &&
           day >= 1 && day <= DaysInMonth(year, month);
}

// ============================================================================
// Offsets and units
// ============================================================================

std::optional<int> TimestampConverter::ParseUtcOffset(const std::string& text) {
    std::string s = Trim(text);
    std::string lower = ToLower(s);

    if (lower.empty() || lower == "utc" || lower == "gmt" || lower == "z") {
        return 0;
    }
    if (lower.compare(0, 3, "utc") == 0 || lower.compare(0, 3, "gmt") == 0) {
        s = s.substr(3);
    }
    if (s.empty() || (s[0] != '+' && s[0] != '-')) {
        return std::nullopt;
    }

    int sign = (s[0] == '-') ? -1 : 1;
    size_t pos = 1;
    int hours = 0;
    int minutes = 0;

    if (!ReadNumber(s, pos, 1, 2, hours)) return std::nullopt;
    if (pos < s.size()) {
        if (s[pos] == ':') pos++;
        if (!ReadNumber(s, pos, 2, 2, minutes)) return std::nullopt;
    }
    if (pos != s.size() || hours > 14 || minutes > 59) {
        return std::nullopt;
    }

    int total = sign * (hours * 60 + minutes);
    if (total > kMaxOffsetMinutes || total < -kMaxOffsetMinutes) {
        return std::nullopt;
    }
    return total;
}

std::string TimestampConverter::FormatUtcOffset(int minutes, bool with_colon) {
    char sign = minutes < 0 ? '-' : '+';
    int abs_minutes = std::abs(minutes);
    std::string out(1, sign);
    out += Pad(abs_minutes / 60, 2);
    if (with_colon) out += ':';
    out += Pad(abs_minutes % 60, 2);
    return out;
}

const char* TimestampConverter::UnitName(TimestampUnit unit) {
    switch (unit) {
        case TimestampUnit::Auto:         return "auto";
        case TimestampUnit::Seconds:      return "seconds";
        case TimestampUnit::Milliseconds: return "milliseconds";
    }
    return "auto";
}

std::optional<TimestampUnit> TimestampConverter::ParseUnit(const std::string& name) {
    std::string key = ToLower(Trim(name));
    if (key == "auto") return TimestampUnit::Auto;
    if (key == "seconds" || key == "s" || key == "sec") return TimestampUnit::Seconds;
    if (key == "milliseconds" || key == "ms" || key == "millis") return TimestampUnit::Milliseconds;
    return std::nullopt;
}

int64_t TimestampConverter::CurrentUnixSeconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

int64_t TimestampConverter::CurrentUnixMillis() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

// ============================================================================
// Conversions
// ============================================================================

TimestampResult TimestampConverter::ToDate(const std::string& input, TimestampUnit unit, int utc_offset_minutes) {
    std::string text = Trim(input);
    if (text.empty()) {
        return TimestampError(input, "Invalid timestamp format: input is empty");
    }

    bool is_integer = std::all_of(text.begin() + ((text[0] == '-' || text[0] == '+') ? 1 : 0), text.end(),
                                  [](unsigned char c) { return std::isdigit(c); }) &&
                      text.find_first_of("0123456789") != std::string::npos;

    // Decimal notation only; strtod alone would also take hex, "inf" and "nan"
    bool decimal = text.find_first_not_of("0123456789+-.eE") == std::string::npos;

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (!decimal || end == text.c_str() || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
        return TimestampError(input, "Invalid timestamp format: '" + text + "' is not a number");
    }

    TimestampUnit resolved = unit;
    if (resolved == TimestampUnit::Auto) {
        resolved = (std::fabs(value) >= kAutoMillisThreshold) ? TimestampUnit::Milliseconds
                                                              : TimestampUnit::Seconds;
    }

    int64_t millis = 0;
    if (resolved == TimestampUnit::Milliseconds) {
        if (value > static_cast<double>(kMaxMillis)) {
            return TimestampError(input, "Timestamp value is too large");
        }
        if (value < static_cast<double>(kMinSupportedMillis)) {
            return TimestampError(input, "Timestamp out of range (supported years 0001-9999)");
        }
        millis = is_integer ? std::strtoll(text.c_str(), nullptr, 10)
                            : static_cast<int64_t>(std::llround(value));
    } else {
        if (std::fabs(value) > static_cast<double>(kMaxSupportedMillis / 1000 + 1)) {
            return TimestampError(input, "Timestamp out of range (supported years 0001-9999)");
        }
        millis = is_integer ? std::strtoll(text.c_str(), nullptr, 10) * 1000
                            : static_cast<int64_t>(std::llround(value * 1000.0));
    }

    if (millis < kMinSupportedMillis || millis > kMaxSupportedMillis) {
        return TimestampError(input, "Timestamp out of range (supported years 0001-9999)");
    }

    TimestampResult result = FromEpochMillis(millis, utc_offset_minutes);
    result.input = text;
    result.unit_used = resolved;
    return result;
}

TimestampResult TimestampConverter::FromEpochMillis(int64_t epoch_millis, int utc_offset_minutes) {
    TimestampResult result;
    result.input = std::to_string(epoch_millis);
    result.unit_used = TimestampUnit::Milliseconds;
    result.epoch_millis = epoch_millis;
    result.epoch_seconds = FloorDiv(epoch_millis, 1000);
    result.utc_offset_minutes = utc_offset_minutes;

    if (epoch_millis < kMinSupportedMillis || epoch_millis > kMaxSupportedMillis ||
        utc_offset_minutes < -kMaxOffsetMinutes || utc_offset_minutes > kMaxOffsetMinutes) {
        return TimestampError(result.input, "Timestamp out of range (supported years 0001-9999)");
    }

    int64_t local = epoch_millis + static_cast<int64_t>(utc_offset_minutes) * 60000;
    if (local < kMinSupportedMillis || local > kMaxSupportedMillis) {
        return TimestampError(result.input, "Timestamp out of range (supported years 0001-9999)");
    }

    FillFormats(result);
    result.success = true;
    return result;
}

void TimestampConverter::FillFormats(TimestampResult& result) {
    int offset = result.utc_offset_minutes;
    CivilTime t = CivilFromMillis(result.epoch_millis + static_cast<int64_t>(offset) * 60000);

    std::string date = Pad(t.year, 4) + "-" + Pad(t.month, 2) + "-" + Pad(t.day, 2);
    std::string time = Pad(t.hour, 2) + ":" + Pad(t.minute, 2) + ":" + Pad(t.second, 2);

    result.iso8601 = date + "T" + time;
    if (t.millisecond != 0) {
        result.iso8601 += "." + Pad(t.millisecond, 3);
    }
    result.iso8601 += (offset == 0) ? "Z" : FormatUtcOffset(offset);

    result.utc = date + " " + time + " UTC";
    if (offset != 0) {
        result.utc += FormatUtcOffset(offset);
    }

    result.rfc2822 = std::string(kWeekdayNames[t.weekday]).substr(0, 3) + ", " +
                     Pad(t.day, 2) + " " + std::string(kMonthNames[t.month - 1]).substr(0, 3) + " " +
                     Pad(t.year, 4) + " " + time + " " +
                     ((offset == 0) ? std::string("GMT") : FormatUtcOffset(offset, false));

    result.date_only = date;
    result.day_first = Pad(t.day, 2) + "/" + Pad(t.month, 2) + "/" + Pad(t.year, 4) + " " + time;
    result.long_form = std::string(kWeekdayNames[t.weekday]) + ", " + kMonthNames[t.month - 1] +
                       " " + Pad(t.day, 2) + ", " + Pad(t.year, 4);
}

TimestampResult TimestampConverter::FromDate(const std::string& input, int utc_offset_minutes) {
    std::string text = Trim(input);
    if (text.empty()) {
        return TimestampError(input, "Could not parse date: input is empty");
    }

    ParsedDate parsed;
    bool matched = false;
    for (const char* layout : kDateLayouts) {
        if (MatchLayout(text, layout, parsed)) {
            matched = true;
            break;
        }
    }
    if (!matched) {
        matched = MatchIso8601(text, parsed);
    }

    if (!matched) {
        return TimestampError(input,
            "Could not parse date. Try formats like: 2024-01-15, 2024-01-15 14:30:00, or ISO 8601");
    }

    if (!IsValidDate(parsed.year, parsed.month, parsed.day)) {
        return TimestampError(input, "Invalid calendar date: " + Pad(parsed.year, 4) + "-" +
                                     Pad(parsed.month, 2) + "-" + Pad(parsed.day, 2));
    }
    if (parsed.hour > 23 || parsed.minute > 59 || parsed.second > 59) {
        return TimestampError(input, "Invalid time of day in '" + text + "'");
    }

    int offset = parsed.has_offset ? parsed.offset_minutes : utc_offset_minutes;
    int64_t days = DaysFromCivil(parsed.year, parsed.month, parsed.day);
    int64_t local_seconds = ((days * 24 + parsed.hour) * 60 + parsed.minute) * 60 + parsed.second;
    int64_t millis = local_seconds * 1000 + parsed.millisecond - static_cast<int64_t>(offset) * 60000;

    if (millis < kMinSupportedMillis || millis > kMaxSupportedMillis) {
        return TimestampError(input, "Timestamp out of range (supported years 0001-9999)");
    }

    TimestampResult result = FromEpochMillis(millis, offset);
    result.input = text;
    result.from_date = true;
    return result;
}

std::string TimestampConverter::FormatReport(const TimestampResult& result) {
    if (!result.success) {
        return std::string();
    }

    std::ostringstream oss;
    std::string zone_label = (result.utc_offset_minutes == 0)
        ? "UTC"
        : "Local (UTC" + FormatUtcOffset(result.utc_offset_minutes) + ")";

    if (result.from_date) {
        oss << "Input: " << result.input << "\n\n";
        oss << "Seconds: " << result.epoch_seconds << "\n";
        oss << "Milliseconds: " << result.epoch_millis << "\n\n";
        oss << zone_label << ": " << result.utc << "\n";
        oss << "ISO 8601: " << result.iso8601;
    } else {
        oss << "Input: " << result.input << " (" << UnitName(result.unit_used) << ")\n\n";
        oss << zone_label << ": " << result.utc << "\n";
        oss << "ISO 8601: " << result.iso8601 << "\n";
        oss << "RFC 2822: " << result.rfc2822 << "\n\n";
        oss << "Additional formats:\n";
        oss << "  " << result.date_only << "\n";
        oss << "  " << result.day_first << "\n";
        oss << "  " << result.long_form;
    }

    return oss.str();
}

} // namespace qdevkit
