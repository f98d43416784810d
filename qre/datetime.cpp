#include "datetime.hpp"
#include "../lib/log.h"

#include <cstdio>
#include <stdexcept>

namespace qre {

bool datetime_is_leap_year(int32_t year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int datetime_days_in_month(int32_t year, int month) {
    static const int days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month < 1 || month > DATETIME_MAX_MONTH) return 0;
    if (month == 2 && datetime_is_leap_year(year)) return 29;
    return days[month - 1];
}

bool DateTime::is_valid() const {
    if (month < 1 || month > DATETIME_MAX_MONTH) return false;
    if (day < 1 || day > datetime_days_in_month(year, month)) return false;
    if (hour > DATETIME_MAX_HOUR || minute > DATETIME_MAX_MINUTE || second > DATETIME_MAX_SECOND) return false;
    if (microsecond > DATETIME_MAX_MICROS) return false;
    if (has_timezone && (tz_offset > DATETIME_MAX_TZ_OFFSET || tz_offset < -DATETIME_MAX_TZ_OFFSET)) return false;
    return true;
}

std::string DateTime::to_iso8601() const {
    char buf[64];
    int n = snprintf(buf, sizeof(buf), "%04d-%02u-%02u", (int)year, (unsigned)month, (unsigned)day);
    std::string result(buf, n);
    if (!has_time()) return result;

    n = snprintf(buf, sizeof(buf), "T%02u:%02u:%02u", (unsigned)hour, (unsigned)minute, (unsigned)second);
    result.append(buf, n);
    if (microsecond) {
        n = snprintf(buf, sizeof(buf), ".%06u", (unsigned)microsecond);
        result.append(buf, n);
    }
    if (has_timezone) {
        int offset = tz_offset < 0 ? -tz_offset : tz_offset;
        n = snprintf(buf, sizeof(buf), "%c%02d:%02d", tz_offset < 0 ? '-' : '+', offset / 60, offset % 60);
        result.append(buf, n);
    }
    return result;
}

bool DateTime::operator==(const DateTime& other) const {
    return year == other.year && month == other.month && day == other.day &&
        hour == other.hour && minute == other.minute && second == other.second &&
        microsecond == other.microsecond && precision == other.precision &&
        has_timezone == other.has_timezone && (!has_timezone || tz_offset == other.tz_offset);
}

DateTime datetime_from_date(int32_t year, int month, int day) {
    DateTime dt;
    dt.year = year;
    dt.month = (uint8_t)month;
    dt.day = (uint8_t)day;
    dt.precision = DATETIME_HAS_DATE;
    return dt;
}

namespace {

// Cursor over the text being parsed
struct DateTimeScanner {
    const std::string& text;
    size_t pos = 0;

    explicit DateTimeScanner(const std::string& t) : text(t) {}

    bool at_end() const { return pos >= text.size(); }
    char peek() const { return at_end() ? '\0' : text[pos]; }
    bool accept(char c) {
        if (peek() != c) return false;
        pos++;
        return true;
    }

    // reads between min_digits and max_digits decimal digits
    bool digits(size_t min_digits, size_t max_digits, int& out) {
        size_t start = pos;
        out = 0;
        while (!at_end() && pos - start < max_digits && text[pos] >= '0' && text[pos] <= '9') {
            out = out * 10 + (text[pos] - '0');
            pos++;
        }
        return pos - start >= min_digits;
    }
};

[[noreturn]] void datetime_fail(const std::string& text, const char* reason) {
    log_debug("datetime_parse: '%s': %s", text.c_str(), reason);
    throw std::invalid_argument(std::string(reason) + ": '" + text + "'");
}

void scan_date(DateTimeScanner& s, DateTime& dt) {
    int year, month, day;
    if (!s.digits(4, 4, year) || !s.accept('-') || !s.digits(1, 2, month) ||
        !s.accept('-') || !s.digits(1, 2, day)) {
        datetime_fail(s.text, "malformed date");
    }
    dt.year = year;
    dt.month = (uint8_t)month;
    dt.day = (uint8_t)day;
    dt.precision = DATETIME_HAS_DATE;
}

void scan_time(DateTimeScanner& s, DateTime& dt) {
    int hour, minute, second = 0;
    if (!s.digits(1, 2, hour) || !s.accept(':') || !s.digits(1, 2, minute)) {
        datetime_fail(s.text, "malformed time");
    }
    if (s.accept(':')) {
        if (!s.digits(1, 2, second)) datetime_fail(s.text, "malformed seconds");
        if (s.accept('.') || s.accept(',')) {
            // keep microsecond precision, drop further digits
            size_t start = s.pos;
            uint32_t micros = 0;
            while (!s.at_end() && s.peek() >= '0' && s.peek() <= '9') {
                if (s.pos - start < 6) micros = micros * 10 + (uint32_t)(s.peek() - '0');
                s.pos++;
            }
            size_t count = s.pos - start;
            if (count == 0) datetime_fail(s.text, "malformed fraction");
            for (size_t i = count; i < 6; i++) micros *= 10;
            dt.microsecond = micros;
        }
    }
    dt.hour = (uint8_t)hour;
    dt.minute = (uint8_t)minute;
    dt.second = (uint8_t)second;
    dt.precision |= DATETIME_HAS_TIME;
}

void scan_timezone(DateTimeScanner& s, DateTime& dt) {
    if (s.accept('Z')) {
        dt.has_timezone = true;
        dt.tz_offset = 0;
        return;
    }
    char sign = s.peek();
    if (sign != '+' && sign != '-') return;
    s.pos++;
    int hours, minutes = 0;
    if (!s.digits(2, 2, hours)) datetime_fail(s.text, "malformed timezone");
    if (!s.at_end()) {
        s.accept(':');
        if (!s.digits(2, 2, minutes)) datetime_fail(s.text, "malformed timezone");
    }
    int offset = hours * 60 + minutes;
    dt.has_timezone = true;
    dt.tz_offset = (int16_t)(sign == '-' ? -offset : offset);
}

} // namespace

DateTime datetime_parse_date(const std::string& text) {
    DateTimeScanner s(text);
    DateTime dt;
    scan_date(s, dt);
    if (!s.at_end()) datetime_fail(text, "unexpected trailing characters");
    if (!dt.is_valid()) datetime_fail(text, "date out of range");
    return dt;
}

DateTime datetime_parse_iso8601(const std::string& text) {
    DateTimeScanner s(text);
    DateTime dt;
    scan_date(s, dt);
    if (s.accept('T') || s.accept(' ')) {
        scan_time(s, dt);
        scan_timezone(s, dt);
    }
    if (!s.at_end()) datetime_fail(text, "unexpected trailing characters");
    if (!dt.is_valid()) datetime_fail(text, "datetime out of range");
    return dt;
}

} // namespace qre
