#pragma once

#include <cstdint>
#include <string>

namespace qre {

// DateTime precision flags
#define DATETIME_HAS_DATE      0x01
#define DATETIME_HAS_TIME      0x02

// Validation limits
#define DATETIME_MAX_MONTH      12
#define DATETIME_MAX_DAY        31
#define DATETIME_MAX_HOUR       23
#define DATETIME_MAX_MINUTE     59
#define DATETIME_MAX_SECOND     59
#define DATETIME_MAX_MICROS     999999
#define DATETIME_MAX_TZ_OFFSET  1439   // minutes, exclusive of a full day

// Calendar date with optional time of day and timezone offset.
// A date-only value has precision == DATETIME_HAS_DATE and zero time fields.
struct DateTime {
    int32_t year = 1;
    uint8_t month = 1;
    uint8_t day = 1;
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t second = 0;
    uint32_t microsecond = 0;
    int16_t tz_offset = 0;          // minutes east of UTC, valid if has_timezone
    bool has_timezone = false;
    uint8_t precision = DATETIME_HAS_DATE;

    bool has_time() const { return (precision & DATETIME_HAS_TIME) != 0; }
    bool is_valid() const;

    // 2024-01-15, 2024-01-15T10:30:00, 2024-01-15T10:30:00.250000+05:00
    std::string to_iso8601() const;

    bool operator==(const DateTime& other) const;
    bool operator!=(const DateTime& other) const { return !(*this == other); }
};

bool datetime_is_leap_year(int32_t year);
int datetime_days_in_month(int32_t year, int month);

DateTime datetime_from_date(int32_t year, int month, int day);

// Both parsers throw std::invalid_argument on malformed or out of range input.
// "YYYY-M-D" only
DateTime datetime_parse_date(const std::string& text);
// "YYYY-M-D[( |T)H:M[:S[(.|,)fraction]]][Z|(+|-)HH[[:]MM]]"
DateTime datetime_parse_iso8601(const std::string& text);

} // namespace qre
