#pragma once

#include <cstdint>
#include <string>

namespace plot_digitizer::calibration {

// Proleptic Gregorian calendar date.
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    bool operator==(const CalendarDate& o) const {
        return year == o.year && month == o.month && day == o.day;
    }
    bool operator!=(const CalendarDate& o) const { return !(*this == o); }
};

bool is_valid_date(const CalendarDate& date);

// Days since 1970-01-01.
int64_t to_day_ordinal(const CalendarDate& date);
CalendarDate from_day_ordinal(int64_t ordinal);

/**
 * Accepts YYYY-MM-DD, YYYY-MM, YYYY/MM/DD and YYYY/MM; month forms mean day 1.
 * Throws CalibrationError for anything else.
 */
CalendarDate parse_date(const std::string& text);

// YYYY-MM-DD
std::string format_date(const CalendarDate& date);

} // namespace plot_digitizer::calibration
