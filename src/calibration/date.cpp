#include "plot_digitizer/calibration/date.hpp"
#include "plot_digitizer/core/errors.hpp"
#include "plot_digitizer/core/utils.hpp"

#include <cstdio>
#include <regex>

namespace plot_digitizer::calibration {

namespace {

bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int days_in_month(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return kDays[m - 1];
}

} // namespace

bool is_valid_date(const CalendarDate& date) {
    if (date.month < 1 || date.month > 12) return false;
    return date.day >= 1 && date.day <= days_in_month(date.year, date.month);
}

// Civil-from-days / days-from-civil over 400-year eras.
int64_t to_day_ordinal(const CalendarDate& date) {
    const int64_t y = static_cast<int64_t>(date.year) - (date.month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (date.month + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + date.day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate from_day_ordinal(int64_t ordinal) {
    const int64_t z = ordinal + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return CalendarDate{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

CalendarDate parse_date(const std::string& text) {
    static const std::regex re(R"(^(\d{4})([-/])(\d{1,2})(?:\2(\d{1,2}))?$)");

    const std::string s = core::trim(text);
    std::smatch m;
    if (!std::regex_match(s, m, re)) {
        throw CalibrationError("cannot parse date '" + s + "'. Use YYYY-MM or YYYY-MM-DD.");
    }

    CalendarDate date;
    date.year = std::stoi(m[1].str());
    date.month = std::stoi(m[3].str());
    date.day = m[4].matched ? std::stoi(m[4].str()) : 1;
    if (!is_valid_date(date)) {
        throw CalibrationError("invalid calendar date '" + s + "'");
    }
    return date;
}

std::string format_date(const CalendarDate& date) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buf;
}

} // namespace plot_digitizer::calibration
