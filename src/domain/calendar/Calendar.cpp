#include "domain/calendar/Calendar.hpp"

#include <algorithm>
#include <array>

namespace isots::domain::calendar {

namespace {

struct MonthInfo {
    int common_days;      // length in a non-leap year
    int days_before;      // cumulative days of the preceding months, non-leap year
};

constexpr std::array<MonthInfo, 12> kMonths{{
    {31, 0},    // January
    {28, 31},   // February
    {31, 59},   // March
    {30, 90},   // April
    {31, 120},  // May
    {30, 151},  // June
    {31, 181},  // July
    {31, 212},  // August
    {30, 243},  // September
    {31, 273},  // October
    {30, 304},  // November
    {31, 334},  // December
}};

constexpr int kFebruary = 2;

bool is_valid_month(int month) {
    return month >= 1 && month <= 12;
}

} // anonymous namespace

bool is_leap_year(int year) {
    return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

int leap_years_between_closed_form(int a, int b) {
    const int lower = std::min(a, b);
    const int higher = std::max(a, b);
    if (lower == higher) return 0;

    return ((higher - 1) / 4 - lower / 4)
         - (((higher - 1) / 100 - lower / 100) - ((higher - 1) / 400 - lower / 400));
}

int leap_years_between_iterative(int a, int b) {
    const int lower = std::min(a, b);
    const int higher = std::max(a, b);

    int count = 0;
    for (int year = lower + 1; year < higher; ++year) {
        if (is_leap_year(year)) ++count;
    }
    return count;
}

int leap_years_between(int a, int b) {
    const int lower = std::min(a, b);
    const int higher = std::max(a, b);
    if (lower >= kClosedFormMinYear && higher <= kClosedFormMaxYear) {
        return leap_years_between_closed_form(lower, higher);
    }
    return leap_years_between_iterative(lower, higher);
}

int64_t leap_days_since_epoch(int year) {
    if (year >= kEpochYear) {
        // 1970 itself is not a leap year, so the open range covers [1970, year).
        return leap_years_between(kEpochYear, year);
    }
    // [year, 1970): the open range misses `year` itself.
    return -static_cast<int64_t>(leap_years_between(year, kEpochYear) + (is_leap_year(year) ? 1 : 0));
}

int days_in_month(int year, int month) {
    if (!is_valid_month(month)) return 0;
    const int extra = (month == kFebruary && is_leap_year(year)) ? 1 : 0;
    return kMonths[month - 1].common_days + extra;
}

Result<int64_t> validate_and_convert_date(int year, int month, int day) {
    if (day < 1) {
        return ParseError::invalid_day(year, month, day);
    }
    if (!is_valid_month(month)) {
        return ParseError::invalid_month(month);
    }
    if (day > days_in_month(year, month)) {
        return ParseError::invalid_day(year, month, day);
    }

    const bool leap = is_leap_year(year);
    const int64_t day_of_year =
        kMonths[month - 1].days_before + ((leap && month > kFebruary) ? 1 : 0) + (day - 1);

    return kMillisPerDay * day_of_year
         + kMillisPerYear * (static_cast<int64_t>(year) - kEpochYear)
         + kMillisPerDay * leap_days_since_epoch(year);
}

Result<int64_t> validate_and_convert_date(const CalendarDate& date) {
    return validate_and_convert_date(date.year, date.month, date.day);
}

} // namespace isots::domain::calendar
