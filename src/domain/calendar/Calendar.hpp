#pragma once

#include "domain/errors/ParseError.hpp"
#include "domain/value_objects/CalendarDate.hpp"

#include <cstdint>

namespace isots::domain::calendar {

inline constexpr int64_t kMillisPerSecond = 1'000;
inline constexpr int64_t kMillisPerMinute = 60 * kMillisPerSecond;
inline constexpr int64_t kMillisPerHour = 60 * kMillisPerMinute;
inline constexpr int64_t kMillisPerDay = 86'400'000;
inline constexpr int64_t kMillisPerYear = 365 * kMillisPerDay;  // 31,536,000,000

inline constexpr int kEpochYear = 1970;

// Bounds of the year range served by the closed-form leap-year count.
inline constexpr int kClosedFormMinYear = 1800;
inline constexpr int kClosedFormMaxYear = 9999;

// Proleptic Gregorian rule, valid for every integer year including year 0
// and negative years.
bool is_leap_year(int year);

// Number of leap years strictly between the two bounds. Order-independent.
// Uses the closed form when both bounds lie in [1800, 9999] and falls back to
// a year-by-year scan otherwise.
int leap_years_between(int a, int b);

// The two strategies behind leap_years_between, exposed so they can be
// compared. The closed form is only meaningful for non-negative years.
int leap_years_between_closed_form(int a, int b);
int leap_years_between_iterative(int a, int b);

// Number of Feb 29ths from 1970-01-01 up to January 1st of `year`.
// Negative for years before 1970.
int64_t leap_days_since_epoch(int year);

// 28..31, or 0 when month is outside 1..12.
int days_in_month(int year, int month);

// Validates the triple against month lengths and returns milliseconds from the
// epoch to 00:00:00.000 UTC of that date. Day is checked first (day < 1), then
// month, then the upper bound of the day for that month and year. Errors carry
// no position; the caller knows where the fields came from.
Result<int64_t> validate_and_convert_date(int year, int month, int day);
Result<int64_t> validate_and_convert_date(const CalendarDate& date);

} // namespace isots::domain::calendar
