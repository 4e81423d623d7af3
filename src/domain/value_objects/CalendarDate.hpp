#pragma once

namespace isots::domain {

// Unvalidated (year, month, day) triple as read from the input.
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    bool operator==(const CalendarDate&) const = default;
};

} // namespace isots::domain
