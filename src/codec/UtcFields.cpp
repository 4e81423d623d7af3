#include "codec/UtcFields.hpp"

#include "domain/calendar/Calendar.hpp"

#include <chrono>
#include <cstdint>

namespace cal = isots::domain::calendar;

namespace isots::codec {

namespace {

struct CivilDate {
    int year;
    unsigned month;
    unsigned day;
};

// Days since 1970-01-01 to a proleptic Gregorian date, in 400-year eras.
// Used where std::chrono::year cannot represent the result.
CivilDate civil_from_days(int64_t days) {
    days += 719468;  // shift the epoch to 0000-03-01
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const auto doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned day = doy - (153 * mp + 2) / 5 + 1;
    const unsigned month = mp < 10 ? mp + 3 : mp - 9;
    const int year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
    return CivilDate{year, month, day};
}

CivilDate civil_date(int64_t days) {
    using namespace std::chrono;

    static const int64_t first = sys_days{year::min() / January / 1}.time_since_epoch().count();
    static const int64_t last = sys_days{year::max() / December / 31}.time_since_epoch().count();
    if (days < first || days > last) {
        return civil_from_days(days);
    }

    const year_month_day ymd{sys_days{std::chrono::days{days}}};
    return CivilDate{
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
    };
}

} // anonymous namespace

UtcFields UtcFields::from_timestamp(domain::Timestamp ts) {
    using namespace std::chrono;

    // Floor division on the raw count. The day count must never be scaled
    // back to milliseconds: that overflows near INT64_MIN.
    int64_t day_count = ts.milliseconds() / cal::kMillisPerDay;
    int64_t ms_of_day = ts.milliseconds() % cal::kMillisPerDay;
    if (ms_of_day < 0) {
        --day_count;
        ms_of_day += cal::kMillisPerDay;
    }

    const CivilDate date = civil_date(day_count);
    const hh_mm_ss<milliseconds> tod{milliseconds{ms_of_day}};

    return UtcFields{
        date.year,
        date.month,
        date.day,
        static_cast<int>(tod.hours().count()),
        static_cast<int>(tod.minutes().count()),
        static_cast<int>(tod.seconds().count()),
        static_cast<int>(tod.subseconds().count()),
    };
}

} // namespace isots::codec
