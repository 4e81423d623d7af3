#include "codec/Iso8601Decoder.hpp"

#include "codec/Iso8601Cursor.hpp"
#include "domain/calendar/Calendar.hpp"
#include "domain/value_objects/CalendarDate.hpp"
#include "domain/value_objects/UtcOffset.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

using namespace isots::domain;
namespace cal = isots::domain::calendar;

namespace isots::codec {

namespace {

enum class State { YEAR, MONTH, DAY, HOUR, MINUTE, SECOND, MILLIS, OFFSET, DONE };

constexpr int64_t kMaxHour = 23;
constexpr int64_t kMaxMinute = 59;
constexpr int64_t kMaxSecond = 59;

// One pass over the input. Each state reads its digits plus the delimiter
// that follows them and names the next state.
class DecodeMachine {
public:
    DecodeMachine(std::string_view text, bool validate_time_of_day)
        : cursor_(text)
        , validate_time_of_day_(validate_time_of_day) {}

    DecodeResult run() {
        State state = State::YEAR;
        while (state != State::DONE) {
            auto next = step(state);
            if (auto* error = std::get_if<ParseError>(&next)) {
                return std::move(*error);
            }
            state = std::get<State>(next);
        }

        const int64_t ms = date_ms_
                         + hour_ * cal::kMillisPerHour
                         + (minute_ - offset_.minutes()) * cal::kMillisPerMinute
                         + second_ * cal::kMillisPerSecond
                         + millis_;
        return Timestamp(ms);
    }

private:
    Result<State> step(State state) {
        switch (state) {
            case State::YEAR: return read_year();
            case State::MONTH: return read_month();
            case State::DAY: return read_day();
            case State::HOUR: return read_clock_field(hour_, "hour", kMaxHour, ':', State::MINUTE);
            case State::MINUTE: return read_clock_field(minute_, "minute", kMaxMinute, ':', State::SECOND);
            case State::SECOND: return read_clock_field(second_, "second", kMaxSecond, '.', State::MILLIS);
            case State::MILLIS: return read_millis();
            case State::OFFSET: return read_offset();
            case State::DONE: break;
        }
        return State::DONE;
    }

    Result<State> read_year() {
        auto year = cursor_.read_fixed_digits(4, "year");
        if (auto* error = std::get_if<ParseError>(&year)) return std::move(*error);
        date_.year = static_cast<int>(std::get<int64_t>(year));

        if (auto error = cursor_.expect('-')) return std::move(*error);
        return State::MONTH;
    }

    Result<State> read_month() {
        month_position_ = cursor_.position();
        auto month = cursor_.read_fixed_digits(2, "month");
        if (auto* error = std::get_if<ParseError>(&month)) return std::move(*error);
        date_.month = static_cast<int>(std::get<int64_t>(month));

        if (auto error = cursor_.expect('-')) return std::move(*error);
        return State::DAY;
    }

    Result<State> read_day() {
        day_position_ = cursor_.position();
        auto day = cursor_.read_fixed_digits(2, "day");
        if (auto* error = std::get_if<ParseError>(&day)) return std::move(*error);
        date_.day = static_cast<int>(std::get<int64_t>(day));

        auto converted = cal::validate_and_convert_date(date_);
        if (auto* error = std::get_if<ParseError>(&converted)) {
            error->position =
                error->kind == ErrorKind::INVALID_MONTH ? month_position_ : day_position_;
            return std::move(*error);
        }
        date_ms_ = std::get<int64_t>(converted);

        if (auto error = cursor_.expect('T')) return std::move(*error);
        return State::HOUR;
    }

    Result<State> read_clock_field(int64_t& target, std::string_view name, int64_t max,
                                   char delimiter, State next) {
        const std::size_t position = cursor_.position();
        auto value = cursor_.read_fixed_digits(2, name);
        if (auto* error = std::get_if<ParseError>(&value)) return std::move(*error);
        target = std::get<int64_t>(value);

        if (auto error = check_range(name, target, max, position)) return std::move(*error);
        if (auto error = cursor_.expect(delimiter)) return std::move(*error);
        return next;
    }

    Result<State> read_millis() {
        auto millis = cursor_.read_fixed_digits(3, "millisecond");
        if (auto* error = std::get_if<ParseError>(&millis)) return std::move(*error);
        millis_ = std::get<int64_t>(millis);
        return State::OFFSET;
    }

    Result<State> read_offset() {
        if (cursor_.consume('Z')) {
            offset_ = UtcOffset::utc();
            return finish();
        }

        int sign = 0;
        if (cursor_.consume('+')) {
            sign = 1;
        } else if (cursor_.consume('-')) {
            sign = -1;
        } else {
            return ParseError::syntax(cursor_.position(), "'Z', '+' or '-'");
        }

        const std::size_t hours_position = cursor_.position();
        auto hours = cursor_.read_digits("offset hours");
        if (auto* error = std::get_if<ParseError>(&hours)) return std::move(*error);
        if (auto error = cursor_.expect(':')) return std::move(*error);

        const std::size_t minutes_position = cursor_.position();
        auto minutes = cursor_.read_digits("offset minutes");
        if (auto* error = std::get_if<ParseError>(&minutes)) return std::move(*error);

        const int64_t h = std::get<int64_t>(hours);
        const int64_t m = std::get<int64_t>(minutes);
        if (auto error = check_range("offset hours", h, kMaxHour, hours_position)) {
            return std::move(*error);
        }
        if (auto error = check_range("offset minutes", m, kMaxMinute, minutes_position)) {
            return std::move(*error);
        }

        offset_ = UtcOffset::from_parts(sign, h, m);
        return finish();
    }

    Result<State> finish() {
        if (!cursor_.at_end()) {
            return ParseError::syntax(cursor_.position(), "end of input");
        }
        return State::DONE;
    }

    std::optional<ParseError> check_range(std::string_view name, int64_t value, int64_t max,
                                          std::size_t position) const {
        if (!validate_time_of_day_ || value <= max) return std::nullopt;
        auto error = ParseError::invalid_time_of_day(name, value);
        error.position = position;
        return error;
    }

    Iso8601Cursor cursor_;
    bool validate_time_of_day_;

    CalendarDate date_;
    std::size_t month_position_{0};
    std::size_t day_position_{0};
    int64_t date_ms_{0};
    int64_t hour_{0};
    int64_t minute_{0};
    int64_t second_{0};
    int64_t millis_{0};
    UtcOffset offset_ = UtcOffset::utc();
};

} // anonymous namespace

Iso8601Decoder::Iso8601Decoder(bool validate_time_of_day)
    : validate_time_of_day_(validate_time_of_day) {}

DecodeResult Iso8601Decoder::decode(std::string_view text) const {
    return DecodeMachine(text, validate_time_of_day_).run();
}

} // namespace isots::codec
