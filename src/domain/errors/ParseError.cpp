#include "domain/errors/ParseError.hpp"

#include <utility>

namespace isots::domain {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SYNTAX: return "syntax";
        case ErrorKind::INVALID_DAY: return "invalid_day";
        case ErrorKind::INVALID_MONTH: return "invalid_month";
        case ErrorKind::INVALID_TIME_OF_DAY: return "invalid_time_of_day";
    }
    return "unknown";
}

ParseError ParseError::syntax(std::size_t position, std::string_view expected) {
    return ParseError{
        ErrorKind::SYNTAX, position, 0,
        "expected " + std::string(expected) + " at position " + std::to_string(position)
    };
}

ParseError ParseError::invalid_day(int year, int month, int day) {
    return ParseError{
        ErrorKind::INVALID_DAY, 0, day,
        "invalid day " + std::to_string(day) + " for " + std::to_string(year) + "-" +
            std::to_string(month)
    };
}

ParseError ParseError::invalid_month(int month) {
    return ParseError{
        ErrorKind::INVALID_MONTH, 0, month,
        "invalid month " + std::to_string(month)
    };
}

ParseError ParseError::invalid_time_of_day(std::string_view field, int64_t value) {
    return ParseError{
        ErrorKind::INVALID_TIME_OF_DAY, 0, value,
        "invalid " + std::string(field) + " " + std::to_string(value)
    };
}

ParseException::ParseException(ParseError error)
    : std::invalid_argument(error.message)
    , error_(std::move(error)) {}

} // namespace isots::domain
