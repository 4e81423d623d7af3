#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace isots::domain {

enum class ErrorKind { SYNTAX, INVALID_DAY, INVALID_MONTH, INVALID_TIME_OF_DAY };

std::string_view to_string(ErrorKind kind);

struct ParseError {
    ErrorKind kind;
    std::size_t position;  // offset into the input where matching stopped
    int64_t value;         // offending field value, 0 for syntax errors
    std::string message;

    static ParseError syntax(std::size_t position, std::string_view expected);
    static ParseError invalid_day(int year, int month, int day);
    static ParseError invalid_month(int month);
    static ParseError invalid_time_of_day(std::string_view field, int64_t value);

    bool operator==(const ParseError&) const = default;
};

// Either a decoded value or the first error hit while producing it.
template <typename T>
using Result = std::variant<T, ParseError>;

class ParseException : public std::invalid_argument {
public:
    explicit ParseException(ParseError error);

    const ParseError& error() const noexcept { return error_; }

private:
    ParseError error_;
};

} // namespace isots::domain
