#include "codec/Iso8601Cursor.hpp"

#include <string>

using namespace isots::domain;

namespace isots::codec {

Iso8601Cursor::Iso8601Cursor(std::string_view input) : input_(input) {}

std::optional<char> Iso8601Cursor::peek() const noexcept {
    if (at_end()) return std::nullopt;
    return input_[pos_];
}

Result<int64_t> Iso8601Cursor::read_fixed_digits(std::size_t width, std::string_view field) {
    int64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        const std::size_t at = pos_ + i;
        if (at >= input_.size() || !is_digit(input_[at])) {
            return ParseError::syntax(
                at, std::to_string(width) + "-digit " + std::string(field));
        }
        value = value * 10 + (input_[at] - '0');
    }
    pos_ += width;
    return value;
}

Result<int64_t> Iso8601Cursor::read_digits(std::string_view field) {
    std::size_t end = pos_;
    while (end < input_.size() && is_digit(input_[end])) {
        if (end - pos_ == kMaxVariableDigits) {
            return ParseError::syntax(end, "at most " + std::to_string(kMaxVariableDigits) +
                                               " digits of " + std::string(field));
        }
        ++end;
    }
    if (end == pos_) {
        return ParseError::syntax(pos_, std::string(field));
    }

    int64_t value = 0;
    for (std::size_t i = pos_; i < end; ++i) {
        value = value * 10 + (input_[i] - '0');
    }
    pos_ = end;
    return value;
}

std::optional<ParseError> Iso8601Cursor::expect(char literal) {
    if (consume(literal)) return std::nullopt;
    return ParseError::syntax(pos_, std::string("'") + literal + "'");
}

bool Iso8601Cursor::consume(char literal) {
    if (at_end() || input_[pos_] != literal) return false;
    ++pos_;
    return true;
}

} // namespace isots::codec
