#pragma once

#include "domain/errors/ParseError.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace isots::codec {

// Forward-only reader over the decoder input. Every read either consumes the
// token it asked for or leaves the position untouched and reports where it
// stopped matching.
class Iso8601Cursor {
public:
    explicit Iso8601Cursor(std::string_view input);

    std::size_t position() const noexcept { return pos_; }
    bool at_end() const noexcept { return pos_ >= input_.size(); }
    std::optional<char> peek() const noexcept;

    // Exactly `width` ASCII digits.
    domain::Result<int64_t> read_fixed_digits(std::size_t width, std::string_view field);

    // One or more ASCII digits, unpadded. Runs longer than kMaxVariableDigits
    // are rejected rather than overflowing.
    domain::Result<int64_t> read_digits(std::string_view field);

    // Consumes `literal` or returns a syntax error naming it.
    std::optional<domain::ParseError> expect(char literal);

    // Consumes `literal` if it is next.
    bool consume(char literal);

    static constexpr std::size_t kMaxVariableDigits = 9;

private:
    static bool is_digit(char c) { return c >= '0' && c <= '9'; }

    std::string_view input_;
    std::size_t pos_{0};
};

} // namespace isots::codec
