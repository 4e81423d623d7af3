#pragma once

#include "domain/errors/ParseError.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <string_view>

namespace isots::codec {

using DecodeResult = domain::Result<domain::Timestamp>;

// Strict decoder for
//   YYYY-MM-DDTHH:mm:ss.sss(Z|(+|-)H+:M+)
// The calendar date is validated as soon as the day is read, so an impossible
// date fails before the time of day is looked at. The stated offset is
// reversed to normalize the result to UTC.
class Iso8601Decoder {
public:
    // When validate_time_of_day is false, out-of-range hours, minutes,
    // seconds and offset fields are accepted and folded into the arithmetic.
    explicit Iso8601Decoder(bool validate_time_of_day = true);

    DecodeResult decode(std::string_view text) const;

private:
    bool validate_time_of_day_;
};

} // namespace isots::codec
