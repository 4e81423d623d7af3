#pragma once

#include "codec/EncodeStyle.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <string>

namespace isots::codec {

// Renders a Timestamp as UTC text. Total: every Timestamp has an encoding.
// Years outside 0..9999 are written with a leading '-' or a fifth digit and
// are not accepted back by Iso8601Decoder.
class Iso8601Encoder {
public:
    explicit Iso8601Encoder(EncodeStyle style = EncodeStyle::CANONICAL);

    std::string encode(domain::Timestamp ts) const;

    EncodeStyle style() const noexcept { return style_; }

private:
    EncodeStyle style_;
};

} // namespace isots::codec
