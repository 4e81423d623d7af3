#pragma once

#include "codec/Iso8601Decoder.hpp"
#include "codec/Iso8601Encoder.hpp"
#include "config/Settings.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <string>
#include <string_view>

namespace isots::codec {

class Iso8601Codec {
public:
    // Throws std::invalid_argument for an unknown encode_style.
    explicit Iso8601Codec(const config::CodecSettings& settings = config::CodecSettings{});

    DecodeResult decode(std::string_view text) const;
    std::string encode(domain::Timestamp ts) const;

    // Same as decode, but reports failure as domain::ParseException.
    domain::Timestamp decode_or_throw(std::string_view text) const;

    const Iso8601Encoder& encoder() const noexcept { return encoder_; }

private:
    Iso8601Decoder decoder_;
    Iso8601Encoder encoder_;
};

// Strict decoding and canonical encoding.
DecodeResult decode(std::string_view text);
std::string encode(domain::Timestamp ts);

} // namespace isots::codec
