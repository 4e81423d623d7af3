#include "codec/Iso8601Codec.hpp"

#include <utility>
#include <variant>

namespace isots::codec {

Iso8601Codec::Iso8601Codec(const config::CodecSettings& settings)
    : decoder_(settings.validate_time_of_day)
    , encoder_(encode_style_from_string(settings.encode_style)) {}

DecodeResult Iso8601Codec::decode(std::string_view text) const {
    return decoder_.decode(text);
}

std::string Iso8601Codec::encode(domain::Timestamp ts) const {
    return encoder_.encode(ts);
}

domain::Timestamp Iso8601Codec::decode_or_throw(std::string_view text) const {
    auto result = decoder_.decode(text);
    if (auto* error = std::get_if<domain::ParseError>(&result)) {
        throw domain::ParseException(std::move(*error));
    }
    return std::get<domain::Timestamp>(result);
}

DecodeResult decode(std::string_view text) {
    return Iso8601Decoder().decode(text);
}

std::string encode(domain::Timestamp ts) {
    return Iso8601Encoder().encode(ts);
}

} // namespace isots::codec
