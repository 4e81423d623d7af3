#pragma once

#include <stdexcept>
#include <string>

namespace isots::codec {

// CANONICAL: YYYY-MM-DDTHH:mm:ss.sssZ, accepted back by the decoder.
// LEGACY:    YYYY-MM-DDTHH:mm:ss:msZ, ':' before the millis and millis padded
//            to two digits, matching output of older producers byte for byte.
enum class EncodeStyle { CANONICAL, LEGACY };

inline EncodeStyle encode_style_from_string(const std::string& str) {
    if (str == "canonical") return EncodeStyle::CANONICAL;
    if (str == "legacy") return EncodeStyle::LEGACY;
    throw std::invalid_argument("Invalid encode style: " + str);
}

} // namespace isots::codec
