#include "codec/Iso8601Encoder.hpp"

#include "codec/UtcFields.hpp"

#include <array>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <utility>

namespace isots::codec {

namespace {

constexpr std::array<std::pair<std::chrono::month, std::string_view>, 12> kMonthCodes{{
    {std::chrono::January, "01"},
    {std::chrono::February, "02"},
    {std::chrono::March, "03"},
    {std::chrono::April, "04"},
    {std::chrono::May, "05"},
    {std::chrono::June, "06"},
    {std::chrono::July, "07"},
    {std::chrono::August, "08"},
    {std::chrono::September, "09"},
    {std::chrono::October, "10"},
    {std::chrono::November, "11"},
    {std::chrono::December, "12"},
}};

std::string_view month_code(unsigned month) {
    const std::chrono::month m{month};
    for (const auto& [name, code] : kMonthCodes) {
        if (name == m) return code;
    }
    return "00";
}

} // anonymous namespace

Iso8601Encoder::Iso8601Encoder(EncodeStyle style) : style_(style) {}

std::string Iso8601Encoder::encode(domain::Timestamp ts) const {
    const UtcFields f = UtcFields::from_timestamp(ts);

    std::ostringstream out;
    out << std::setfill('0');
    if (f.year < 0) out << '-';
    out << std::setw(4) << std::abs(f.year)
        << '-' << month_code(f.month)
        << '-' << std::setw(2) << f.day
        << 'T' << std::setw(2) << f.hour
        << ':' << std::setw(2) << f.minute
        << ':' << std::setw(2) << f.second;

    if (style_ == EncodeStyle::LEGACY) {
        out << ':' << std::setw(2) << f.millisecond;
    } else {
        out << '.' << std::setw(3) << f.millisecond;
    }
    out << 'Z';
    return out.str();
}

} // namespace isots::codec
