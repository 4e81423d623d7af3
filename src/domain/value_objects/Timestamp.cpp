#include "domain/value_objects/Timestamp.hpp"

#include <stdexcept>

namespace isots::domain {

Timestamp::Timestamp(int64_t milliseconds_since_epoch) : ms_(milliseconds_since_epoch) {}

Timestamp Timestamp::from_string(const std::string& str) {
    std::size_t consumed = 0;
    long long value = std::stoll(str, &consumed);
    if (consumed != str.size()) {
        throw std::invalid_argument("Timestamp has trailing characters: " + str);
    }
    return Timestamp(value);
}

Timestamp Timestamp::epoch() {
    return Timestamp(0);
}

} // namespace isots::domain
