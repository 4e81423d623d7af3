#include "domain/value_objects/UtcOffset.hpp"

#include <stdexcept>
#include <string>

namespace isots::domain {

UtcOffset::UtcOffset(int64_t minutes) : minutes_(minutes) {}

UtcOffset UtcOffset::utc() {
    return UtcOffset(0);
}

UtcOffset UtcOffset::from_parts(int sign, int64_t hours, int64_t minutes) {
    if (sign != 1 && sign != -1) {
        throw std::invalid_argument("UtcOffset sign must be +1 or -1, got: " + std::to_string(sign));
    }
    return UtcOffset(sign * (hours * 60 + minutes));
}

} // namespace isots::domain
