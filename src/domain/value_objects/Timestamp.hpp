#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace isots::domain {

// Milliseconds since 1970-01-01T00:00:00.000Z. Negative values are pre-epoch.
class Timestamp {
public:
    explicit Timestamp(int64_t milliseconds_since_epoch);

    // Parses a decimal millisecond count, e.g. "1451606400000" or "-1".
    static Timestamp from_string(const std::string& str);
    static Timestamp epoch();

    int64_t milliseconds() const noexcept { return ms_; }

    bool operator==(const Timestamp&) const = default;
    auto operator<=>(const Timestamp&) const = default;

private:
    int64_t ms_;
};

} // namespace isots::domain
