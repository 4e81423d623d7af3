#pragma once

#include <compare>
#include <cstdint>

namespace isots::domain {

// Signed distance of a local clock reading from UTC, in minutes.
class UtcOffset {
public:
    explicit UtcOffset(int64_t minutes);

    static UtcOffset utc();
    // sign must be +1 or -1.
    static UtcOffset from_parts(int sign, int64_t hours, int64_t minutes);

    int64_t minutes() const noexcept { return minutes_; }

    bool operator==(const UtcOffset&) const = default;
    auto operator<=>(const UtcOffset&) const = default;

private:
    int64_t minutes_;
};

} // namespace isots::domain
