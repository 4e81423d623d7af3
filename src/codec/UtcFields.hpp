#pragma once

#include "domain/value_objects/Timestamp.hpp"

namespace isots::codec {

// Proleptic Gregorian UTC breakdown of a Timestamp.
struct UtcFields {
    int year;
    unsigned month;    // 1..12
    unsigned day;      // 1..31
    int hour;          // 0..23
    int minute;        // 0..59
    int second;        // 0..59
    int millisecond;   // 0..999

    // Exact for every int64 millisecond count, about +-292 million years.
    static UtcFields from_timestamp(domain::Timestamp ts);

    bool operator==(const UtcFields&) const = default;
};

} // namespace isots::codec
