#pragma once

#include "codec/Iso8601Codec.hpp"
#include "domain/errors/ParseError.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace isots::domain {

void to_json(nlohmann::json& j, const ParseError& error);

} // namespace isots::domain

namespace isots::infrastructure {

// JSON descriptions of codec results, one object per input.
class InspectReport {
public:
    explicit InspectReport(const codec::Iso8601Codec& codec);

    // {"input", "ok", "milliseconds", "encoded"} on success,
    // {"input", "ok", "error"} on failure.
    nlohmann::json describe_decode(std::string_view text) const;

    // {"milliseconds", "encoded"}; throws like Timestamp::from_string.
    nlohmann::json describe_encode(const std::string& milliseconds) const;

private:
    const codec::Iso8601Codec& codec_;
};

} // namespace isots::infrastructure
