#include "infrastructure/InspectReport.hpp"

#include "domain/value_objects/Timestamp.hpp"

#include <variant>

using json = nlohmann::json;
using namespace isots::domain;

namespace isots::domain {

void to_json(json& j, const ParseError& error) {
    j = json{
        {"kind", std::string(to_string(error.kind))},
        {"position", error.position},
        {"value", error.value},
        {"message", error.message},
    };
}

} // namespace isots::domain

namespace isots::infrastructure {

InspectReport::InspectReport(const codec::Iso8601Codec& codec) : codec_(codec) {}

json InspectReport::describe_decode(std::string_view text) const {
    json report = {{"input", std::string(text)}};

    auto result = codec_.decode(text);
    if (auto* error = std::get_if<ParseError>(&result)) {
        report["ok"] = false;
        report["error"] = *error;
        return report;
    }

    const auto& ts = std::get<Timestamp>(result);
    report["ok"] = true;
    report["milliseconds"] = ts.milliseconds();
    report["encoded"] = codec_.encode(ts);
    return report;
}

json InspectReport::describe_encode(const std::string& milliseconds) const {
    auto ts = Timestamp::from_string(milliseconds);
    return json{
        {"milliseconds", ts.milliseconds()},
        {"encoded", codec_.encode(ts)},
    };
}

} // namespace isots::infrastructure
