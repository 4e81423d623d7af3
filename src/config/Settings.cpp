#include "config/Settings.hpp"

#include <cstdlib>

namespace isots::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    const std::string s(val);
    if (s == "true" || s == "1") return true;
    if (s == "false" || s == "0") return false;
    return fallback;
}

// Unknown styles keep the preset's value.
std::string env_style_or(const char* name, const std::string& fallback) {
    std::string style = env_or(name, fallback);
    if (style == "canonical" || style == "legacy") return style;
    return fallback;
}

} // namespace

Settings Settings::from_environment() {
    std::string profile = env_or("ISOTS_PROFILE", "strict");
    Settings s = (profile == "legacy") ? legacy() : strict();
    s.codec.encode_style = env_style_or("ISOTS_ENCODE_STYLE", s.codec.encode_style);
    s.codec.validate_time_of_day = env_bool_or("ISOTS_VALIDATE_TIME_OF_DAY", s.codec.validate_time_of_day);
    return s;
}

Settings Settings::strict() {
    Settings s;
    s.codec.encode_style = "canonical";
    s.codec.validate_time_of_day = true;
    return s;
}

Settings Settings::legacy() {
    Settings s;
    s.codec.encode_style = "legacy";
    s.codec.validate_time_of_day = false;
    return s;
}

} // namespace isots::config
