#pragma once

#include <string>

namespace isots::config {

struct CodecSettings {
    std::string encode_style = "canonical";  // "canonical" or "legacy"
    bool validate_time_of_day = true;
};

struct Settings {
    CodecSettings codec;

    static Settings from_environment();
    static Settings strict();
    static Settings legacy();
};

} // namespace isots::config
