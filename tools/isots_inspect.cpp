#include "codec/Iso8601Codec.hpp"
#include "config/Settings.hpp"
#include "infrastructure/InspectReport.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: isots_inspect <iso8601> [iso8601 ...]" << std::endl;
        std::cerr << "       isots_inspect --encode <millis> [millis ...]" << std::endl;
        std::cerr << "       Set ISOTS_PROFILE=legacy for the legacy output format." << std::endl;
        return 1;
    }

    auto settings = isots::config::Settings::from_environment();

    std::unique_ptr<isots::codec::Iso8601Codec> codec;
    try {
        codec = std::make_unique<isots::codec::Iso8601Codec>(settings.codec);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << std::endl;
        return 1;
    }
    isots::infrastructure::InspectReport report(*codec);

    std::cerr << "[inspect] encode_style=" << settings.codec.encode_style
              << " validate_time_of_day=" << (settings.codec.validate_time_of_day ? "true" : "false")
              << std::endl;

    bool encode_mode = false;
    int first = 1;
    if (std::string(argv[1]) == "--encode") {
        encode_mode = true;
        first = 2;
    }

    int failures = 0;
    for (int i = first; i < argc; ++i) {
        if (encode_mode) {
            try {
                std::cout << report.describe_encode(argv[i]).dump() << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[error] Not a millisecond count: " << argv[i]
                          << " (" << e.what() << ")" << std::endl;
                ++failures;
            }
            continue;
        }

        auto line = report.describe_decode(argv[i]);
        if (!line["ok"].get<bool>()) {
            ++failures;
        }
        std::cout << line.dump() << std::endl;
    }

    std::cerr << "[inspect] Done. " << (argc - first) << " inputs, "
              << failures << " failed." << std::endl;
    return failures == 0 ? 0 : 2;
}
