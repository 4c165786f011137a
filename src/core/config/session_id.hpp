#pragma once
#include <string>
#include <random>
#include <sstream>

namespace continuity::core::config {

    // Generates an 8-character hex ID with the given prefix, e.g. "sess-1f0c9a3e"
    inline std::string generate_session_id(const std::string& prefix = "sess-") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace continuity::core::config
