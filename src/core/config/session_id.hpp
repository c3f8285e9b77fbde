#pragma once
#include <random>
#include <sstream>
#include <string>

namespace toolpilot::core::config {

    // "<prefix>" followed by 8 random hex digits, e.g. "session-3fa0c91b"
    inline std::string generate_id(const std::string& prefix) {
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

    inline std::string generate_session_id() {
        return generate_id("session-");
    }

} // namespace toolpilot::core::config
