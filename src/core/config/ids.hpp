#pragma once
#include <random>
#include <sstream>
#include <string>

namespace hearth::core::config {

    // "<prefix>-" followed by 8 random hex digits.
    inline std::string generate_id(const std::string& prefix) {
        static thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // 32 hex digits, used where ids must be unique across processes.
    inline std::string generate_long_id() {
        static thread_local std::mt19937_64 gen{std::random_device{}()};
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < 32; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace hearth::core::config
