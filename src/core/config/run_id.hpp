#pragma once
#include <string>
#include <random>
#include <sstream>

namespace ael::core::config {

    // Generates a random 12-character hex ID with the given prefix,
    // e.g. "exec-3fa9c01b7e22".
    inline std::string generate_id(const std::string& prefix) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < 12; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_run_id() {
        return generate_id("exec-");
    }

} // namespace ael::core::config
