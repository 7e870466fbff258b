#pragma once
#include <random>
#include <sstream>
#include <string>

namespace facetmcp::core::config {

    // 8 random hex digits behind a prefix, e.g. "conn-3fa94c0e"
    inline std::string generate_id(const std::string& prefix) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_connection_id() {
        return generate_id("conn");
    }

    inline std::string generate_instance_id() {
        return generate_id("srv");
    }

} // namespace facetmcp::core::config
