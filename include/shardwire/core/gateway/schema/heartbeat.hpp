#pragma once

#include <cstdint>
#include <string>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace shardwire::core::gateway::schema {

// op 1: {"op":1,"d":<last sequence or null>}
struct Heartbeat {
    lcr::optional<std::uint64_t> sequence{};

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(32);
        out += "{\"op\":1,\"d\":";
        if (sequence.has()) {
            lcr::json::append(out, sequence.value());
        }
        else {
            out += "null";
        }
        out += '}';
        return out;
    }
};

} // namespace shardwire::core::gateway::schema
