#pragma once

#include <cstdint>
#include <string>

#include "lcr/json.hpp"


namespace shardwire::core::gateway::schema {

// op 6: {"op":6,"d":{"token":"...","session_id":"...","seq":1337}}
struct Resume {
    std::string token;
    std::string session_id;
    std::uint64_t sequence{0};

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(96 + token.size() + session_id.size());
        out += "{\"op\":6,\"d\":{";
        lcr::json::append_string_field(out, "token", token);
        out += ',';
        lcr::json::append_string_field(out, "session_id", session_id);
        out += ",\"seq\":";
        lcr::json::append(out, sequence);
        out += "}}";
        return out;
    }
};

} // namespace shardwire::core::gateway::schema
