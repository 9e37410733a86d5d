#pragma once

#include <cstdint>
#include <string>

#include "shardwire/core/config/gateway.hpp"
#include "lcr/json.hpp"


namespace shardwire::core::gateway::schema {

struct IdentifyProperties {
    std::string os{config::gateway::PROPERTY_OS};
    std::string browser{config::gateway::PROPERTY_BROWSER};
    std::string device{config::gateway::PROPERTY_DEVICE};
};

// op 2. presence is raw JSON written verbatim; empty means omitted.
// Payload compression is never requested: transport compression is
// negotiated through the url instead.
struct Identify {
    std::string token;
    std::uint64_t intents{0};
    std::uint32_t shard_id{0};
    std::uint32_t shard_count{1};
    std::uint32_t large_threshold{config::gateway::LARGE_THRESHOLD};
    IdentifyProperties properties{};
    std::string presence{};

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(256 + token.size() + presence.size());
        out += "{\"op\":2,\"d\":{";
        lcr::json::append_string_field(out, "token", token);
        out += ",\"intents\":";
        lcr::json::append(out, intents);
        out += ",\"properties\":{";
        lcr::json::append_string_field(out, "os", properties.os);
        out += ',';
        lcr::json::append_string_field(out, "browser", properties.browser);
        out += ',';
        lcr::json::append_string_field(out, "device", properties.device);
        out += "},\"shard\":[";
        lcr::json::append(out, shard_id);
        out += ',';
        lcr::json::append(out, shard_count);
        out += "],\"large_threshold\":";
        lcr::json::append(out, large_threshold);
        out += ",\"compress\":false";
        if (!presence.empty()) {
            out += ",\"presence\":";
            out += presence;
        }
        out += "}}";
        return out;
    }
};

} // namespace shardwire::core::gateway::schema
