#pragma once

#include <cstdint>
#include <string>

#include "shardwire/core/gateway/schema/identify.hpp"
#include "shardwire/core/config/gateway.hpp"


namespace shardwire::core::gateway {

// Runtime settings of one shard.
struct ShardConfig {
    std::uint32_t shard_id{0};
    std::uint32_t shard_count{1};

    std::string token{};
    std::uint64_t intents{0};

    std::string gateway_url{config::gateway::DEFAULT_URL};
    bool compress{true};                 // zlib-stream transport compression

    std::uint32_t large_threshold{config::gateway::LARGE_THRESHOLD};
    schema::IdentifyProperties properties{};
    std::string presence{};              // raw JSON, empty = omitted
};

} // namespace shardwire::core::gateway
