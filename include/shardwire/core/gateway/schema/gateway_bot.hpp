#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "lcr/optional.hpp"


namespace shardwire::core::gateway::schema {

struct SessionStartLimit {
    std::uint32_t total{0};
    std::uint32_t remaining{0};
    std::chrono::milliseconds reset_after{0};
    std::uint32_t max_concurrency{1};
};

// Gateway discovery answer. shards and session_start_limit are present only
// on the authenticated endpoint.
struct GatewayBot {
    std::string url;
    lcr::optional<std::uint32_t> shards;
    lcr::optional<std::uint32_t> max_concurrency;
    SessionStartLimit session_start_limit{};
};

} // namespace shardwire::core::gateway::schema
