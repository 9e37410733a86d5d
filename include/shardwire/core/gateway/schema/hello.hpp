#pragma once

#include <chrono>


namespace shardwire::core::gateway::schema {

// op 10: {"op":10,"d":{"heartbeat_interval":41250}}
struct Hello {
    std::chrono::milliseconds heartbeat_interval{0};
};

} // namespace shardwire::core::gateway::schema
