#pragma once

#include <cstdint>
#include <string>


namespace shardwire::core::gateway {

// Opcode 0 payload handed to the consumer verbatim.
// data is the minified JSON text of the "d" field.
struct DispatchEvent {
    std::uint32_t shard_id{0};
    std::uint64_t sequence{0};
    std::string name;
    std::string data;
};

} // namespace shardwire::core::gateway
