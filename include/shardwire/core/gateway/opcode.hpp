#pragma once

#include <cstdint>
#include <string_view>


namespace shardwire::core::gateway {

enum class Opcode : std::uint8_t {
    Dispatch            = 0,
    Heartbeat           = 1,
    Identify            = 2,
    PresenceUpdate      = 3,
    VoiceStateUpdate    = 4,
    Resume              = 6,
    Reconnect           = 7,
    RequestGuildMembers = 8,
    InvalidSession      = 9,
    Hello               = 10,
    HeartbeatAck        = 11
};

[[nodiscard]]
inline constexpr std::string_view to_string(Opcode op) noexcept {
    switch (op) {
        case Opcode::Dispatch:            return "Dispatch";
        case Opcode::Heartbeat:           return "Heartbeat";
        case Opcode::Identify:            return "Identify";
        case Opcode::PresenceUpdate:      return "PresenceUpdate";
        case Opcode::VoiceStateUpdate:    return "VoiceStateUpdate";
        case Opcode::Resume:              return "Resume";
        case Opcode::Reconnect:           return "Reconnect";
        case Opcode::RequestGuildMembers: return "RequestGuildMembers";
        case Opcode::InvalidSession:      return "InvalidSession";
        case Opcode::Hello:               return "Hello";
        case Opcode::HeartbeatAck:        return "HeartbeatAck";
        default:                          return "Unknown";
    }
}

} // namespace shardwire::core::gateway
