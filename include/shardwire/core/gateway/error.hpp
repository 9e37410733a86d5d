#pragma once

#include <string_view>


namespace shardwire::core::gateway {

/*
===============================================================================
 gateway::Error
===============================================================================

Failure classification of one shard. Fatal values end the shard (terminal
Disconnected, surfaced once); the others accompany a reconnect.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Recoverable (shard reconnects) --------------------------------------
    Disconnect,            // Abrupt drop, resumable close code, zombie connection
    SessionInvalidated,    // Session-invalid close code or non-resumable op 9
    UnhandledCloseCode,    // Close code missing from the table: retried, not resumed
    TransportFailure,      // Connect attempt or decompression failed

    // --- Terminal ------------------------------------------------------------
    ReconnectCheckFailed,  // Reconnect policy rejected the next attempt
    InvalidToken,          // 4004
    InvalidShardCount,     // 4010, 4011
    InvalidApiVersion,     // 4012
    InvalidIntents,        // 4013
    DisallowedIntents      // 4014
};

inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                 return "None";
    case Error::Disconnect:           return "Disconnect";
    case Error::SessionInvalidated:   return "SessionInvalidated";
    case Error::UnhandledCloseCode:   return "UnhandledCloseCode";
    case Error::TransportFailure:     return "TransportFailure";
    case Error::ReconnectCheckFailed: return "ReconnectCheckFailed";
    case Error::InvalidToken:         return "InvalidToken";
    case Error::InvalidShardCount:    return "InvalidShardCount";
    case Error::InvalidApiVersion:    return "InvalidApiVersion";
    case Error::InvalidIntents:       return "InvalidIntents";
    case Error::DisallowedIntents:    return "DisallowedIntents";
    default:                          return "Unknown";
    }
}

[[nodiscard]]
inline constexpr bool is_terminal(Error err) noexcept {
    switch (err) {
    case Error::ReconnectCheckFailed:
    case Error::InvalidToken:
    case Error::InvalidShardCount:
    case Error::InvalidApiVersion:
    case Error::InvalidIntents:
    case Error::DisallowedIntents:
        return true;
    default:
        return false;
    }
}

} // namespace shardwire::core::gateway
