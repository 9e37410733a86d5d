#pragma once

#include <cstdint>
#include <string_view>


namespace shardwire::core::gateway {

// ===============================================================
// SHARD STATE ENUM
// ===============================================================
enum class State : uint8_t {
    Disconnected,
    Connecting,     // transport open, waiting for Hello
    Identifying,    // waiting for an identify permit, then READY
    Resuming,       // resume sent, waiting for RESUMED
    Ready,
    Reconnecting    // transport torn down, waiting for the backoff deadline
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:  return "Disconnected";
        case State::Connecting:    return "Connecting";
        case State::Identifying:   return "Identifying";
        case State::Resuming:      return "Resuming";
        case State::Ready:         return "Ready";
        case State::Reconnecting:  return "Reconnecting";
        default:                   return "Unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    OpenRequested,
    CloseRequested,

    // --- Transport lifecycle ---
    TransportConnected,
    TransportConnectFailed,

    // --- Gateway protocol ---
    HelloIdentify,        // Hello received, no resumable session
    HelloResume,          // Hello received, resumable session
    SessionReady,         // READY or RESUMED dispatch

    // --- Drops ---
    DropResumable,        // abrupt drop, resumable close, op 7, zombie, op 9 (true)
    DropReidentify,       // session-invalid close, op 9 (false), unhandled close
    DropFatal,            // fatal close code

    // --- Retry ---
    RetryTimerExpired,
    RetryRejected
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:          return "OpenRequested";
        case Event::CloseRequested:         return "CloseRequested";
        case Event::TransportConnected:     return "TransportConnected";
        case Event::TransportConnectFailed: return "TransportConnectFailed";
        case Event::HelloIdentify:          return "HelloIdentify";
        case Event::HelloResume:            return "HelloResume";
        case Event::SessionReady:           return "SessionReady";
        case Event::DropResumable:          return "DropResumable";
        case Event::DropReidentify:         return "DropReidentify";
        case Event::DropFatal:              return "DropFatal";
        case Event::RetryTimerExpired:      return "RetryTimerExpired";
        case Event::RetryRejected:          return "RetryRejected";
        default:                            return "UnknownEvent";
    }
}

} // namespace shardwire::core::gateway
