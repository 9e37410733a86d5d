#pragma once

#include <string_view>

namespace shardwire::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level outcome classification, abstracted away from the concrete
websocket / TLS implementation the application plugs in.

Higher layers (gateway::Shard) decide recovery from this value together with
the close code reported by the transport.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL
    InvalidState,     // Operation not allowed in current state

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint sent a CLOSE frame

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Stalled network, idle timeout
    ConnectionFailed, // DNS, TCP connect, routing
    HandshakeFailed,  // TLS or websocket upgrade failure

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure
};

inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace shardwire::core
