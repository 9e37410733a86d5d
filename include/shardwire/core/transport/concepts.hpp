/*
===============================================================================
 TransportConcept (pull-based duplex stream)
===============================================================================

Defines the minimal transport contract required by gateway::Shard.

The transport:

  • Owns the socket, TLS and websocket framing
  • Delivers received bytes as opaque chunks; chunk boundaries carry no
    payload-boundary meaning when compression is enabled
  • Reports closure once, with an optional numeric close code
  • Is created fresh for every connection attempt and destroyed by the Shard

No callbacks. No dynamic dispatch. All calls happen on the poll thread.
===============================================================================
*/
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <concepts>

#include "shardwire/core/transport/error.hpp"
#include "shardwire/core/transport/close_frame.hpp"


namespace shardwire::core::transport {

template<class T>
concept TransportConcept =
    std::default_initializable<T> &&
    requires(
        T t,
        const std::string& url,
        std::string_view msg,
        std::string& chunk,
        CloseFrame& frame,
        std::uint16_t code
    )
{
    // Lifecycle
    { t.connect(url) } noexcept -> std::same_as<Error>;
    { t.close(code) } noexcept -> std::same_as<void>;

    // Sending
    { t.send(msg) } noexcept -> std::same_as<bool>;

    // Receiving (non-blocking)
    { t.poll_chunk(chunk) } noexcept -> std::same_as<bool>;
    { t.poll_close(frame) } noexcept -> std::same_as<bool>;
};

} // namespace shardwire::core::transport
