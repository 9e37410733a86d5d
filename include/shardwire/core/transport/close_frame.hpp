#pragma once

#include <cstdint>
#include <string>

#include "lcr/optional.hpp"


namespace shardwire::core::transport {

// Close notification reported by a transport.
// An abrupt drop (no CLOSE frame received) carries no code.
struct CloseFrame {
    lcr::optional<std::uint16_t> code{};
    std::string reason;
};

} // namespace shardwire::core::transport
