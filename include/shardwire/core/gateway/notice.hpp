#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "shardwire/core/gateway/error.hpp"
#include "lcr/optional.hpp"


namespace shardwire::core::gateway {

enum class NoticeKind : std::uint8_t {
    Connected,      // transport open (per attempt)
    Identified,     // READY received
    Resumed,        // RESUMED received
    Disconnected    // transport gone; error tells whether the shard gave up
};

[[nodiscard]]
inline constexpr std::string_view to_string(NoticeKind k) noexcept {
    switch (k) {
        case NoticeKind::Connected:    return "Connected";
        case NoticeKind::Identified:   return "Identified";
        case NoticeKind::Resumed:      return "Resumed";
        case NoticeKind::Disconnected: return "Disconnected";
        default:                       return "Unknown";
    }
}

// Edge-triggered lifecycle fact of one shard.
// A Disconnected notice whose error is_terminal() is emitted once per shard
// lifetime and is the last notice of that shard.
struct LifecycleNotice {
    std::uint32_t shard_id{0};
    NoticeKind kind{NoticeKind::Connected};
    Error error{Error::None};
    lcr::optional<std::uint16_t> close_code{};
    std::string reason{};

    [[nodiscard]]
    inline bool terminal() const noexcept {
        return kind == NoticeKind::Disconnected && is_terminal(error);
    }
};

} // namespace shardwire::core::gateway
