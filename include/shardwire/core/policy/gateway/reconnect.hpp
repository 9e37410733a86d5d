#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>

namespace shardwire::core::policy::gateway {

/*
===============================================================================
 Shard Reconnect Policy
===============================================================================

Decides whether a shard may attempt another connection and how long it waits
before doing so.

attempt is 1-based and counts attempts since the shard was last Ready. It is
reset when a session reaches Ready.

-------------------------------------------------------------------------------
 Modes
-------------------------------------------------------------------------------

1) Bounded<MaxAttempts, BaseMs, MaxMs>
   - At most MaxAttempts consecutive attempts, then ReconnectCheckFailed
   - First attempt immediate, then BaseMs * 2^(attempt - 2) capped at MaxMs

2) Unbounded<BaseMs, MaxMs>
   - Never gives up, same backoff curve

-------------------------------------------------------------------------------
 Example
-------------------------------------------------------------------------------

using MyShardPolicies = shard_bundle<
    reconnect::Bounded<10, 500, 30000>
>;

===============================================================================
*/


// ============================================================================
// Reconnect Policy Concept
// ============================================================================
//
// A valid ReconnectPolicy must expose:
//
//   static bool allow(std::uint32_t attempt);
//   static std::chrono::milliseconds backoff(std::uint32_t attempt);
//
// ============================================================================

template<typename P>
concept ReconnectPolicy =
requires(std::uint32_t attempt) {
    { P::allow(attempt) } -> std::same_as<bool>;
    { P::backoff(attempt) } -> std::convertible_to<std::chrono::milliseconds>;
};


namespace reconnect {

namespace detail {

template<std::uint32_t BaseMs, std::uint32_t MaxMs>
[[nodiscard]]
constexpr std::chrono::milliseconds exponential(std::uint32_t attempt) noexcept {
    if (attempt <= 1) {
        return std::chrono::milliseconds{0};
    }
    // Clamp exponent to avoid overflow
    const std::uint32_t exp = (attempt - 2 < 16) ? attempt - 2 : 16;
    const std::uint64_t delay = static_cast<std::uint64_t>(BaseMs) << exp;
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(delay < MaxMs ? delay : MaxMs)};
}

} // namespace detail

template<
    std::uint32_t MaxAttempts = 10,
    std::uint32_t BaseMs = 1000,
    std::uint32_t MaxMs = 60000
>
requires (MaxAttempts > 0) && (BaseMs <= MaxMs)
struct Bounded {

    static constexpr std::uint32_t max_attempts = MaxAttempts;

    [[nodiscard]]
    static constexpr bool allow(std::uint32_t attempt) noexcept {
        return attempt <= MaxAttempts;
    }

    [[nodiscard]]
    static constexpr std::chrono::milliseconds backoff(std::uint32_t attempt) noexcept {
        return detail::exponential<BaseMs, MaxMs>(attempt);
    }
};

template<
    std::uint32_t BaseMs = 1000,
    std::uint32_t MaxMs = 60000
>
requires (BaseMs <= MaxMs)
struct Unbounded {

    [[nodiscard]]
    static constexpr bool allow(std::uint32_t) noexcept {
        return true;
    }

    [[nodiscard]]
    static constexpr std::chrono::milliseconds backoff(std::uint32_t attempt) noexcept {
        return detail::exponential<BaseMs, MaxMs>(attempt);
    }
};

} // namespace reconnect

} // namespace shardwire::core::policy::gateway
