#pragma once

#include <chrono>
#include <concepts>
#include <random>

namespace shardwire::core::policy::gateway {

/*
===============================================================================
 Shard Heartbeat Policy
===============================================================================

Chooses the delay before the first heartbeat after Hello. Later heartbeats
always follow the server interval.

  Jittered   -> interval * U[0, 1), spreads the first beat of many shards
  Immediate  -> first heartbeat right after Hello (deterministic)
===============================================================================
*/

template<typename P>
concept HeartbeatPolicy =
requires(std::chrono::milliseconds interval) {
    { P::first_delay(interval) } -> std::convertible_to<std::chrono::milliseconds>;
};


namespace heartbeat {

struct Jittered {
    [[nodiscard]]
    static std::chrono::milliseconds first_delay(std::chrono::milliseconds interval) {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_real_distribution<double> jitter(0.0, 1.0);
        return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(static_cast<double>(interval.count()) * jitter(rng))};
    }
};

struct Immediate {
    [[nodiscard]]
    static constexpr std::chrono::milliseconds first_delay(std::chrono::milliseconds) noexcept {
        return std::chrono::milliseconds{0};
    }
};

} // namespace heartbeat

} // namespace shardwire::core::policy::gateway
