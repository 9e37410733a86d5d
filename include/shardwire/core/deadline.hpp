#pragma once

#include <chrono>


namespace shardwire::core {

/*
===============================================================================
 shardwire::core::Deadline
===============================================================================

Single "suspend until T" primitive shared by every time-based wait in the
library:

  - Gate waits until the bucket reset instant
  - Shard heartbeat cadence
  - Shard reconnect backoff
  - Identify throttle windows (through Gate)

A Deadline is either disarmed or armed at an absolute steady-clock instant.
It never fires by itself: poll-driven owners ask expired(now) on each poll,
blocking owners pass at() to a condition variable. Cancelling is disarming,
which keeps cancellation identical for all waits.
===============================================================================
*/

class Deadline {
public:
    using clock      = std::chrono::steady_clock;
    using time_point = clock::time_point;

    Deadline() noexcept = default;

    inline void arm_at(time_point at) noexcept {
        at_ = at;
        armed_ = true;
    }

    template<class Rep, class Period>
    inline void arm_in(std::chrono::duration<Rep, Period> d, time_point now = clock::now()) noexcept {
        arm_at(now + std::chrono::duration_cast<clock::duration>(d));
    }

    inline void cancel() noexcept {
        armed_ = false;
        at_ = time_point{};
    }

    [[nodiscard]]
    inline bool armed() const noexcept {
        return armed_;
    }

    // A disarmed deadline never expires.
    [[nodiscard]]
    inline bool expired(time_point now = clock::now()) const noexcept {
        return armed_ && now >= at_;
    }

    [[nodiscard]]
    inline time_point at() const noexcept {
        return at_;
    }

    // Time left until expiry, clamped at zero. Zero when disarmed.
    [[nodiscard]]
    inline std::chrono::milliseconds remaining(time_point now = clock::now()) const noexcept {
        if (!armed_ || now >= at_) {
            return std::chrono::milliseconds{0};
        }
        return std::chrono::ceil<std::chrono::milliseconds>(at_ - now);
    }

private:
    time_point at_{};
    bool armed_{false};
};

} // namespace shardwire::core
