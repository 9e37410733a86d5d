#pragma once

#include <chrono>

#include "lcr/optional.hpp"


namespace shardwire::core::ratelimit {

/*
===============================================================================
 ratelimit::LedgerEntry
===============================================================================

Known limit parameters of one server-side rate-limit bucket.

Plain data. It carries no lock: every read and write happens under the lock of
the Gate that references it, and the Registry keeps a single live Gate per
entry once the server bucket is discovered.

Invariants:
  - remaining is written only by Gate::update() or by the single decrement a
    Gate performs when granting with remaining > 0
  - reset_at is derived from the most recent update (now + reset_after) and is
    never extrapolated
  - unlimited overrides every other field on the next acquisition
===============================================================================
*/

struct LedgerEntry {
    using time_point = std::chrono::steady_clock::time_point;

    lcr::optional<int> limit{};          // permits per window, absent until observed
    lcr::optional<int> remaining{};      // permits left in the current window
    lcr::optional<time_point> reset_at{};
    bool unlimited{false};

    LedgerEntry() = default;

    explicit LedgerEntry(int known_limit)
        : limit(known_limit)
    {}

    LedgerEntry(int known_limit, int known_remaining)
        : limit(known_limit)
        , remaining(known_remaining)
    {}

    LedgerEntry(const LedgerEntry&) = delete;
    LedgerEntry& operator=(const LedgerEntry&) = delete;
};

} // namespace shardwire::core::ratelimit
