#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <condition_variable>

#include "shardwire/core/ratelimit/ledger_entry.hpp"
#include "shardwire/core/deadline.hpp"
#include "lcr/optional.hpp"


namespace shardwire::core::ratelimit {

/*
===============================================================================
 ratelimit::Gate
===============================================================================

Serializes and throttles concurrent acquisitions against one LedgerEntry.

The server is the only source of truth for remaining permits and reset timing.
The Gate replays what it was last told and never invents a replenishment
model: after a wait it grants without touching remaining or reset_at, and the
next update() from the permit holder refreshes them.

-------------------------------------------------------------------------------
 Acquisition algorithm (per caller, in arrival order)
-------------------------------------------------------------------------------
  1. Wait for the caller's FIFO ticket to be served
  2. unlimited                 -> grant
  3. remaining unknown         -> grant (nothing to decrement)
  4. remaining > 0             -> decrement, grant
  5. remaining <= 0            -> wait until reset_at (deadline re-read on every
                                  wake-up, update() wakes the waiter), grant
  6. grant under a known limit -> gate becomes dirty

The permit keeps the ticket served until it is destroyed, so guarded sections
of one Gate never overlap. Releasing has no other side effect.

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
  - acquire() blocks the calling thread
  - try_acquire() never suspends for the rate limit. It fails at once, with
    the wait, when the bucket is exhausted until a future reset_at; otherwise
    it queues behind the callers in flight and fails only if they exhausted
    the bucket meanwhile
  - update() / set_unlimited() may be called while holding a permit
  - A thread must not acquire the same Gate twice without releasing
  - The Gate must outlive every Permit it issued
===============================================================================
*/

class Gate {
public:
    class Permit {
    public:
        Permit() noexcept = default;

        Permit(Permit&& other) noexcept
            : gate_(other.gate_)
        {
            other.gate_ = nullptr;
        }

        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                reset_();
                gate_ = other.gate_;
                other.gate_ = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        ~Permit() {
            reset_();
        }

        [[nodiscard]]
        inline bool valid() const noexcept {
            return gate_ != nullptr;
        }

    private:
        friend class Gate;

        explicit Permit(Gate* gate) noexcept
            : gate_(gate)
        {}

        inline void reset_() noexcept {
            if (gate_) {
                gate_->release_();
                gate_ = nullptr;
            }
        }

        Gate* gate_{nullptr};
    };

public:
    explicit Gate(std::shared_ptr<LedgerEntry> entry);

    Gate(const Gate&) = delete;
    Gate& operator=(const Gate&) = delete;

    // Blocks until a permit is granted. Never fails.
    [[nodiscard]]
    Permit acquire();

    // Acquisition without rate-limit suspension. On failure, wait holds the
    // time until the bucket resets. out must not hold a permit of this gate.
    [[nodiscard]]
    bool try_acquire(Permit& out, std::chrono::milliseconds& wait);

    // Authoritative server state observed after an exchange.
    void update(int remaining, std::chrono::milliseconds reset_after);

    // Record the window size reported by the server.
    void set_limit(int limit);

    // Exempt (or re-include) the bucket. Effective on the next acquisition.
    void set_unlimited(bool unlimited);

    [[nodiscard]]
    bool dirty() const;

    [[nodiscard]]
    lcr::optional<int> remaining() const;

    [[nodiscard]]
    lcr::optional<int> limit() const;

    // Callers currently waiting for or holding a permit
    [[nodiscard]]
    std::uint64_t pending() const;

    [[nodiscard]]
    const std::shared_ptr<LedgerEntry>& entry() const noexcept {
        return entry_;
    }

private:
    // Applies steps 2-5 for the served caller. Returns true when the caller may
    // be granted now; otherwise reset holds the instant to wait for.
    [[nodiscard]]
    bool evaluate_(Deadline::time_point now, Deadline& reset);

    // remaining <= 0 with a reset_at still ahead of now
    [[nodiscard]]
    bool exhausted_(Deadline::time_point now, Deadline& reset) const;

    void grant_() noexcept;
    void release_() noexcept;

private:
    std::shared_ptr<LedgerEntry> entry_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    // FIFO tickets: next_ticket_ is handed to the next arrival,
    // serving_ is the ticket allowed to evaluate / hold the permit.
    std::uint64_t next_ticket_{0};
    std::uint64_t serving_{0};

    bool dirty_{false};
};

} // namespace shardwire::core::ratelimit
