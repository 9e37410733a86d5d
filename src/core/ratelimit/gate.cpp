#include "shardwire/core/ratelimit/gate.hpp"

#include <utility>

#include "lcr/log/logger.hpp"


namespace shardwire::core::ratelimit {

Gate::Gate(std::shared_ptr<LedgerEntry> entry)
    : entry_(entry ? std::move(entry) : std::make_shared<LedgerEntry>())
{
}

Gate::Permit Gate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    const std::uint64_t ticket = next_ticket_++;
    cv_.wait(lock, [&] { return serving_ == ticket; });

    Deadline reset;
    while (!evaluate_(Deadline::clock::now(), reset)) {
        SW_TRACE("[GATE] Exhausted, waiting " << reset.remaining().count() << " ms for reset");
        // update() notifies, so a refreshed reset_at is picked up on wake-up
        cv_.wait_until(lock, reset.at());
    }
    grant_();
    return Permit{this};
}

bool Gate::try_acquire(Permit& out, std::chrono::milliseconds& wait) {
    wait = std::chrono::milliseconds{0};
    {
        std::unique_lock<std::mutex> lock(mutex_);
        Deadline reset;
        if (exhausted_(Deadline::clock::now(), reset)) {
            wait = reset.remaining();
            return false;
        }

        // Not exhausted: queue behind the callers in flight, they only hold
        // the serialization ticket for the length of one exchange
        const std::uint64_t ticket = next_ticket_++;
        cv_.wait(lock, [&] { return serving_ == ticket; });

        const auto now = Deadline::clock::now();
        if (!evaluate_(now, reset)) {
            // The callers ahead consumed the bucket: hand the ticket on
            wait = reset.remaining(now);
            ++serving_;
            lock.unlock();
            cv_.notify_all();
            SW_TRACE("[GATE] Exhausted while queued, would wait " << wait.count() << " ms");
            return false;
        }
        grant_();
    }
    // Assigned outside the lock: releasing a previous permit locks the gate
    out = Permit{this};
    return true;
}

void Gate::update(int remaining, std::chrono::milliseconds reset_after) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry_->remaining = remaining;
        entry_->reset_at = Deadline::clock::now() + reset_after;
        dirty_ = true;
    }
    cv_.notify_all();
}

void Gate::set_limit(int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    entry_->limit = limit;
}

void Gate::set_unlimited(bool unlimited) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry_->unlimited = unlimited;
    }
    cv_.notify_all();
}

bool Gate::dirty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirty_;
}

lcr::optional<int> Gate::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entry_->remaining;
}

lcr::optional<int> Gate::limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entry_->limit;
}

std::uint64_t Gate::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_ticket_ - serving_;
}

bool Gate::exhausted_(Deadline::time_point now, Deadline& reset) const {
    const LedgerEntry& e = *entry_;
    if (e.unlimited || !e.remaining.has() || e.remaining.value() > 0 || !e.reset_at.has()) {
        return false;
    }
    reset.arm_at(e.reset_at.value());
    return !reset.expired(now);
}

bool Gate::evaluate_(Deadline::time_point now, Deadline& reset) {
    LedgerEntry& e = *entry_;
    if (e.unlimited) {
        return true;
    }
    if (!e.remaining.has()) {
        return true;
    }
    if (e.remaining.value() > 0) {
        --e.remaining.value();
        return true;
    }
    if (!e.reset_at.has()) {
        // Exhausted without a known reset instant: nothing to wait for
        return true;
    }
    reset.arm_at(e.reset_at.value());
    // A reset_at in the past grants without replenishing remaining
    return reset.expired(now);
}

void Gate::grant_() noexcept {
    if (entry_->limit.has()) {
        dirty_ = true;
    }
}

void Gate::release_() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++serving_;
    }
    cv_.notify_all();
}

} // namespace shardwire::core::ratelimit
