#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

#include "shardwire/core/ratelimit/gate.hpp"
#include "shardwire/core/config/gateway.hpp"


namespace shardwire::core::gateway {

/*
===============================================================================
 gateway::IdentifyThrottle
===============================================================================

Enforces the server's identify concurrency ceiling across the shards of one
manager.

Shards are spread over max_concurrency buckets by shard_id % max_concurrency.
Each bucket is a ratelimit::Gate seeded with limit = 1, remaining = 1; every
identify performs update(0, window) while holding the permit, so the next
identify of the same bucket waits for the window to pass. Buckets are
independent.

Within a bucket identifies are granted in enqueue order: only the head of the
bucket queue may acquire. Poll-driven callers use try_acquire() and retry on
their next poll.
===============================================================================
*/

class IdentifyThrottle {
public:
    explicit IdentifyThrottle(std::uint32_t max_concurrency = 1,
                              std::chrono::milliseconds window = config::gateway::IDENTIFY_WINDOW);

    IdentifyThrottle(const IdentifyThrottle&) = delete;
    IdentifyThrottle& operator=(const IdentifyThrottle&) = delete;

    // Queues shard_id in its bucket. No-op if already queued.
    void enqueue(std::uint32_t shard_id);

    // True when shard_id is at the head of its bucket and the bucket window
    // allows an identify; the window is consumed and shard_id dequeued.
    // Otherwise wait holds the time until the window opens (zero when other
    // shards are ahead).
    [[nodiscard]]
    bool try_acquire(std::uint32_t shard_id, std::chrono::milliseconds& wait);

    // Removes shard_id from its bucket queue (teardown, reconnect).
    void cancel(std::uint32_t shard_id);

    // Rebuilds the buckets. Queued shards are dropped.
    void reset(std::uint32_t max_concurrency);

    [[nodiscard]]
    std::uint32_t max_concurrency() const noexcept {
        return static_cast<std::uint32_t>(buckets_.size());
    }

    [[nodiscard]]
    std::chrono::milliseconds window() const noexcept {
        return window_;
    }

    [[nodiscard]]
    std::size_t bucket_of(std::uint32_t shard_id) const noexcept {
        return shard_id % buckets_.size();
    }

    [[nodiscard]]
    std::size_t queued(std::size_t bucket) const noexcept;

private:
    struct Bucket {
        std::unique_ptr<ratelimit::Gate> gate;
        std::deque<std::uint32_t> queue;
    };

    std::chrono::milliseconds window_;
    std::vector<Bucket> buckets_;
};

} // namespace shardwire::core::gateway
