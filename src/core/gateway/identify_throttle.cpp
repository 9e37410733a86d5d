#include "shardwire/core/gateway/identify_throttle.hpp"

#include <algorithm>

#include "lcr/log/logger.hpp"


namespace shardwire::core::gateway {

IdentifyThrottle::IdentifyThrottle(std::uint32_t max_concurrency, std::chrono::milliseconds window)
    : window_(window)
{
    reset(max_concurrency);
}

void IdentifyThrottle::enqueue(std::uint32_t shard_id) {
    auto& q = buckets_[bucket_of(shard_id)].queue;
    if (std::find(q.begin(), q.end(), shard_id) != q.end()) {
        return;
    }
    q.push_back(shard_id);
    SW_TRACE("[THROTTLE] Shard " << shard_id << " queued in bucket " << bucket_of(shard_id) << " (position " << q.size() << ")");
}

bool IdentifyThrottle::try_acquire(std::uint32_t shard_id, std::chrono::milliseconds& wait) {
    wait = std::chrono::milliseconds{0};
    Bucket& bucket = buckets_[bucket_of(shard_id)];
    if (bucket.queue.empty() || bucket.queue.front() != shard_id) {
        return false;
    }
    ratelimit::Gate::Permit permit;
    if (!bucket.gate->try_acquire(permit, wait)) {
        return false;
    }
    // Consume the window while holding the permit
    bucket.gate->update(0, window_);
    bucket.queue.pop_front();
    SW_DEBUG("[THROTTLE] Identify granted to shard " << shard_id << " (bucket " << bucket_of(shard_id) << ")");
    return true;
}

void IdentifyThrottle::cancel(std::uint32_t shard_id) {
    auto& q = buckets_[bucket_of(shard_id)].queue;
    q.erase(std::remove(q.begin(), q.end(), shard_id), q.end());
}

void IdentifyThrottle::reset(std::uint32_t max_concurrency) {
    if (max_concurrency == 0) {
        SW_WARN("[THROTTLE] max_concurrency 0 replaced by 1");
        max_concurrency = 1;
    }
    buckets_.clear();
    buckets_.resize(max_concurrency);
    for (auto& b : buckets_) {
        b.gate = std::make_unique<ratelimit::Gate>(std::make_shared<ratelimit::LedgerEntry>(1, 1));
    }
    SW_DEBUG("[THROTTLE] " << max_concurrency << " identify buckets, window " << window_.count() << " ms");
}

std::size_t IdentifyThrottle::queued(std::size_t bucket) const noexcept {
    return (bucket < buckets_.size()) ? buckets_[bucket].queue.size() : 0;
}

} // namespace shardwire::core::gateway
