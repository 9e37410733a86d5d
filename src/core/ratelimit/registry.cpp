#include "shardwire/core/ratelimit/registry.hpp"

#include "lcr/log/logger.hpp"


namespace shardwire::core::ratelimit {

std::shared_ptr<Gate> Registry::gate_for(std::string_view route_class, std::string_view major) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = join_(route_class, major);
    if (auto it = routes_.find(key); it != routes_.end()) {
        return it->second;
    }
    std::shared_ptr<Gate> gate;
    if (auto h = hashes_.find(std::string(route_class)); h != hashes_.end()) {
        auto& slot = buckets_[join_(h->second, major)];
        if (!slot) {
            slot = std::make_shared<Gate>(std::make_shared<LedgerEntry>());
        }
        gate = slot;
    }
    else {
        gate = std::make_shared<Gate>(std::make_shared<LedgerEntry>());
        SW_TRACE("[RATELIMIT] Provisional gate for " << key);
    }
    routes_.emplace(key, gate);
    return gate;
}

std::shared_ptr<Gate> Registry::discover(std::string_view route_class, std::string_view major, std::string_view bucket_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = join_(route_class, major);
    const std::string bucket_key = join_(bucket_hash, major);
    hashes_[std::string(route_class)] = std::string(bucket_hash);

    auto& current = routes_[key];
    if (!current) {
        current = std::make_shared<Gate>(std::make_shared<LedgerEntry>());
    }
    auto it = buckets_.find(bucket_key);
    if (it == buckets_.end()) {
        buckets_.emplace(bucket_key, current);
        SW_DEBUG("[RATELIMIT] Route " << key << " bound to bucket " << bucket_hash);
        return current;
    }
    if (it->second == current) {
        return current;
    }
    if (it->second->dirty()) {
        SW_DEBUG("[RATELIMIT] Route " << key << " merged into existing bucket " << bucket_hash);
        const auto existing = it->second;
        rewrite_(current, existing);
        return existing;
    }
    SW_DEBUG("[RATELIMIT] Unused gate of bucket " << bucket_hash << " replaced by route " << key);
    const auto replacement = current;
    rewrite_(it->second, replacement);
    it->second = replacement;
    return replacement;
}

std::size_t Registry::route_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.size();
}

std::size_t Registry::bucket_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

std::string Registry::join_(std::string_view a, std::string_view b) {
    std::string out;
    out.reserve(a.size() + b.size() + 1);
    out.append(a);
    out += '|';
    out.append(b);
    return out;
}

void Registry::rewrite_(const std::shared_ptr<Gate>& from, const std::shared_ptr<Gate>& to) {
    // Copy: the reference may alias a map slot that is about to change
    const std::shared_ptr<Gate> old = from;
    for (auto& [key, gate] : routes_) {
        if (gate == old) {
            gate = to;
        }
    }
}

} // namespace shardwire::core::ratelimit
