#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "shardwire/core/gateway/shard.hpp"
#include "shardwire/core/gateway/identify_throttle.hpp"
#include "shardwire/core/gateway/schema/gateway_bot.hpp"
#include "shardwire/core/gateway/telemetry/shard.hpp"
#include "shardwire/core/policy/gateway/shard_bundle.hpp"
#include "shardwire/core/config/gateway.hpp"
#include "shardwire/core/telemetry.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace shardwire::core::gateway {

// Runtime settings shared by every shard of a manager.
struct ManagerConfig {
    std::string token{};
    std::uint64_t intents{0};

    // Unset: filled by apply() from /gateway/bot
    lcr::optional<std::uint32_t> shard_count{};

    // Subset of [0, shard_count) run by this manager. Empty = all.
    std::vector<std::uint32_t> shard_ids{};

    // Overrides the server value when set
    lcr::optional<std::uint32_t> max_concurrency{};

    std::string gateway_url{config::gateway::DEFAULT_URL};
    bool compress{true};
    std::chrono::milliseconds identify_window{config::gateway::IDENTIFY_WINDOW};

    std::uint32_t large_threshold{config::gateway::LARGE_THRESHOLD};
    schema::IdentifyProperties properties{};
    std::string presence{};
};

/*
===============================================================================
 shardwire::core::gateway::ShardManager
===============================================================================

Owns the shards of one bot session, the identify throttle they share, and the
consumer queues they feed.

  - start() opens the shards in ascending id order; shard k+1 is only opened
    once shard k has reached Connecting
  - poll() advances every shard and moves its dispatch events and lifecycle
    notices to the manager queues (already tagged with the shard id)
  - a shard whose Disconnected notice is terminal is destroyed after the
    notice was forwarded; restart_shard() creates it again
  - identify concurrency: IdentifyThrottle with max_concurrency buckets

No singletons: several managers may coexist, each with its own throttle.
Single-threaded (poll thread).
===============================================================================
*/

template <
    transport::TransportConcept WS,
    typename Policies = policy::gateway::ShardDefault
>
class ShardManager {
public:
    using shard_type = Shard<WS, Policies>;

    explicit ShardManager(ManagerConfig cfg)
        : config_(std::move(cfg))
        , throttle_(config_.max_concurrency.value_or(1), config_.identify_window)
    {
    }

    ~ShardManager() {
        close();
    }

    ShardManager(const ShardManager&) = delete;
    ShardManager& operator=(const ShardManager&) = delete;

    // Applies the gateway discovery answer: an unset shard count, the gateway
    // url and the server identify concurrency (unless overridden).
    inline void apply(const schema::GatewayBot& bot) {
        if (started_) {
            SW_WARN("[MANAGER] apply() called after start(). Ignoring.");
            return;
        }
        if (!config_.shard_count.has() && bot.shards.has()) {
            config_.shard_count = bot.shards.value();
        }
        if (!bot.url.empty()) {
            config_.gateway_url = bot.url;
        }
        if (!config_.max_concurrency.has() && bot.max_concurrency.has()) {
            throttle_.reset(bot.max_concurrency.value());
        }
        SW_INFO("[MANAGER] Gateway " << config_.gateway_url << ", shards=" << lcr::to_string(config_.shard_count)
                << ", max_concurrency=" << throttle_.max_concurrency());
    }

    // Opens the configured shards. Fails when the shard count is unknown or a
    // requested shard id is out of range.
    [[nodiscard]]
    inline bool start() {
        if (started_) {
            SW_WARN("[MANAGER] start() called twice. Ignoring.");
            return false;
        }
        if (!config_.shard_count.has() || config_.shard_count.value() == 0) {
            SW_ERROR("[MANAGER] Shard count unknown: set it or apply() the gateway discovery answer first.");
            return false;
        }
        const std::uint32_t count = config_.shard_count.value();
        std::vector<std::uint32_t> ids = config_.shard_ids;
        if (ids.empty()) {
            ids.reserve(count);
            for (std::uint32_t i = 0; i < count; ++i) {
                ids.push_back(i);
            }
        }
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        if (ids.back() >= count) {
            SW_ERROR("[MANAGER] Shard id " << ids.back() << " out of range (shard count " << count << ")");
            return false;
        }

        ids_ = std::move(ids);
        pending_.assign(ids_.begin(), ids_.end());
        started_ = true;
        SW_INFO("[MANAGER] Starting " << ids_.size() << " of " << count << " shards");
        start_pending_();
        return true;
    }

    // Event loop
    inline void poll(Deadline::time_point now = Deadline::clock::now()) {
        start_pending_();

        std::vector<std::uint32_t> abandoned;
        for (auto& [id, shard] : shards_) {
            shard->poll(now);
            shard->drain_dispatch([this](DispatchEvent& ev) {
                dispatch_.push_back(std::move(ev));
            });
            shard->drain_notices([&](LifecycleNotice& notice) {
                if (notice.terminal()) {
                    abandoned.push_back(notice.shard_id);
                }
                notices_.push_back(std::move(notice));
            });
        }
        for (auto id : abandoned) {
            SW_WARN("[MANAGER] Shard " << id << " abandoned (restart_shard() to retry)");
            SW_TL1( telemetry_.shards_abandoned_total.inc() );
            shards_.erase(id);
        }
    }

    // Destroys shard_id (if alive) and starts it again with a fresh session.
    [[nodiscard]]
    inline bool restart_shard(std::uint32_t shard_id) {
        if (std::find(ids_.begin(), ids_.end(), shard_id) == ids_.end()) {
            SW_WARN("[MANAGER] restart_shard(" << shard_id << "): not managed here.");
            return false;
        }
        if (std::find(pending_.begin(), pending_.end(), shard_id) != pending_.end()) {
            return true; // not started yet
        }
        if (auto it = shards_.find(shard_id); it != shards_.end()) {
            collect_(*it->second);
            shards_.erase(it);
        }
        SW_INFO("[MANAGER] Restarting shard " << shard_id);
        SW_TL1( telemetry_.shards_restarted_total.inc() );
        (void)start_shard_(shard_id);
        return true;
    }

    // Closes every shard. Their final notices stay queued.
    inline void close() {
        for (auto& [id, shard] : shards_) {
            shard->close();
            collect_(*shard);
        }
        shards_.clear();
        pending_.clear();
    }

    // -------------------------------------------------------------------------
    // Consumer queues
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool pop_dispatch(DispatchEvent& out) {
        if (dispatch_.empty()) {
            return false;
        }
        out = std::move(dispatch_.front());
        dispatch_.pop_front();
        return true;
    }

    template<class F>
    inline std::size_t drain_dispatch(F&& f) {
        std::size_t n = 0;
        DispatchEvent ev;
        while (pop_dispatch(ev)) {
            f(ev);
            ++n;
        }
        return n;
    }

    [[nodiscard]]
    inline bool pop_notice(LifecycleNotice& out) {
        if (notices_.empty()) {
            return false;
        }
        out = std::move(notices_.front());
        notices_.pop_front();
        return true;
    }

    template<class F>
    inline std::size_t drain_notices(F&& f) {
        std::size_t n = 0;
        LifecycleNotice notice;
        while (pop_notice(notice)) {
            f(notice);
            ++n;
        }
        return n;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    // nullptr when the shard is not running (pending, abandoned or closed)
    [[nodiscard]]
    inline shard_type* shard(std::uint32_t shard_id) noexcept {
        auto it = shards_.find(shard_id);
        return (it != shards_.end()) ? it->second.get() : nullptr;
    }

    [[nodiscard]]
    inline std::size_t running() const noexcept {
        return shards_.size();
    }

    [[nodiscard]]
    inline const std::vector<std::uint32_t>& shard_ids() const noexcept {
        return ids_;
    }

    [[nodiscard]]
    inline const ManagerConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]]
    inline IdentifyThrottle& throttle() noexcept {
        return throttle_;
    }

    [[nodiscard]]
    inline const telemetry::Manager& telemetry() const noexcept {
        return telemetry_;
    }

private:
    // Opens pending shards in order while the previously opened one has
    // reached Connecting.
    inline void start_pending_() {
        while (!pending_.empty()) {
            if (last_started_.has()) {
                const shard_type* prev = shard(last_started_.value());
                if (prev && prev->state() == State::Disconnected) {
                    return;
                }
            }
            const std::uint32_t id = pending_.front();
            pending_.pop_front();
            (void)start_shard_(id);
        }
    }

    inline shard_type& start_shard_(std::uint32_t shard_id) {
        ShardConfig cfg;
        cfg.shard_id = shard_id;
        cfg.shard_count = config_.shard_count.value();
        cfg.token = config_.token;
        cfg.intents = config_.intents;
        cfg.gateway_url = config_.gateway_url;
        cfg.compress = config_.compress;
        cfg.large_threshold = config_.large_threshold;
        cfg.properties = config_.properties;
        cfg.presence = config_.presence;

        auto shard = std::make_unique<shard_type>(std::move(cfg), throttle_);
        shard_type& ref = *shard;
        shards_[shard_id] = std::move(shard);
        last_started_ = shard_id;
        SW_TL1( telemetry_.shards_started_total.inc() );

        const transport::Error err = ref.open();
        if (err != transport::Error::None) {
            SW_WARN("[MANAGER] Shard " << shard_id << " first connection attempt failed (" << transport::to_string(err) << "), retrying");
        }
        return ref;
    }

    // Moves what a shard still holds to the manager queues
    inline void collect_(shard_type& s) {
        s.drain_dispatch([this](DispatchEvent& ev) {
            dispatch_.push_back(std::move(ev));
        });
        s.drain_notices([this](LifecycleNotice& notice) {
            notices_.push_back(std::move(notice));
        });
    }

private:
    ManagerConfig config_;
    IdentifyThrottle throttle_;             // must outlive the shards

    std::vector<std::uint32_t> ids_;
    std::deque<std::uint32_t> pending_;
    lcr::optional<std::uint32_t> last_started_;
    bool started_{false};

    std::map<std::uint32_t, std::unique_ptr<shard_type>> shards_;

    std::deque<DispatchEvent> dispatch_;
    std::deque<LifecycleNotice> notices_;

    telemetry::Manager telemetry_;
};

} // namespace shardwire::core::gateway
