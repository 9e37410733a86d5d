#pragma once

#include "lcr/metrics/counter.hpp"


namespace shardwire::core::gateway::telemetry {

// ============================================================================
// Shard Telemetry
//
// Mechanical facts observed by one shard. Owned and mutated on the poll
// thread; updated only when SHARDWIRE_ENABLE_TELEMETRY_L1 is defined.
// ============================================================================

struct Shard final {
    // Transport
    lcr::metrics::counter32 connect_attempts_total;
    lcr::metrics::counter32 connect_failures_total;
    lcr::metrics::counter64 chunks_received_total;
    lcr::metrics::counter64 payloads_received_total;
    lcr::metrics::counter64 payloads_sent_total;
    lcr::metrics::counter32 decompress_failures_total;
    lcr::metrics::counter32 parse_failures_total;

    // Session
    lcr::metrics::counter32 identifies_sent_total;
    lcr::metrics::counter32 resumes_sent_total;
    lcr::metrics::counter64 heartbeats_sent_total;
    lcr::metrics::counter64 heartbeat_acks_total;
    lcr::metrics::counter32 zombie_connections_total;

    // Delivery
    lcr::metrics::counter64 dispatch_events_total;

    // Drops
    lcr::metrics::counter32 resumable_drops_total;
    lcr::metrics::counter32 reidentify_drops_total;

    inline void copy_to(Shard& dst) const noexcept {
        connect_attempts_total.copy_to(dst.connect_attempts_total);
        connect_failures_total.copy_to(dst.connect_failures_total);
        chunks_received_total.copy_to(dst.chunks_received_total);
        payloads_received_total.copy_to(dst.payloads_received_total);
        payloads_sent_total.copy_to(dst.payloads_sent_total);
        decompress_failures_total.copy_to(dst.decompress_failures_total);
        parse_failures_total.copy_to(dst.parse_failures_total);
        identifies_sent_total.copy_to(dst.identifies_sent_total);
        resumes_sent_total.copy_to(dst.resumes_sent_total);
        heartbeats_sent_total.copy_to(dst.heartbeats_sent_total);
        heartbeat_acks_total.copy_to(dst.heartbeat_acks_total);
        zombie_connections_total.copy_to(dst.zombie_connections_total);
        dispatch_events_total.copy_to(dst.dispatch_events_total);
        resumable_drops_total.copy_to(dst.resumable_drops_total);
        reidentify_drops_total.copy_to(dst.reidentify_drops_total);
    }
};

// Manager-level decisions
struct Manager final {
    lcr::metrics::counter32 shards_started_total;
    lcr::metrics::counter32 shards_restarted_total;
    lcr::metrics::counter32 shards_abandoned_total;

    inline void copy_to(Manager& dst) const noexcept {
        shards_started_total.copy_to(dst.shards_started_total);
        shards_restarted_total.copy_to(dst.shards_restarted_total);
        shards_abandoned_total.copy_to(dst.shards_abandoned_total);
    }
};

} // namespace shardwire::core::gateway::telemetry
