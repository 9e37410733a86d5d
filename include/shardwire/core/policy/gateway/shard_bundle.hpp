#pragma once

#include "shardwire/core/policy/gateway/reconnect.hpp"
#include "shardwire/core/policy/gateway/heartbeat.hpp"

namespace shardwire::core::policy::gateway {

/*
===============================================================================
 Shard Policy Bundle
===============================================================================

Single injection point for compile-time shard behavior. Groups the policies
into one type so Shard and ShardManager take a single template parameter.

using FastRetry = shard_bundle<
    reconnect::Bounded<3, 100, 1000>,
    heartbeat::Immediate
>;

using MyManager = ShardManager<MyTransport, FastRetry>;
===============================================================================
*/

template<
    ReconnectPolicy ReconnectT = reconnect::Unbounded<>,
    HeartbeatPolicy HeartbeatT = heartbeat::Jittered
>
struct shard_bundle {
    using reconnect = ReconnectT;
    using heartbeat = HeartbeatT;
};

using ShardDefault = shard_bundle<>;

} // namespace shardwire::core::policy::gateway
