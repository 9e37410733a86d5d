#pragma once

/*
================================================================================
Shardwire Core
================================================================================

Rate-limit aware REST dispatch and sharded gateway sessions for the Discord
API, with the network I/O left to the application:

  - http::Dispatcher<HttpClient>       REST requests through the global and
                                       per-route rate-limit gates
  - gateway::ShardManager<WS>          shard lifecycle, identify concurrency,
                                       heartbeats, resume and reconnects
  - ratelimit::Gate / Registry         the rate-limit primitives both use

HttpClient and WS are supplied by the application. They must satisfy
http::HttpClientConcept and transport::TransportConcept respectively.

-------------------------------------------------------------------------------
Execution model
-------------------------------------------------------------------------------

  - Dispatcher is thread-safe; dispatch() blocks the calling thread while a
    gate is exhausted (or returns RateLimited with wait = false)
  - ShardManager and Shard are poll-driven and single-threaded: every call
    happens on the thread that calls poll()

No callbacks are invoked from library code. Gateway events and lifecycle
notices are pulled from queues after poll().
================================================================================
*/

#include "shardwire/core/ratelimit/gate.hpp"
#include "shardwire/core/ratelimit/registry.hpp"
#include "shardwire/core/http/dispatcher.hpp"
#include "shardwire/core/http/gateway.hpp"
#include "shardwire/core/gateway/shard_manager.hpp"


namespace shardwire::core {

template<http::HttpClientConcept HttpClient>
using RestDispatcher = http::Dispatcher<HttpClient>;

template<transport::TransportConcept WS, typename Policies = policy::gateway::ShardDefault>
using Gateway = gateway::ShardManager<WS, Policies>;

} // namespace shardwire::core
