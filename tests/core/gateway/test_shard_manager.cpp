#include <chrono>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "shardwire/core/gateway/shard_manager.hpp"
#include "common/mock_transport.hpp"
#include "common/gateway_script.hpp"
#include "common/test_check.hpp"


using namespace shardwire::core;
using namespace shardwire::core::gateway;
using namespace std::chrono_literals;

using transport::MockTransport;
using TestPolicies = policy::gateway::shard_bundle<
    policy::gateway::reconnect::Bounded<3, 0, 0>,
    policy::gateway::heartbeat::Immediate
>;
using TestManager = ShardManager<MockTransport, TestPolicies>;

namespace {

ManagerConfig make_config() {
    ManagerConfig cfg;
    cfg.token = "token";
    cfg.intents = 1;
    cfg.gateway_url = "wss://gateway.example.test";
    cfg.compress = false;
    cfg.identify_window = 0ms;
    return cfg;
}

void say_hello(TestManager& mgr) {
    for (auto id : mgr.shard_ids()) {
        if (auto* s = mgr.shard(id); s && s->has_transport() && s->state() == State::Connecting) {
            s->transport().push(gateway_script::hello(41250));
        }
    }
}

std::vector<LifecycleNotice> notices_of(TestManager& mgr) {
    std::vector<LifecycleNotice> out;
    mgr.drain_notices([&](LifecycleNotice& n) { out.push_back(n); });
    return out;
}

} // namespace

// -----------------------------------------------------------------------------
// Test: identify concurrency buckets (max_concurrency = 2, 6 shards)
// -----------------------------------------------------------------------------
void test_identify_buckets() {
    std::cout << "[TEST] ShardManager identify buckets\n";
    MockTransport::reset();

    ManagerConfig cfg = make_config();
    cfg.shard_count = 6u;
    cfg.max_concurrency = 2u;
    cfg.identify_window = 200ms;
    TestManager mgr(cfg);

    TEST_CHECK(mgr.start());
    TEST_CHECK(mgr.running() == 6);
    TEST_CHECK(MockTransport::created() == 6);
    TEST_CHECK(mgr.throttle().max_concurrency() == 2);

    say_hello(mgr);

    const auto t0 = std::chrono::steady_clock::now();
    std::map<std::uint32_t, long long> identified_at;
    while (identified_at.size() < 6 && std::chrono::steady_clock::now() - t0 < 3s) {
        mgr.poll();
        for (std::uint32_t id = 0; id < 6; ++id) {
            auto* s = mgr.shard(id);
            if (!identified_at.count(id) && s && s->has_transport() && s->transport().sent_count("\"op\":2") == 1) {
                identified_at[id] = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
            }
        }
        std::this_thread::sleep_for(2ms);
    }
    TEST_CHECK(identified_at.size() == 6);

    // One identify per bucket per window, buckets in parallel
    TEST_CHECK(identified_at[0] < 100);
    TEST_CHECK(identified_at[1] < 100);
    TEST_CHECK(identified_at[2] >= 180);
    TEST_CHECK(identified_at[3] >= 180);
    TEST_CHECK(identified_at[4] >= identified_at[2] + 180);
    TEST_CHECK(identified_at[5] >= identified_at[3] + 180);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: discovery answer fills shard count, url and identify concurrency
// -----------------------------------------------------------------------------
void test_apply_gateway_bot() {
    std::cout << "[TEST] ShardManager apply()\n";
    MockTransport::reset();

    TestManager mgr(make_config());
    TEST_CHECK(!mgr.start());
    TEST_CHECK(mgr.running() == 0);

    schema::GatewayBot bot;
    bot.url = "wss://discovered.example.test";
    bot.shards = 3u;
    bot.max_concurrency = 4u;
    mgr.apply(bot);

    TEST_CHECK(mgr.config().shard_count.value() == 3);
    TEST_CHECK(mgr.config().gateway_url == "wss://discovered.example.test");
    TEST_CHECK(mgr.throttle().max_concurrency() == 4);

    TEST_CHECK(mgr.start());
    TEST_CHECK(mgr.running() == 3);
    for (const auto& url : MockTransport::urls()) {
        TEST_CHECK(url.rfind("wss://discovered.example.test/?v=10", 0) == 0);
    }

    // Ignored once started
    bot.shards = 10u;
    mgr.apply(bot);
    TEST_CHECK(mgr.config().shard_count.value() == 3);
    TEST_CHECK(!mgr.start());

    // Explicit settings win over the server values
    ManagerConfig cfg = make_config();
    cfg.shard_count = 2u;
    cfg.max_concurrency = 1u;
    TestManager pinned(cfg);
    bot.shards = 16u;
    bot.max_concurrency = 16u;
    pinned.apply(bot);
    TEST_CHECK(pinned.config().shard_count.value() == 2);
    TEST_CHECK(pinned.throttle().max_concurrency() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: running a subset of the shard range
// -----------------------------------------------------------------------------
void test_shard_subset() {
    std::cout << "[TEST] ShardManager shard subset\n";
    MockTransport::reset();

    ManagerConfig cfg = make_config();
    cfg.shard_count = 4u;
    cfg.shard_ids = {3, 1, 1};
    TestManager mgr(cfg);

    TEST_CHECK(mgr.start());
    TEST_CHECK(mgr.shard_ids() == std::vector<std::uint32_t>({1, 3}));
    TEST_CHECK(mgr.running() == 2);
    TEST_CHECK(mgr.shard(0) == nullptr);

    say_hello(mgr);
    mgr.poll();
    TEST_CHECK(mgr.shard(3)->transport().sent_count("\"shard\":[3,4]") == 1);
    TEST_CHECK(mgr.shard(1)->transport().sent_count("\"shard\":[1,4]") == 1);

    ManagerConfig bad = make_config();
    bad.shard_count = 2u;
    bad.shard_ids = {0, 5};
    TestManager out_of_range(bad);
    TEST_CHECK(!out_of_range.start());
    TEST_CHECK(out_of_range.running() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: events and notices are forwarded with their shard id
// -----------------------------------------------------------------------------
void test_forwarding() {
    std::cout << "[TEST] ShardManager forwarding\n";
    MockTransport::reset();

    ManagerConfig cfg = make_config();
    cfg.shard_count = 2u;
    TestManager mgr(cfg);
    TEST_CHECK(mgr.start());

    say_hello(mgr);
    mgr.poll();
    mgr.shard(0)->transport().push(gateway_script::ready(1, "s0"));
    mgr.shard(1)->transport().push(gateway_script::ready(1, "s1"));
    mgr.poll();
    mgr.shard(1)->transport().push(gateway_script::dispatch(2, "GUILD_CREATE", "{\"id\":\"9\"}"));
    mgr.poll();

    std::vector<DispatchEvent> events;
    mgr.drain_dispatch([&](DispatchEvent& ev) { events.push_back(ev); });
    TEST_CHECK(events.size() == 3);
    TEST_CHECK(events[0].name == "READY" && events[0].shard_id == 0);
    TEST_CHECK(events[1].name == "READY" && events[1].shard_id == 1);
    TEST_CHECK(events[2].name == "GUILD_CREATE" && events[2].shard_id == 1 && events[2].sequence == 2);

    int connected = 0, identified = 0;
    for (const auto& n : notices_of(mgr)) {
        connected += (n.kind == NoticeKind::Connected);
        identified += (n.kind == NoticeKind::Identified);
    }
    TEST_CHECK(connected == 2);
    TEST_CHECK(identified == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a fatal close abandons the shard; restart_shard() brings it back
// -----------------------------------------------------------------------------
void test_abandon_and_restart() {
    std::cout << "[TEST] ShardManager abandon / restart\n";
    MockTransport::reset();

    ManagerConfig cfg = make_config();
    cfg.shard_count = 2u;
    TestManager mgr(cfg);
    TEST_CHECK(mgr.start());
    say_hello(mgr);
    mgr.poll();
    (void)notices_of(mgr);

    mgr.shard(0)->transport().push_close(4014);
    mgr.poll();

    TEST_CHECK(mgr.running() == 1);
    TEST_CHECK(mgr.shard(0) == nullptr);
    TEST_CHECK(mgr.shard(1) != nullptr);

    auto notices = notices_of(mgr);
    TEST_CHECK(notices.size() == 1);
    TEST_CHECK(notices[0].shard_id == 0);
    TEST_CHECK(notices[0].terminal());
    TEST_CHECK(notices[0].error == Error::DisallowedIntents);

    // Nothing more from the abandoned shard
    mgr.poll();
    TEST_CHECK(notices_of(mgr).empty());

    TEST_CHECK(!mgr.restart_shard(7));
    TEST_CHECK(mgr.restart_shard(0));
    TEST_CHECK(mgr.running() == 2);
    TEST_CHECK(mgr.shard(0)->state() == State::Connecting);

    // Restarting a live shard replaces it with a fresh session
    const int before = MockTransport::created();
    TEST_CHECK(mgr.restart_shard(1));
    TEST_CHECK(MockTransport::created() == before + 1);
    TEST_CHECK(mgr.shard(1)->state() == State::Connecting);
    TEST_CHECK(!mgr.shard(1)->session_id().has());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: close() shuts every shard down and keeps their final notices
// -----------------------------------------------------------------------------
void test_close() {
    std::cout << "[TEST] ShardManager close\n";
    MockTransport::reset();

    ManagerConfig cfg = make_config();
    cfg.shard_count = 3u;
    TestManager mgr(cfg);
    TEST_CHECK(mgr.start());
    say_hello(mgr);
    mgr.poll();
    (void)notices_of(mgr);

    mgr.close();
    TEST_CHECK(mgr.running() == 0);
    TEST_CHECK(MockTransport::live() == 0);
    TEST_CHECK(MockTransport::close_codes().size() == 3);

    int disconnected = 0;
    for (const auto& n : notices_of(mgr)) {
        TEST_CHECK(n.kind == NoticeKind::Disconnected);
        TEST_CHECK(!n.terminal());
        ++disconnected;
    }
    TEST_CHECK(disconnected == 3);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_identify_buckets();
    test_apply_gateway_bot();
    test_shard_subset();
    test_forwarding();
    test_abandon_and_restart();
    test_close();

    std::cout << "\n[GROUP TEST] ALL ShardManager TESTS PASSED!\n";
    return 0;
}
