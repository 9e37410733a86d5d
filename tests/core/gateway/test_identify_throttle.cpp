#include <chrono>
#include <iostream>
#include <thread>

#include "shardwire/core/gateway/identify_throttle.hpp"
#include "common/test_check.hpp"


using namespace shardwire::core::gateway;
using namespace std::chrono_literals;

// -----------------------------------------------------------------------------
// Test: one identify per window in a single bucket
// -----------------------------------------------------------------------------
void test_single_bucket_window() {
    std::cout << "[TEST] IdentifyThrottle single bucket\n";

    IdentifyThrottle throttle(1, 200ms);
    std::chrono::milliseconds wait{0};

    throttle.enqueue(0);
    throttle.enqueue(1);
    TEST_CHECK(throttle.queued(0) == 2);

    // Not at the head: refused without wait
    TEST_CHECK(!throttle.try_acquire(1, wait));
    TEST_CHECK(wait.count() == 0);

    TEST_CHECK(throttle.try_acquire(0, wait));
    TEST_CHECK(throttle.queued(0) == 1);

    TEST_CHECK(!throttle.try_acquire(1, wait));
    TEST_CHECK(wait.count() > 100);
    TEST_CHECK(wait.count() <= 200);

    std::this_thread::sleep_for(wait + 10ms);
    TEST_CHECK(throttle.try_acquire(1, wait));
    TEST_CHECK(throttle.queued(0) == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: buckets by shard_id % max_concurrency are independent
// -----------------------------------------------------------------------------
void test_independent_buckets() {
    std::cout << "[TEST] IdentifyThrottle independent buckets\n";

    IdentifyThrottle throttle(2, 5000ms);
    std::chrono::milliseconds wait{0};

    TEST_CHECK(throttle.max_concurrency() == 2);
    TEST_CHECK(throttle.bucket_of(0) == 0);
    TEST_CHECK(throttle.bucket_of(3) == 1);

    for (std::uint32_t id = 0; id < 4; ++id) {
        throttle.enqueue(id);
    }
    TEST_CHECK(throttle.try_acquire(0, wait));
    TEST_CHECK(throttle.try_acquire(1, wait));
    TEST_CHECK(!throttle.try_acquire(2, wait));
    TEST_CHECK(wait.count() > 4000);
    TEST_CHECK(!throttle.try_acquire(3, wait));
    TEST_CHECK(wait.count() > 4000);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: enqueue is idempotent, cancel removes, reset rebuilds
// -----------------------------------------------------------------------------
void test_queue_management() {
    std::cout << "[TEST] IdentifyThrottle queue management\n";

    IdentifyThrottle throttle(1, 5000ms);
    std::chrono::milliseconds wait{0};

    throttle.enqueue(4);
    throttle.enqueue(4);
    throttle.enqueue(7);
    TEST_CHECK(throttle.queued(0) == 2);

    throttle.cancel(4);
    TEST_CHECK(throttle.queued(0) == 1);
    TEST_CHECK(throttle.try_acquire(7, wait));

    throttle.enqueue(8);
    throttle.reset(0);
    TEST_CHECK(throttle.max_concurrency() == 1);
    TEST_CHECK(throttle.queued(0) == 0);

    // Fresh buckets: the window consumed before reset is forgotten
    throttle.enqueue(8);
    TEST_CHECK(throttle.try_acquire(8, wait));
    TEST_CHECK(throttle.queued(5) == 0);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_single_bucket_window();
    test_independent_buckets();
    test_queue_management();

    std::cout << "\n[GROUP TEST] ALL IdentifyThrottle TESTS PASSED!\n";
    return 0;
}
