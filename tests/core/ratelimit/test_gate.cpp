#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "shardwire/core/ratelimit/gate.hpp"
#include "common/test_check.hpp"


using namespace shardwire::core;
using namespace shardwire::core::ratelimit;
using namespace std::chrono_literals;

namespace {

using clock_type = std::chrono::steady_clock;

std::shared_ptr<Gate> make_gate(std::shared_ptr<LedgerEntry> entry) {
    return std::make_shared<Gate>(std::move(entry));
}

long long elapsed_ms(clock_type::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_type::now() - since).count();
}

} // namespace

// -----------------------------------------------------------------------------
// Test: a fresh gate is clean and grants without information
// -----------------------------------------------------------------------------
void test_no_info_grants_immediately() {
    std::cout << "[TEST] Gate without limit information\n";

    auto gate = make_gate(std::make_shared<LedgerEntry>());
    TEST_CHECK(!gate->dirty());

    const auto start = clock_type::now();
    for (int i = 0; i < 5; ++i) {
        auto permit = gate->acquire();
        TEST_CHECK(permit.valid());
    }
    TEST_CHECK(elapsed_ms(start) < 50);
    TEST_CHECK(!gate->remaining().has());
    // No known limit: grants do not make the gate dirty
    TEST_CHECK(!gate->dirty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a grant under a known limit makes the gate dirty
// -----------------------------------------------------------------------------
void test_dirty_after_reserved() {
    std::cout << "[TEST] Gate dirty after grant under known limit\n";

    auto gate = make_gate(std::make_shared<LedgerEntry>(1));
    TEST_CHECK(!gate->dirty());
    {
        auto permit = gate->acquire();
        TEST_CHECK(gate->dirty());
    }
    TEST_CHECK(gate->dirty());

    auto other = make_gate(std::make_shared<LedgerEntry>());
    other->update(0, 1000ms);
    TEST_CHECK(other->dirty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: remaining > 0 is decremented by each grant
// -----------------------------------------------------------------------------
void test_decrement() {
    std::cout << "[TEST] Gate decrements remaining\n";

    auto gate = make_gate(std::make_shared<LedgerEntry>(5, 3));
    { auto p = gate->acquire(); }
    TEST_CHECK(gate->remaining().has());
    TEST_CHECK(gate->remaining().value() == 2);
    { auto p = gate->acquire(); }
    { auto p = gate->acquire(); }
    TEST_CHECK(gate->remaining().value() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: consecutive acquisitions updated with remaining 0 wait one window each
// -----------------------------------------------------------------------------
void test_consecutive_windows() {
    std::cout << "[TEST] Gate consecutive windows\n";

    auto gate = make_gate(std::make_shared<LedgerEntry>(1));
    gate->update(1, 100ms);

    const auto start = clock_type::now();
    for (int i = 0; i < 3; ++i) {
        auto permit = gate->acquire();
        gate->update(0, 100ms);
    }
    const auto ms = elapsed_ms(start);
    TEST_CHECK(ms >= 190);
    TEST_CHECK(ms < 400);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: concurrent callers are serialized through the window and never share
// the guarded section, even when it outlasts the reset
// -----------------------------------------------------------------------------
void test_concurrent_windows() {
    std::cout << "[TEST] Gate concurrent windows\n";

    auto gate = make_gate(std::make_shared<LedgerEntry>(1));
    gate->update(1, 100ms);

    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    auto guarded = [&](std::chrono::milliseconds hold) {
        auto permit = gate->acquire();
        const int now_inside = ++inside;
        int seen = max_inside.load();
        while (now_inside > seen && !max_inside.compare_exchange_weak(seen, now_inside)) {
        }
        std::this_thread::sleep_for(hold);
        gate->update(0, 100ms);
        --inside;
    };

    const auto start = clock_type::now();
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back(guarded, 0ms);
    }
    for (auto& t : threads) {
        t.join();
    }
    const auto ms = elapsed_ms(start);
    TEST_CHECK(ms >= 190);
    TEST_CHECK(ms < 400);
    TEST_CHECK(gate->pending() == 0);
    TEST_CHECK(max_inside.load() == 1);

    // Sections sleeping past the reset window: the next caller still waits
    // for the release, then for its own window
    threads.clear();
    gate->update(1, 100ms);
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back(guarded, 150ms);
    }
    for (auto& t : threads) {
        t.join();
    }
    TEST_CHECK(max_inside.load() == 1);
    TEST_CHECK(gate->pending() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: no invented replenishment after a waited grant
// -----------------------------------------------------------------------------
void test_no_auto_replenish() {
    std::cout << "[TEST] Gate never replenishes by itself\n";

    auto gate = make_gate(std::make_shared<LedgerEntry>(1));
    gate->update(1, 100ms);

    const auto start = clock_type::now();
    { auto p = gate->acquire(); }   // remaining 1 -> 0
    { auto p = gate->acquire(); }   // waits for the reset
    TEST_CHECK(elapsed_ms(start) >= 90);
    TEST_CHECK(gate->remaining().value() == 0);

    // reset_at already in the past: granted at once, remaining untouched
    const auto second = clock_type::now();
    { auto p = gate->acquire(); }
    { auto p = gate->acquire(); }
    TEST_CHECK(elapsed_ms(second) < 50);
    TEST_CHECK(gate->remaining().value() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: unlimited overrides an exhausted bucket
// -----------------------------------------------------------------------------
void test_unlimited() {
    std::cout << "[TEST] Gate unlimited\n";

    auto entry = std::make_shared<LedgerEntry>(1);
    auto gate = make_gate(entry);
    gate->update(0, 1000ms);
    gate->set_unlimited(true);

    const auto start = clock_type::now();
    for (int i = 0; i < 3; ++i) {
        auto p = gate->acquire();
    }
    TEST_CHECK(elapsed_ms(start) < 100);
    TEST_CHECK(entry->unlimited);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: update() while a caller waits moves its deadline
// -----------------------------------------------------------------------------
void test_update_wakes_waiter() {
    std::cout << "[TEST] Gate update wakes waiter\n";

    auto gate = make_gate(std::make_shared<LedgerEntry>(1));
    gate->update(0, 2000ms);

    std::atomic<bool> granted{false};
    const auto start = clock_type::now();
    std::thread waiter([&] {
        auto p = gate->acquire();
        granted = true;
    });

    std::this_thread::sleep_for(50ms);
    TEST_CHECK(!granted.load());
    gate->update(0, 50ms);

    waiter.join();
    TEST_CHECK(granted.load());
    TEST_CHECK(elapsed_ms(start) < 1000);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: FIFO order of waiting callers
// -----------------------------------------------------------------------------
void test_fifo_order() {
    std::cout << "[TEST] Gate FIFO order\n";

    auto gate = make_gate(std::make_shared<LedgerEntry>(1));
    gate->update(0, 300ms);

    std::mutex m;
    std::vector<int> order;
    std::vector<std::thread> threads;
    for (int i = 0; i < 5; ++i) {
        threads.emplace_back([&, i] {
            auto p = gate->acquire();
            std::lock_guard<std::mutex> lock(m);
            order.push_back(i);
        });
        // Next thread arrives only once this one is queued
        while (gate->pending() < static_cast<std::uint64_t>(i + 1)) {
            std::this_thread::yield();
        }
    }
    for (auto& t : threads) {
        t.join();
    }
    TEST_CHECK(order.size() == 5);
    for (int i = 0; i < 5; ++i) {
        TEST_CHECK(order[i] == i);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: try_acquire reports the wait of an exhausted bucket without suspending
// -----------------------------------------------------------------------------
void test_try_acquire() {
    std::cout << "[TEST] Gate try_acquire\n";

    auto gate = make_gate(std::make_shared<LedgerEntry>(1, 1));
    std::chrono::milliseconds wait{0};

    Gate::Permit first;
    TEST_CHECK(gate->try_acquire(first, wait));
    TEST_CHECK(first.valid());
    TEST_CHECK(wait.count() == 0);

    // Holder reports an exhausted bucket: no queueing, the wait is reported
    gate->update(0, 500ms);
    Gate::Permit second;
    const auto start = clock_type::now();
    TEST_CHECK(!gate->try_acquire(second, wait));
    TEST_CHECK(elapsed_ms(start) < 50);
    TEST_CHECK(!second.valid());
    TEST_CHECK(wait.count() > 300);
    TEST_CHECK(wait.count() <= 500);

    first = Gate::Permit{};   // release
    TEST_CHECK(!gate->try_acquire(second, wait));
    TEST_CHECK(wait.count() > 300);
    TEST_CHECK(gate->pending() == 0);

    gate->update(1, 500ms);
    TEST_CHECK(gate->try_acquire(second, wait));
    TEST_CHECK(wait.count() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: try_acquire on a busy gate with permits left waits for its turn
// -----------------------------------------------------------------------------
void test_try_acquire_busy_not_exhausted() {
    std::cout << "[TEST] Gate try_acquire behind a holder\n";

    auto gate = make_gate(std::make_shared<LedgerEntry>(5, 5));
    std::atomic<bool> released{false};

    std::thread holder([&] {
        auto p = gate->acquire();
        std::this_thread::sleep_for(100ms);
        gate->update(4, 5000ms);
        released = true;
    });
    while (gate->pending() < 1) {
        std::this_thread::yield();
    }

    Gate::Permit permit;
    std::chrono::milliseconds wait{0};
    TEST_CHECK(gate->try_acquire(permit, wait));
    TEST_CHECK(permit.valid());
    TEST_CHECK(released.load());
    TEST_CHECK(wait.count() == 0);
    TEST_CHECK(gate->remaining().value() == 3);
    permit = Gate::Permit{};
    holder.join();

    // Holder exhausts the bucket while a caller is queued: the queued
    // caller gives up with the wait and hands the ticket on
    gate->update(2, 5000ms);
    std::thread exhausting([&] {
        auto p = gate->acquire();
        std::this_thread::sleep_for(50ms);
        gate->update(0, 400ms);
    });
    while (gate->pending() < 1) {
        std::this_thread::yield();
    }
    TEST_CHECK(!gate->try_acquire(permit, wait));
    TEST_CHECK(!permit.valid());
    TEST_CHECK(wait.count() > 200);
    TEST_CHECK(wait.count() <= 400);
    exhausting.join();
    TEST_CHECK(gate->pending() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: moving a permit transfers the release
// -----------------------------------------------------------------------------
void test_permit_move() {
    std::cout << "[TEST] Gate permit move\n";

    auto gate = make_gate(std::make_shared<LedgerEntry>());
    Gate::Permit outer;
    {
        auto inner = gate->acquire();
        TEST_CHECK(gate->pending() == 1);
        outer = std::move(inner);
        TEST_CHECK(!inner.valid());
    }
    TEST_CHECK(gate->pending() == 1);
    outer = Gate::Permit{};
    TEST_CHECK(gate->pending() == 0);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_no_info_grants_immediately();
    test_dirty_after_reserved();
    test_decrement();
    test_consecutive_windows();
    test_concurrent_windows();
    test_no_auto_replenish();
    test_unlimited();
    test_update_wakes_waiter();
    test_fifo_order();
    test_try_acquire();
    test_try_acquire_busy_not_exhausted();
    test_permit_move();

    std::cout << "\n[GROUP TEST] ALL ratelimit::Gate TESTS PASSED!\n";
    return 0;
}
