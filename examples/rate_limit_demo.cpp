// ============================================================================
// Rate limit demo
//
// Several threads share one ratelimit::Gate in front of a simulated server
// that enforces a fixed-window limit. Each caller acquires a permit, performs
// the request and feeds the server answer back with Gate::update() before the
// permit is released.
//
// Expected outcome: zero rejected requests, throughput close to
// limit / window.
// ============================================================================

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "shardwire/core/ratelimit/gate.hpp"
#include "common/cli/rate_limit_params.hpp"
#include "lcr/log/logger.hpp"


using namespace shardwire::core;

namespace {

// Fixed-window server: the window opens with the first request after a reset
class SimulatedServer {
public:
    using clock = std::chrono::steady_clock;

    struct Answer {
        bool accepted;
        int remaining;
        std::chrono::milliseconds reset_after;
    };

    SimulatedServer(int limit, std::chrono::milliseconds window)
        : limit_(limit)
        , window_(window)
    {}

    Answer handle() {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock::now();
        if (!open_ || now >= window_end_) {
            open_ = true;
            window_end_ = now + window_;
            used_ = 0;
        }
        const auto reset_after = std::chrono::ceil<std::chrono::milliseconds>(window_end_ - now);
        if (used_ >= limit_) {
            ++rejected_;
            return Answer{false, 0, reset_after};
        }
        ++used_;
        ++accepted_;
        return Answer{true, limit_ - used_, reset_after};
    }

    int accepted() const { std::lock_guard<std::mutex> lock(mutex_); return accepted_; }
    int rejected() const { std::lock_guard<std::mutex> lock(mutex_); return rejected_; }

private:
    const int limit_;
    const std::chrono::milliseconds window_;

    mutable std::mutex mutex_;
    bool open_{false};
    clock::time_point window_end_{};
    int used_{0};
    int accepted_{0};
    int rejected_{0};
};

} // namespace

int main(int argc, char** argv) {
    using namespace shardwire::examples::cli::rate_limit;
    const Params params = configure(argc, argv, "Shardwire rate limit gate demo");
    params.dump("=== Rate limit demo ===", std::cout);

    const std::chrono::milliseconds window{params.window_ms};
    SimulatedServer server(params.limit, window);

    // The limit is known up front, the remaining budget is learned from answers
    ratelimit::Gate gate(std::make_shared<ratelimit::LedgerEntry>(params.limit));

    std::atomic<int> retries{0};
    const auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> callers;
    callers.reserve(params.threads);
    for (std::uint32_t t = 0; t < params.threads; ++t) {
        callers.emplace_back([&, t] {
            for (std::uint32_t i = 0; i < params.requests; ++i) {
                for (;;) {
                    auto permit = gate.acquire();
                    const auto answer = server.handle();
                    gate.update(answer.remaining, answer.reset_after);
                    if (answer.accepted) {
                        SW_DEBUG("[DEMO] caller " << t << " request " << i << " accepted (remaining " << answer.remaining
                                 << ", reset in " << answer.reset_after.count() << " ms)");
                        break;
                    }
                    SW_WARN("[DEMO] caller " << t << " request " << i << " rejected, retrying");
                    retries.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& c : callers) {
        c.join();
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    const int total = server.accepted();
    const double windows = static_cast<double>(elapsed.count()) / static_cast<double>(window.count());

    std::cout << "\n=== Summary ===\n"
              << "  Accepted  : " << total << "\n"
              << "  Rejected  : " << server.rejected() << " (retried " << retries.load() << ")\n"
              << "  Elapsed   : " << elapsed.count() << " ms\n"
              << "  Rate      : " << (windows > 0.0 ? static_cast<double>(total) / windows : 0.0)
              << " per window (limit " << params.limit << ")\n";

    return server.rejected() == 0 ? 0 : 1;
}
