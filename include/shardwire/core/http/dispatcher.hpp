#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "shardwire/core/http/client_concept.hpp"
#include "shardwire/core/http/error.hpp"
#include "shardwire/core/http/message.hpp"
#include "shardwire/core/http/rate_limit_headers.hpp"
#include "shardwire/core/http/parser/rate_limited.hpp"
#include "shardwire/core/ratelimit/gate.hpp"
#include "shardwire/core/ratelimit/registry.hpp"
#include "shardwire/core/config/http.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace shardwire::core::http {

struct DispatcherConfig {
    std::string base_url{config::http::BASE_URL};
    int global_limit{config::http::GLOBAL_LIMIT};
    std::size_t max_rate_limit_retries{config::http::MAX_RATE_LIMIT_RETRIES};
};

struct RequestOptions {
    // false: never suspend, return Error::RateLimited with the wait instead
    bool wait{true};
};

/*
===============================================================================
 http::Dispatcher<HttpClient>
===============================================================================

Routes every request through two Gates before handing it to the external HTTP
client:

  1. the global Gate of the request's rate_limit_key (skipped for
     ignore_global routes); every authentication has its own global limit.
     The permit is released as soon as it is granted, the global limit only
     spaces request starts
  2. the route Gate resolved by the Registry; the permit is held for the whole
     exchange so that the server answer updates the gate before the next
     caller is considered

After the exchange the rate-limit headers are fed back:

  - X-RateLimit-Limit            -> Gate::set_limit()
  - Remaining + Reset-After      -> Gate::update()
  - X-RateLimit-Bucket           -> Registry::discover()
  - no headers on a 2xx answer   -> route flagged unlimited

A 429 answer updates the key's global Gate (global == true in the body) or the route
Gate with remaining = 0 and the advertised retry_after, then the request is
retried. Waiting callers never observe RateLimited unless the retry budget is
exhausted.

Thread-safe: dispatch() may be called concurrently. HttpClient::perform() is
called without any Dispatcher lock held.
===============================================================================
*/

template<HttpClientConcept HttpClient>
class Dispatcher {
public:
    struct RoutePermit {
        std::shared_ptr<ratelimit::Gate> gate;
        ratelimit::Gate::Permit permit;
    };

    explicit Dispatcher(HttpClient& client, DispatcherConfig cfg = {})
        : client_(client)
        , config_(std::move(cfg))
    {
    }

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Performs req and fills resp with the final answer.
    [[nodiscard]]
    Outcome dispatch(Request& req, Response& resp, RequestOptions opts = {}) {
        const Route& route = req.route;
        const std::string route_class = route.route_class();
        std::chrono::milliseconds last_retry_after{0};
        const std::shared_ptr<ratelimit::Gate> global = route.ignore_global() ? nullptr : global_for_(req.rate_limit_key);

        for (std::size_t attempt = 0; attempt <= config_.max_rate_limit_retries; ++attempt) {
            // Global gate: released right after the grant
            if (global) {
                if (opts.wait) {
                    [[maybe_unused]] auto p = global->acquire();
                }
                else {
                    ratelimit::Gate::Permit p;
                    std::chrono::milliseconds wait{0};
                    if (!global->try_acquire(p, wait)) {
                        SW_DEBUG("[HTTP] Global limit would block " << route_class << " for " << wait.count() << " ms");
                        return Outcome{Error::RateLimited, wait};
                    }
                }
            }

            auto gate = registry_.gate_for(route_class, route.major_key());
            ratelimit::Gate::Permit permit;
            if (opts.wait) {
                permit = gate->acquire();
            }
            else {
                std::chrono::milliseconds wait{0};
                if (!gate->try_acquire(permit, wait)) {
                    SW_DEBUG("[HTTP] Route limit would block " << route_class << " for " << wait.count() << " ms");
                    return Outcome{Error::RateLimited, wait};
                }
            }

            req.url = config_.base_url;
            req.url += route.path();
            resp = Response{};

            SW_TRACE("[HTTP] " << to_string(route.method()) << " " << req.url << " (attempt " << attempt + 1 << ")");
            const transport::Error terr = client_.perform(req, resp);
            if (terr != transport::Error::None) {
                SW_WARN("[HTTP] " << route_class << " failed: " << transport::to_string(terr));
                return Outcome{Error::TransportFailure, std::chrono::milliseconds{0}};
            }

            const RateLimitHeaders headers = parse_rate_limit_headers(resp);
            std::shared_ptr<ratelimit::Gate> resolved = gate;
            if (headers.bucket.has()) {
                resolved = registry_.discover(route_class, route.major_key(), headers.bucket.value());
            }

            if (resp.status == 429) {
                last_retry_after = on_rate_limited_(route_class, resp, headers, global.get(), *resolved);
                if (!opts.wait) {
                    return Outcome{Error::RateLimited, last_retry_after};
                }
                continue; // permit released at end of scope, then re-queued
            }

            if (headers.any()) {
                apply_headers_(headers, *resolved);
            }
            else if (resp.status >= 200 && resp.status < 300) {
                resolved->set_unlimited(true);
            }

            const Error err = classify_status(resp.status);
            if (err != Error::None) {
                SW_DEBUG("[HTTP] " << route_class << " answered " << resp.status << " (" << to_string(err) << ")");
            }
            return Outcome{err, std::chrono::milliseconds{0}};
        }

        SW_WARN("[HTTP] " << route_class << " still rate limited after " << config_.max_rate_limit_retries << " retries");
        return Outcome{Error::RateLimited, last_retry_after};
    }

    // ---------------------------------------------------------------------
    // Direct gate access (custom transports / streaming uploads)
    // ---------------------------------------------------------------------

    [[nodiscard]]
    ratelimit::Gate::Permit acquire_global(std::string_view rate_limit_key = {}) {
        return global_for_(rate_limit_key)->acquire();
    }

    [[nodiscard]]
    RoutePermit acquire_route(const Route& route) {
        RoutePermit out;
        out.gate = registry_.gate_for(route.route_class(), route.major_key());
        out.permit = out.gate->acquire();
        return out;
    }

    void update(const Route& route, int remaining, std::chrono::milliseconds reset_after) {
        registry_.gate_for(route.route_class(), route.major_key())->update(remaining, reset_after);
    }

    void update_global(int remaining, std::chrono::milliseconds reset_after, std::string_view rate_limit_key = {}) {
        global_for_(rate_limit_key)->update(remaining, reset_after);
    }

    // Created on first use with the configured global limit
    [[nodiscard]]
    ratelimit::Gate& global_gate(std::string_view rate_limit_key = {}) {
        return *global_for_(rate_limit_key);
    }

    [[nodiscard]]
    std::size_t global_count() const {
        std::lock_guard<std::mutex> lock(globals_mutex_);
        return globals_.size();
    }

    [[nodiscard]]
    ratelimit::Registry& registry() noexcept {
        return registry_;
    }

    [[nodiscard]]
    const DispatcherConfig& config() const noexcept {
        return config_;
    }

private:
    std::shared_ptr<ratelimit::Gate> global_for_(std::string_view rate_limit_key) {
        std::lock_guard<std::mutex> lock(globals_mutex_);
        auto it = globals_.find(rate_limit_key);
        if (it == globals_.end()) {
            it = globals_.emplace(std::string(rate_limit_key),
                                  std::make_shared<ratelimit::Gate>(std::make_shared<ratelimit::LedgerEntry>(config_.global_limit))).first;
            SW_DEBUG("[HTTP] Global limit of " << config_.global_limit << " created for key #" << globals_.size());
        }
        return it->second;
    }

    std::chrono::milliseconds on_rate_limited_(const std::string& route_class, const Response& resp,
                                               const RateLimitHeaders& headers, ratelimit::Gate* key_global,
                                               ratelimit::Gate& gate) {
        parser::RateLimitedBody body;
        bool global = headers.global;
        std::chrono::milliseconds retry_after{1000};
        {
            // 429 bodies are rare: a local parser keeps dispatch() lock-free
            simdjson::dom::parser json;
            if (parser::rate_limited::parse(json, resp.body, body) == core::parser::Result::Parsed) {
                retry_after = body.retry_after;
                global = global || body.global;
            }
            else {
                const auto* v = resp.header(config::http::HEADER_RETRY_AFTER);
                if (!(v && detail::parse_seconds(*v, retry_after)) && headers.reset_after.has()) {
                    retry_after = headers.reset_after.value();
                }
            }
        }

        if (global && key_global) {
            SW_WARN("[HTTP] Global rate limit hit by " << route_class << ", retry after " << retry_after.count() << " ms");
            key_global->update(0, retry_after);
        }
        else {
            SW_INFO("[HTTP] Route rate limit hit by " << route_class << ", retry after " << retry_after.count() << " ms");
            if (headers.limit.has()) {
                gate.set_limit(headers.limit.value());
            }
            gate.set_unlimited(false);
            gate.update(0, retry_after);
        }
        return retry_after;
    }

    static void apply_headers_(const RateLimitHeaders& headers, ratelimit::Gate& gate) {
        SW_TRACE("[HTTP] Limit headers: limit=" << lcr::to_string(headers.limit) << " remaining=" << lcr::to_string(headers.remaining)
                 << " reset_after=" << lcr::to_string(headers.reset_after) << " bucket=" << lcr::to_string(headers.bucket));
        gate.set_unlimited(false);
        if (headers.limit.has()) {
            gate.set_limit(headers.limit.value());
        }
        if (headers.remaining.has() && headers.reset_after.has()) {
            gate.update(headers.remaining.value(), headers.reset_after.value());
        }
    }

private:
    HttpClient& client_;
    DispatcherConfig config_;

    // rate_limit_key -> global Gate
    std::map<std::string, std::shared_ptr<ratelimit::Gate>, std::less<>> globals_;
    mutable std::mutex globals_mutex_;

    ratelimit::Registry registry_;
};

} // namespace shardwire::core::http
