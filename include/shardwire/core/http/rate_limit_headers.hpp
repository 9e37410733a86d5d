#pragma once

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <string>
#include <string_view>

#include "shardwire/core/http/message.hpp"
#include "shardwire/core/config/http.hpp"
#include "lcr/optional.hpp"


namespace shardwire::core::http {

// Rate-limit information carried by response headers.
// Every field is optional: a route without limits sends none of them.
struct RateLimitHeaders {
    lcr::optional<int> limit;
    lcr::optional<int> remaining;
    lcr::optional<std::chrono::milliseconds> reset_after;
    lcr::optional<std::string> bucket;
    lcr::optional<std::string> scope;
    bool global{false};

    [[nodiscard]]
    inline bool any() const noexcept {
        return limit.has() || remaining.has() || reset_after.has() || bucket.has();
    }
};

namespace detail {

[[nodiscard]]
inline bool parse_int(std::string_view sv, int& out) noexcept {
    const char* first = sv.data();
    const char* last = sv.data() + sv.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

// Seconds with a fractional part ("1.250") -> milliseconds, rounded up
[[nodiscard]]
inline bool parse_seconds(const std::string& s, std::chrono::milliseconds& out) noexcept {
    if (s.empty()) {
        return false;
    }
    char* end = nullptr;
    const double secs = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(secs) || secs < 0.0) {
        return false;
    }
    out = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(std::ceil(secs * 1000.0))};
    return true;
}

} // namespace detail

// Malformed values are treated as absent.
[[nodiscard]]
inline RateLimitHeaders parse_rate_limit_headers(const Response& resp) {
    RateLimitHeaders out;

    if (const auto* v = resp.header(config::http::HEADER_LIMIT)) {
        int n{};
        if (detail::parse_int(*v, n)) {
            out.limit = n;
        }
    }
    if (const auto* v = resp.header(config::http::HEADER_REMAINING)) {
        int n{};
        if (detail::parse_int(*v, n)) {
            out.remaining = n;
        }
    }
    if (const auto* v = resp.header(config::http::HEADER_RESET_AFTER)) {
        std::chrono::milliseconds ms{};
        if (detail::parse_seconds(*v, ms)) {
            out.reset_after = ms;
        }
    }
    if (const auto* v = resp.header(config::http::HEADER_BUCKET)) {
        if (!v->empty()) {
            out.bucket = *v;
        }
    }
    if (const auto* v = resp.header(config::http::HEADER_SCOPE)) {
        out.scope = *v;
    }
    if (const auto* v = resp.header(config::http::HEADER_GLOBAL)) {
        out.global = iequals(*v, "true");
    }
    return out;
}

} // namespace shardwire::core::http
