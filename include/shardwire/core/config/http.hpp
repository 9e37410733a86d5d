#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>


namespace shardwire::core::config::http {

// REST base url (API version pinned with the gateway)
inline constexpr std::string_view BASE_URL = "https://discord.com/api/v10";

// Process-wide request budget documented by the platform (requests / second).
// Seeds the global gate limit; remaining stays unknown until a global 429.
inline constexpr int GLOBAL_LIMIT = 50;

// Attempts per request when the server answers 429
inline constexpr std::size_t MAX_RATE_LIMIT_RETRIES = 5;

// Rate-limit headers
inline constexpr std::string_view HEADER_LIMIT       = "X-RateLimit-Limit";
inline constexpr std::string_view HEADER_REMAINING   = "X-RateLimit-Remaining";
inline constexpr std::string_view HEADER_RESET_AFTER = "X-RateLimit-Reset-After";
inline constexpr std::string_view HEADER_BUCKET      = "X-RateLimit-Bucket";
inline constexpr std::string_view HEADER_GLOBAL      = "X-RateLimit-Global";
inline constexpr std::string_view HEADER_SCOPE       = "X-RateLimit-Scope";
inline constexpr std::string_view HEADER_RETRY_AFTER = "Retry-After";

} // namespace shardwire::core::config::http
