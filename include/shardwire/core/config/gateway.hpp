#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>


namespace shardwire::core::config::gateway {

inline constexpr std::uint32_t API_VERSION = 10;

// Used when the caller does not discover the url through /gateway/bot
inline constexpr std::string_view DEFAULT_URL = "wss://gateway.discord.gg";

// Minimum spacing of identifies within one max_concurrency bucket
inline constexpr std::chrono::milliseconds IDENTIFY_WINDOW{5000};

inline constexpr std::uint32_t LARGE_THRESHOLD = 50;

// Upper bound of buffered compressed bytes without a flush marker
inline constexpr std::size_t MAX_COMPRESSED_BUFFER = 16 * 1024 * 1024;

// Upper bound of one inflated payload still waiting for its end
inline constexpr std::size_t MAX_INFLATED_PAYLOAD = 64 * 1024 * 1024;

// Inflate output step
inline constexpr std::size_t INFLATE_CHUNK = 16 * 1024;

// Client-side close codes
inline constexpr std::uint16_t CLOSE_NORMAL    = 1000; // session invalidated by the server
inline constexpr std::uint16_t CLOSE_RESUMABLE = 4000; // session kept for resume

// Identify connection properties
inline constexpr std::string_view PROPERTY_OS      = "linux";
inline constexpr std::string_view PROPERTY_BROWSER = "shardwire";
inline constexpr std::string_view PROPERTY_DEVICE  = "shardwire";

} // namespace shardwire::core::config::gateway
