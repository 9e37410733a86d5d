#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include "shardwire/core/gateway/error.hpp"
#include "lcr/optional.hpp"


namespace shardwire::core::gateway {

enum class CloseAction : std::uint8_t {
    Resume,       // reconnect keeping session id and sequence
    Reidentify,   // reconnect with a fresh identify
    Fatal,        // terminal, error surfaced to the consumer
    Unhandled     // unknown code: warn, reconnect with a fresh identify
};

[[nodiscard]]
inline constexpr std::string_view to_string(CloseAction a) noexcept {
    switch (a) {
        case CloseAction::Resume:     return "Resume";
        case CloseAction::Reidentify: return "Reidentify";
        case CloseAction::Fatal:      return "Fatal";
        case CloseAction::Unhandled:  return "Unhandled";
        default:                      return "Unknown";
    }
}

struct CloseRule {
    std::uint16_t code;
    CloseAction action;
    Error error;
    std::string_view name;
};

inline constexpr std::array<CloseRule, 16> CLOSE_RULES{{
    {1000, CloseAction::Reidentify, Error::SessionInvalidated, "Normal closure"},
    {1001, CloseAction::Reidentify, Error::SessionInvalidated, "Going away"},
    {4000, CloseAction::Resume,     Error::Disconnect,         "Unknown error"},
    {4001, CloseAction::Resume,     Error::Disconnect,         "Unknown opcode"},
    {4002, CloseAction::Resume,     Error::Disconnect,         "Decode error"},
    {4003, CloseAction::Resume,     Error::Disconnect,         "Not authenticated"},
    {4004, CloseAction::Fatal,      Error::InvalidToken,       "Authentication failed"},
    {4005, CloseAction::Resume,     Error::Disconnect,         "Already authenticated"},
    {4007, CloseAction::Reidentify, Error::SessionInvalidated, "Invalid seq"},
    {4008, CloseAction::Resume,     Error::Disconnect,         "Rate limited"},
    {4009, CloseAction::Reidentify, Error::SessionInvalidated, "Session timed out"},
    {4010, CloseAction::Fatal,      Error::InvalidShardCount,  "Invalid shard"},
    {4011, CloseAction::Fatal,      Error::InvalidShardCount,  "Sharding required"},
    {4012, CloseAction::Fatal,      Error::InvalidApiVersion,  "Invalid API version"},
    {4013, CloseAction::Fatal,      Error::InvalidIntents,     "Invalid intent(s)"},
    {4014, CloseAction::Fatal,      Error::DisallowedIntents,  "Disallowed intent(s)"},
}};

// An absent code (abrupt drop) is resumable.
[[nodiscard]]
inline CloseRule classify_close(const lcr::optional<std::uint16_t>& code) noexcept {
    if (!code.has()) {
        return CloseRule{0, CloseAction::Resume, Error::Disconnect, "No close frame"};
    }
    for (const auto& rule : CLOSE_RULES) {
        if (rule.code == code.value()) {
            return rule;
        }
    }
    return CloseRule{code.value(), CloseAction::Unhandled, Error::UnhandledCloseCode, "Unhandled close code"};
}

} // namespace shardwire::core::gateway
