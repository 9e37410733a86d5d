#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <string_view>

#include "shardwire/core/gateway/schema/gateway_bot.hpp"
#include "shardwire/core/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace shardwire::core::gateway::parser {

using core::parser::Result;
namespace helper = core::parser::helper;

struct gateway_bot {

    // {"url": "...", "shards": 9, "session_start_limit": {"total": 1000,
    //  "remaining": 999, "reset_after": 14400000, "max_concurrency": 1}}
    [[nodiscard]]
    static inline Result parse(simdjson::dom::parser& parser, std::string_view body, schema::GatewayBot& out) noexcept {
        out = schema::GatewayBot{};

        simdjson::dom::element root;
        if (parser.parse(body.data(), body.size()).get(root)) {
            SW_DEBUG("[PARSER] Gateway body is not valid JSON.");
            return Result::InvalidJson;
        }

        std::string_view url;
        auto r = helper::parse_string_required(root, "url", url);
        if (r != Result::Parsed) {
            SW_DEBUG("[PARSER] Field 'url' missing or invalid in gateway body.");
            return r;
        }
        if (url.empty()) {
            return Result::InvalidValue;
        }
        out.url = std::string(url);

        // shards (optional: absent on the unauthenticated endpoint)
        lcr::optional<std::uint64_t> shards;
        r = helper::parse_uint64_optional(root, "shards", shards);
        if (r != Result::Parsed) {
            SW_DEBUG("[PARSER] Field 'shards' invalid in gateway body.");
            return r;
        }
        if (shards.has()) {
            if (shards.value() == 0 || shards.value() > std::numeric_limits<std::uint32_t>::max()) {
                return Result::InvalidValue;
            }
            out.shards = static_cast<std::uint32_t>(shards.value());
        }

        // session_start_limit (optional object)
        simdjson::dom::element ssl;
        bool present = false;
        r = helper::parse_element_optional(root, "session_start_limit", ssl, present);
        if (r != Result::Parsed) {
            return r;
        }
        if (!present) {
            return Result::Parsed;
        }
        if (helper::require_object(ssl) != Result::Parsed) {
            SW_DEBUG("[PARSER] Field 'session_start_limit' is not an object.");
            return Result::InvalidSchema;
        }

        std::uint64_t total{}, remaining{}, reset_after{}, max_concurrency{};
        if (helper::parse_uint64_required(ssl, "total", total) != Result::Parsed ||
            helper::parse_uint64_required(ssl, "remaining", remaining) != Result::Parsed ||
            helper::parse_uint64_required(ssl, "reset_after", reset_after) != Result::Parsed ||
            helper::parse_uint64_required(ssl, "max_concurrency", max_concurrency) != Result::Parsed) {
            SW_DEBUG("[PARSER] Incomplete 'session_start_limit' in gateway body.");
            return Result::InvalidSchema;
        }
        constexpr std::uint64_t u32_max = std::numeric_limits<std::uint32_t>::max();
        if (max_concurrency == 0 || max_concurrency > u32_max || total > u32_max || remaining > u32_max ||
            reset_after > static_cast<std::uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
            SW_DEBUG("[PARSER] Field of 'session_start_limit' out of range in gateway body.");
            return Result::InvalidValue;
        }
        out.session_start_limit.total = static_cast<std::uint32_t>(total);
        out.session_start_limit.remaining = static_cast<std::uint32_t>(remaining);
        out.session_start_limit.reset_after = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(reset_after)};
        out.session_start_limit.max_concurrency = static_cast<std::uint32_t>(max_concurrency);
        out.max_concurrency = static_cast<std::uint32_t>(max_concurrency);

        return Result::Parsed;
    }
};

} // namespace shardwire::core::gateway::parser
