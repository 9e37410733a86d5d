#pragma once

#include <chrono>
#include <cmath>
#include <string_view>

#include "shardwire/core/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace shardwire::core::http::parser {

using core::parser::Result;
namespace helper = core::parser::helper;

// Body of a 429 answer: {"message": "...", "retry_after": 1.5, "global": false}
struct RateLimitedBody {
    std::chrono::milliseconds retry_after{0};
    bool global{false};
};

struct rate_limited {

    [[nodiscard]]
    static inline Result parse(simdjson::dom::parser& parser, std::string_view body, RateLimitedBody& out) noexcept {
        out = RateLimitedBody{};

        simdjson::dom::element root;
        if (parser.parse(body.data(), body.size()).get(root)) {
            SW_DEBUG("[PARSER] 429 body is not valid JSON -> ignore body.");
            return Result::InvalidJson;
        }

        // retry_after (required, seconds)
        double secs{};
        auto r = helper::parse_double_required(root, "retry_after", secs);
        if (r != Result::Parsed) {
            SW_DEBUG("[PARSER] Field 'retry_after' missing or invalid in 429 body -> ignore body.");
            return r;
        }
        if (!std::isfinite(secs) || secs < 0.0) {
            return Result::InvalidValue;
        }
        out.retry_after = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(std::ceil(secs * 1000.0))};

        // global (optional)
        lcr::optional<bool> global;
        r = helper::parse_bool_optional(root, "global", global);
        if (r != Result::Parsed) {
            SW_DEBUG("[PARSER] Field 'global' invalid in 429 body -> ignore body.");
            return r;
        }
        out.global = global.value_or(false);

        return Result::Parsed;
    }
};

} // namespace shardwire::core::http::parser
