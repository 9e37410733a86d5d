#pragma once

#include <chrono>
#include <cstdint>

#include "shardwire/core/gateway/schema/hello.hpp"
#include "shardwire/core/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace shardwire::core::gateway::parser {

using core::parser::Result;
namespace helper = core::parser::helper;

struct hello {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& d, schema::Hello& out) noexcept {
        std::uint64_t interval{};
        auto r = helper::parse_uint64_required(d, "heartbeat_interval", interval);
        if (r != Result::Parsed) {
            SW_DEBUG("[PARSER] Field 'heartbeat_interval' missing or invalid in hello -> ignore message.");
            return r;
        }
        if (interval == 0) {
            SW_DEBUG("[PARSER] Zero heartbeat interval in hello -> ignore message.");
            return Result::InvalidValue;
        }
        out.heartbeat_interval = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(interval)};
        return Result::Parsed;
    }
};

} // namespace shardwire::core::gateway::parser
