#pragma once

#include <string>
#include <string_view>

#include "shardwire/core/gateway/schema/ready.hpp"
#include "shardwire/core/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace shardwire::core::gateway::parser {

using core::parser::Result;
namespace helper = core::parser::helper;

struct ready {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& d, schema::Ready& out) noexcept {
        std::string_view session_id;
        auto r = helper::parse_string_required(d, "session_id", session_id);
        if (r != Result::Parsed) {
            SW_WARN("[PARSER] Field 'session_id' missing or invalid in READY.");
            return r;
        }
        if (session_id.empty()) {
            return Result::InvalidValue;
        }
        out.session_id = std::string(session_id);

        r = helper::parse_string_optional(d, "resume_gateway_url", out.resume_gateway_url);
        if (r != Result::Parsed) {
            SW_DEBUG("[PARSER] Field 'resume_gateway_url' invalid in READY -> ignored.");
            out.resume_gateway_url.reset();
        }
        return Result::Parsed;
    }
};

} // namespace shardwire::core::gateway::parser
