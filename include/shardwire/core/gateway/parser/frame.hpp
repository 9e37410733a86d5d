#pragma once

#include <cstdint>
#include <string_view>

#include "shardwire/core/parser/helpers.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"


namespace shardwire::core::gateway::parser {

using core::parser::Result;
namespace helper = core::parser::helper;

// Envelope of every gateway payload: {"op":..,"d":..,"s":..,"t":..}
// name and data point into the parser's document and are valid until the
// parser is reused.
struct Frame {
    std::uint64_t op{0};
    lcr::optional<std::uint64_t> sequence{};
    std::string_view name{};
    simdjson::dom::element data{};
    bool has_data{false};
};

struct frame {

    [[nodiscard]]
    static inline Result parse(simdjson::dom::parser& parser, std::string_view payload, Frame& out) noexcept {
        out = Frame{};

        simdjson::dom::element root;
        if (parser.parse(payload.data(), payload.size()).get(root)) {
            SW_DEBUG("[PARSER] Gateway payload is not valid JSON -> ignore message.");
            return Result::InvalidJson;
        }

        // op (required)
        auto r = helper::parse_uint64_required(root, "op", out.op);
        if (r != Result::Parsed) {
            SW_DEBUG("[PARSER] Field 'op' missing or invalid in gateway payload -> ignore message.");
            return r;
        }

        // s (optional, null outside dispatches)
        r = helper::parse_uint64_optional(root, "s", out.sequence);
        if (r != Result::Parsed) {
            SW_DEBUG("[PARSER] Field 's' invalid in gateway payload -> ignore message.");
            return r;
        }

        // t (optional, null outside dispatches)
        simdjson::dom::element t;
        bool present = false;
        r = helper::parse_element_optional(root, "t", t, present);
        if (r != Result::Parsed) {
            return r;
        }
        if (present && t.get(out.name)) {
            SW_DEBUG("[PARSER] Field 't' invalid in gateway payload -> ignore message.");
            return Result::InvalidSchema;
        }

        // d (any type, may be null)
        r = helper::parse_element_optional(root, "d", out.data, out.has_data);
        if (r != Result::Parsed) {
            return r;
        }

        return Result::Parsed;
    }
};

} // namespace shardwire::core::gateway::parser
