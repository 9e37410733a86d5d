#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "shardwire/core/parser/result.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the gateway and HTTP parsers to extract primitive
values from simdjson DOM elements.

  • Enforce basic JSON structure (object presence, type correctness)
  • Parse primitive field types (bool, integer, double, string)
  • Strict optional-field semantics: absent is fine, wrong type is not
  • JSON null counts as absent for optional fields

Helpers MUST NOT interpret values semantically, log, or throw.
================================================================================
*/


namespace shardwire::core::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ------------------------------------------------------------
// REQUIRED OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    out = field.value_unsafe();
    return require_object(out);
}

// ------------------------------------------------------------
// ANY FIELD (value kept as a DOM element, null counts as absent)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_element_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    out = field.value_unsafe();
    present = !out.is_null();
    return Result::Parsed;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (obj[key].get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (obj[key].get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_double_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    // Integral JSON numbers are accepted as doubles
    if (field.get(out)) {
        std::int64_t i{};
        if (field.get(i)) {
            return Result::InvalidSchema;
        }
        out = static_cast<double>(i);
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (obj[key].get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<bool>& out) noexcept {
    out.reset();
    simdjson::dom::element field;
    bool present = false;
    if (parse_element_optional(obj, key, field, present) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (!present) {
        return Result::Parsed;
    }
    bool tmp{};
    if (field.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_uint64_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::uint64_t>& out) noexcept {
    out.reset();
    simdjson::dom::element field;
    bool present = false;
    if (parse_element_optional(obj, key, field, present) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (!present) {
        return Result::Parsed;
    }
    std::uint64_t tmp{};
    if (field.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) noexcept {
    out.reset();
    simdjson::dom::element field;
    bool present = false;
    if (parse_element_optional(obj, key, field, present) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (!present) {
        return Result::Parsed;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out = std::string(sv);
    return Result::Parsed;
}

} // namespace shardwire::core::parser::helper
