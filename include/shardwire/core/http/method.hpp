#pragma once

#include <cstdint>
#include <string_view>


namespace shardwire::core::http {

enum class Method : uint8_t {
    Get,
    Post,
    Put,
    Patch,
    Delete
};

[[nodiscard]]
inline constexpr std::string_view to_string(Method m) noexcept {
    switch (m) {
        case Method::Get:    return "GET";
        case Method::Post:   return "POST";
        case Method::Put:    return "PUT";
        case Method::Patch:  return "PATCH";
        case Method::Delete: return "DELETE";
        default:             return "UNKNOWN";
    }
}

} // namespace shardwire::core::http
