#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shardwire/core/http/route.hpp"


namespace shardwire::core::http {

using Header  = std::pair<std::string, std::string>;
using Headers = std::vector<Header>;

[[nodiscard]]
inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Case-insensitive lookup. Returns nullptr when absent.
[[nodiscard]]
inline const std::string* find_header(const Headers& headers, std::string_view name) noexcept {
    for (const auto& [k, v] : headers) {
        if (iequals(k, name)) {
            return &v;
        }
    }
    return nullptr;
}

// Outbound request. url is filled by the Dispatcher from its base url and the
// route path right before the exchange. rate_limit_key selects the global
// limit the request counts against (one per authentication, empty when
// unauthenticated).
struct Request {
    Route route;
    std::string rate_limit_key{};
    Headers headers{};
    std::string body{};
    std::string url{};

    explicit Request(Route r)
        : route(std::move(r))
    {}

    Request(Route r, std::string b)
        : route(std::move(r))
        , body(std::move(b))
    {}
};

struct Response {
    int status{0};
    Headers headers{};
    std::string body{};

    [[nodiscard]]
    inline const std::string* header(std::string_view name) const noexcept {
        return find_header(headers, name);
    }
};

} // namespace shardwire::core::http
