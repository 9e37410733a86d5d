#pragma once

#include <string>
#include <string_view>

#include "shardwire/core/http/dispatcher.hpp"
#include "shardwire/core/gateway/schema/gateway_bot.hpp"
#include "shardwire/core/gateway/parser/gateway_bot.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace shardwire::core::http::gateway {

// GET /gateway: websocket url only. Unauthenticated, no global limit applies.
template<HttpClientConcept HttpClient>
[[nodiscard]]
inline Outcome get_gateway(Dispatcher<HttpClient>& dispatcher, core::gateway::schema::GatewayBot& out, RequestOptions opts = {}) {
    Request req{Route{Method::Get, "/gateway", {}, /*ignore_global=*/true}};
    Response resp;
    Outcome outcome = dispatcher.dispatch(req, resp, opts);
    if (!outcome.ok()) {
        return outcome;
    }
    simdjson::dom::parser parser;
    if (core::gateway::parser::gateway_bot::parse(parser, resp.body, out) != core::parser::Result::Parsed) {
        SW_WARN("[HTTP] Unexpected /gateway body");
        return Outcome{Error::InvalidBody, std::chrono::milliseconds{0}};
    }
    return outcome;
}

// GET /gateway/bot: url, recommended shard count and session start limits.
// Counts against the global limit of the token.
template<HttpClientConcept HttpClient>
[[nodiscard]]
inline Outcome get_gateway_bot(Dispatcher<HttpClient>& dispatcher, std::string_view token, core::gateway::schema::GatewayBot& out, RequestOptions opts = {}) {
    Request req{Route{Method::Get, "/gateway/bot"}};
    req.rate_limit_key.assign(token);
    std::string auth = "Bot ";
    auth.append(token);
    req.headers.emplace_back("Authorization", std::move(auth));

    Response resp;
    Outcome outcome = dispatcher.dispatch(req, resp, opts);
    if (!outcome.ok()) {
        return outcome;
    }
    simdjson::dom::parser parser;
    if (core::gateway::parser::gateway_bot::parse(parser, resp.body, out) != core::parser::Result::Parsed || !out.shards.has()) {
        SW_WARN("[HTTP] Unexpected /gateway/bot body");
        return Outcome{Error::InvalidBody, std::chrono::milliseconds{0}};
    }
    SW_INFO("[HTTP] Gateway " << out.url << " recommends " << out.shards.value() << " shards (max_concurrency="
            << out.session_start_limit.max_concurrency << ", session starts left=" << out.session_start_limit.remaining << ")");
    return outcome;
}

} // namespace shardwire::core::http::gateway
