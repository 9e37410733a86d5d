#include <iostream>
#include <string>

#include "shardwire/core/http/gateway.hpp"
#include "common/mock_http_client.hpp"
#include "common/test_check.hpp"


using namespace shardwire::core;
using namespace shardwire::core::http;
using namespace std::chrono_literals;

using GatewayBot = shardwire::core::gateway::schema::GatewayBot;

namespace {

const Header* find_seen_header(const Headers& headers, std::string_view name) {
    for (const auto& h : headers) {
        if (iequals(h.first, name)) {
            return &h;
        }
    }
    return nullptr;
}

} // namespace

// -----------------------------------------------------------------------------
// Test: GET /gateway is unauthenticated and counts against no global limit
// -----------------------------------------------------------------------------
void test_get_gateway() {
    std::cout << "[TEST] http::gateway::get_gateway\n";

    MockHttpClient client;
    Dispatcher<MockHttpClient> dispatcher(client);

    // Global limit exhausted: /gateway still goes through
    dispatcher.update_global(0, 5000ms);
    client.push(200, {}, R"({"url":"wss://gateway.discord.gg"})");

    GatewayBot bot;
    const Outcome outcome = http::gateway::get_gateway(dispatcher, bot, RequestOptions{false});
    TEST_CHECK(outcome.ok());
    TEST_CHECK(bot.url == "wss://gateway.discord.gg");
    TEST_CHECK(!bot.shards.has());

    const auto seen = client.requests();
    TEST_CHECK(seen.size() == 1);
    TEST_CHECK(seen[0].url == "https://discord.com/api/v10/gateway");
    TEST_CHECK(find_seen_header(seen[0].headers, "Authorization") == nullptr);
    // No global gate was created for /gateway
    TEST_CHECK(dispatcher.global_count() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: GET /gateway/bot sends the bot token and parses the session limits
// -----------------------------------------------------------------------------
void test_get_gateway_bot() {
    std::cout << "[TEST] http::gateway::get_gateway_bot\n";

    MockHttpClient client;
    Dispatcher<MockHttpClient> dispatcher(client);

    // The unauthenticated global limit does not hold back the token
    dispatcher.update_global(0, 5000ms);

    client.push(200, {}, R"({
        "url": "wss://gateway.discord.gg",
        "shards": 9,
        "session_start_limit": {"total": 1000, "remaining": 999, "reset_after": 14400000, "max_concurrency": 16}
    })");

    GatewayBot bot;
    TEST_CHECK(http::gateway::get_gateway_bot(dispatcher, "abc.def", bot, RequestOptions{false}).ok());
    TEST_CHECK(dispatcher.global_count() == 2);
    TEST_CHECK(bot.shards.has() && bot.shards.value() == 9);
    TEST_CHECK(bot.max_concurrency.has() && bot.max_concurrency.value() == 16);
    TEST_CHECK(bot.session_start_limit.total == 1000);
    TEST_CHECK(bot.session_start_limit.remaining == 999);
    TEST_CHECK(bot.session_start_limit.reset_after == 14400000ms);

    const auto seen = client.requests();
    TEST_CHECK(seen.size() == 1);
    TEST_CHECK(seen[0].url == "https://discord.com/api/v10/gateway/bot");
    const Header* auth = find_seen_header(seen[0].headers, "authorization");
    TEST_CHECK(auth != nullptr);
    TEST_CHECK(auth->second == "Bot abc.def");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: malformed or incomplete answers and HTTP errors
// -----------------------------------------------------------------------------
void test_get_gateway_bot_errors() {
    std::cout << "[TEST] http::gateway::get_gateway_bot errors\n";

    MockHttpClient client;
    Dispatcher<MockHttpClient> dispatcher(client);
    GatewayBot bot;

    client.push(401, {}, R"({"message":"401: Unauthorized","code":0})");
    TEST_CHECK(http::gateway::get_gateway_bot(dispatcher, "bad", bot).error == Error::Unauthorized);

    client.push(200, {}, R"({"url":"wss://gateway.discord.gg"})");
    TEST_CHECK(http::gateway::get_gateway_bot(dispatcher, "t", bot).error == Error::InvalidBody);

    client.push(200, {}, "not json");
    TEST_CHECK(http::gateway::get_gateway_bot(dispatcher, "t", bot).error == Error::InvalidBody);

    client.push(200, {}, R"({"url":"wss://g","shards":0})");
    TEST_CHECK(http::gateway::get_gateway_bot(dispatcher, "t", bot).error == Error::InvalidBody);

    // Session start counters wider than 32 bits are rejected, not truncated
    client.push(200, {}, R"({"url":"wss://g","shards":1,"session_start_limit":{"total":4294967296,"remaining":1,"reset_after":0,"max_concurrency":1}})");
    TEST_CHECK(http::gateway::get_gateway_bot(dispatcher, "t", bot).error == Error::InvalidBody);

    client.push(200, {}, R"({"url":"wss://g","shards":1,"session_start_limit":{"total":1000,"remaining":4294967297,"reset_after":0,"max_concurrency":1}})");
    TEST_CHECK(http::gateway::get_gateway_bot(dispatcher, "t", bot).error == Error::InvalidBody);

    client.push(200, {}, R"({"url":"wss://g","shards":1,"session_start_limit":{"total":4294967295,"remaining":4294967295,"reset_after":0,"max_concurrency":1}})");
    TEST_CHECK(http::gateway::get_gateway_bot(dispatcher, "t", bot).ok());
    TEST_CHECK(bot.session_start_limit.total == 4294967295u);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_get_gateway();
    test_get_gateway_bot();
    test_get_gateway_bot_errors();

    std::cout << "\n[GROUP TEST] ALL http::gateway TESTS PASSED!\n";
    return 0;
}
