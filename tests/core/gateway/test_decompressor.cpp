#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "shardwire/core/gateway/decompressor.hpp"
#include "common/zlib_stream.hpp"
#include "common/test_check.hpp"


using namespace shardwire::core::gateway;

// -----------------------------------------------------------------------------
// Test: one payload in one chunk
// -----------------------------------------------------------------------------
void test_single_payload() {
    std::cout << "[TEST] Decompressor single payload\n";

    DeflateStream server;
    Decompressor inflater;
    std::vector<std::string> out;

    const std::string payload = R"({"op":10,"d":{"heartbeat_interval":41250}})";
    TEST_CHECK(inflater.feed(server.compress(payload), out) == decompress::Result::Ok);
    TEST_CHECK(out.size() == 1);
    TEST_CHECK(out[0] == payload);
    TEST_CHECK(inflater.buffered() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: payload split across many chunks, shared dictionary across payloads
// -----------------------------------------------------------------------------
void test_split_chunks() {
    std::cout << "[TEST] Decompressor split chunks\n";

    DeflateStream server;
    Decompressor inflater;
    std::vector<std::string> out;

    const std::string first = R"({"op":0,"s":1,"t":"READY","d":{"session_id":"abc"}})";
    const std::string second = R"({"op":0,"s":2,"t":"GUILD_CREATE","d":{"id":"1","name":"guild"}})";

    const std::string a = server.compress(first);
    for (std::size_t i = 0; i < a.size(); ++i) {
        TEST_CHECK(inflater.feed(std::string_view(a).substr(i, 1), out) == decompress::Result::Ok);
        if (i + 1 < a.size()) {
            TEST_CHECK(out.empty());
        }
    }
    TEST_CHECK(out.size() == 1);
    TEST_CHECK(out[0] == first);

    // Second payload references the first one's dictionary
    const std::string b = server.compress(second);
    const std::size_t half = b.size() / 2;
    TEST_CHECK(inflater.feed(std::string_view(b).substr(0, half), out) == decompress::Result::Ok);
    TEST_CHECK(out.size() == 1);
    TEST_CHECK(inflater.buffered() == half);
    TEST_CHECK(inflater.feed(std::string_view(b).substr(half), out) == decompress::Result::Ok);
    TEST_CHECK(out.size() == 2);
    TEST_CHECK(out[1] == second);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: several payloads in one chunk
// -----------------------------------------------------------------------------
void test_coalesced_payloads() {
    std::cout << "[TEST] Decompressor coalesced payloads\n";

    DeflateStream server;
    Decompressor inflater;
    std::vector<std::string> out;

    std::string chunk = server.compress(R"({"op":11})");
    chunk += server.compress(R"({"op":1,"d":5})");
    chunk += server.compress(R"({"op":7,"d":null})");

    TEST_CHECK(inflater.feed(chunk, out) == decompress::Result::Ok);
    TEST_CHECK(out.size() == 3);
    TEST_CHECK(out[0] == R"({"op":11})");
    TEST_CHECK(out[1] == R"({"op":1,"d":5})");
    TEST_CHECK(out[2] == R"({"op":7,"d":null})");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: 00 00 FF FF inside a block does not end the payload
// -----------------------------------------------------------------------------
void test_marker_bytes_inside_block() {
    std::cout << "[TEST] Decompressor marker bytes inside a block\n";

    // Stored blocks copy the payload verbatim, marker bytes included
    DeflateStream server(Z_NO_COMPRESSION);
    Decompressor inflater;
    std::vector<std::string> out;

    std::string tricky = R"({"op":0,"t":"MESSAGE_CREATE","d":{"content":")";
    tricky.append("\x00\x00\xff\xff", 4);
    tricky += R"(tail"}})";
    const std::string plain = R"({"op":11})";

    const std::string a = server.compress(tricky);
    TEST_CHECK(std::string_view(a).substr(0, a.size() - 4).find(std::string_view("\x00\x00\xff\xff", 4)) != std::string_view::npos);

    TEST_CHECK(inflater.feed(a, out) == decompress::Result::Ok);
    TEST_CHECK(out.size() == 1);
    TEST_CHECK(out[0] == tricky);
    TEST_CHECK(inflater.pending() == 0);

    // Same stream shape, one byte at a time, followed by a regular payload
    const std::string b = server.compress(tricky);
    for (std::size_t i = 0; i < b.size(); ++i) {
        TEST_CHECK(inflater.feed(std::string_view(b).substr(i, 1), out) == decompress::Result::Ok);
    }
    TEST_CHECK(out.size() == 2);
    TEST_CHECK(out[1] == tricky);

    TEST_CHECK(inflater.feed(server.compress(plain), out) == decompress::Result::Ok);
    TEST_CHECK(out.size() == 3);
    TEST_CHECK(out[2] == plain);
    TEST_CHECK(inflater.buffered() == 0);
    TEST_CHECK(inflater.pending() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: corrupt data fails and the instance stays failed
// -----------------------------------------------------------------------------
void test_corrupt_stream() {
    std::cout << "[TEST] Decompressor corrupt stream\n";

    Decompressor inflater;
    std::vector<std::string> out;

    std::string garbage = "this is not a zlib stream";
    garbage.append("\x00\x00\xff\xff", 4);

    TEST_CHECK(inflater.feed(garbage, out) == decompress::Result::CorruptStream);
    TEST_CHECK(inflater.failed());
    TEST_CHECK(out.empty());

    DeflateStream server;
    TEST_CHECK(inflater.feed(server.compress("{}"), out) == decompress::Result::CorruptStream);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_single_payload();
    test_split_chunks();
    test_coalesced_payloads();
    test_marker_bytes_inside_block();
    test_corrupt_stream();

    std::cout << "\n[GROUP TEST] ALL Decompressor TESTS PASSED!\n";
    return 0;
}
