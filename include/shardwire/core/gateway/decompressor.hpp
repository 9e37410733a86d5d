#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct z_stream_s;


namespace shardwire::core::gateway {

namespace decompress {

enum class Result : std::uint8_t {
    Ok,                 // zero or more payloads appended
    CorruptStream,      // inflate rejected the data; the instance is unusable
    BufferOverflow      // no payload end within the buffer limits
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:             return "Ok";
        case Result::CorruptStream:  return "CorruptStream";
        case Result::BufferOverflow: return "BufferOverflow";
        default:                     return "Unknown";
    }
}

} // namespace decompress

/*
===============================================================================
 gateway::Decompressor
===============================================================================

Transport-level zlib-stream inflater. One inflate context spans the whole
transport lifetime (the dictionary carries over between payloads), so a new
instance is created for every connection.

The server terminates every payload with a sync flush, which ends the
compressed bytes with an empty stored block (00 00 FF FF). Chunks handed to
feed() are arbitrary slices of the stream. Compressed bytes are inflated up
to each candidate marker; the inflated bytes form one payload only when
inflate stopped on a byte-aligned block boundary there. The same four bytes
inside a block (stored data, Huffman codes) leave the output pending and the
scan continues.

Not thread-safe. After a failure every later feed() fails.
===============================================================================
*/

class Decompressor {
public:
    Decompressor();
    ~Decompressor();

    Decompressor(const Decompressor&) = delete;
    Decompressor& operator=(const Decompressor&) = delete;

    [[nodiscard]]
    decompress::Result feed(std::string_view chunk, std::vector<std::string>& out);

    // Compressed bytes waiting for a flush marker
    [[nodiscard]]
    std::size_t buffered() const noexcept {
        return buffer_.size();
    }

    // Inflated bytes of a payload whose end was not seen yet
    [[nodiscard]]
    std::size_t pending() const noexcept {
        return payload_.size();
    }

    [[nodiscard]]
    bool failed() const noexcept {
        return failed_;
    }

private:
    [[nodiscard]]
    decompress::Result inflate_(const char* data, std::size_t size, std::string& out);

    // inflate stopped between blocks with no bits left over
    [[nodiscard]]
    bool at_flush_boundary_() const noexcept;

private:
    std::unique_ptr<z_stream_s> stream_;
    std::string buffer_;
    std::string payload_;
    std::size_t scan_from_{0};
    bool failed_{false};
};

} // namespace shardwire::core::gateway
