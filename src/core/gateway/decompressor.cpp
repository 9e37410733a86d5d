#include "shardwire/core/gateway/decompressor.hpp"

#include <zlib.h>

#include "shardwire/core/config/gateway.hpp"
#include "lcr/log/logger.hpp"


namespace shardwire::core::gateway {

namespace {

constexpr char FLUSH_MARKER[] = {'\x00', '\x00', '\xff', '\xff'};
constexpr std::size_t FLUSH_MARKER_SIZE = sizeof(FLUSH_MARKER);

} // namespace

Decompressor::Decompressor()
    : stream_(std::make_unique<z_stream_s>())
{
    stream_->zalloc = Z_NULL;
    stream_->zfree = Z_NULL;
    stream_->opaque = Z_NULL;
    stream_->next_in = Z_NULL;
    stream_->avail_in = 0;
    if (inflateInit(stream_.get()) != Z_OK) {
        SW_ERROR("[ZLIB] inflateInit failed");
        failed_ = true;
    }
}

Decompressor::~Decompressor() {
    if (stream_->state != Z_NULL) {
        inflateEnd(stream_.get());
    }
}

decompress::Result Decompressor::feed(std::string_view chunk, std::vector<std::string>& out) {
    if (failed_) {
        return decompress::Result::CorruptStream;
    }
    buffer_.append(chunk.data(), chunk.size());

    const std::string_view marker(FLUSH_MARKER, FLUSH_MARKER_SIZE);
    std::size_t start = 0;
    for (;;) {
        const std::string_view pending(buffer_.data() + start, buffer_.size() - start);
        const std::size_t from = (scan_from_ > start) ? scan_from_ - start : 0;
        const std::size_t pos = pending.find(marker, from);
        if (pos == std::string_view::npos) {
            break;
        }
        const std::size_t end = pos + FLUSH_MARKER_SIZE;
        const auto r = inflate_(pending.data(), end, payload_);
        if (r != decompress::Result::Ok) {
            failed_ = true;
            return r;
        }
        start += end;
        scan_from_ = start;
        if (at_flush_boundary_()) {
            out.push_back(std::move(payload_));
            payload_.clear();
        }
        else {
            SW_TRACE("[ZLIB] Marker bytes inside a block, payload continues (" << payload_.size() << " bytes so far)");
        }
    }

    buffer_.erase(0, start);
    // A marker may straddle the next chunk boundary
    scan_from_ = (buffer_.size() >= FLUSH_MARKER_SIZE) ? buffer_.size() - (FLUSH_MARKER_SIZE - 1) : 0;

    if (buffer_.size() > config::gateway::MAX_COMPRESSED_BUFFER) {
        SW_ERROR("[ZLIB] " << buffer_.size() << " compressed bytes without flush marker");
        failed_ = true;
        return decompress::Result::BufferOverflow;
    }
    if (payload_.size() > config::gateway::MAX_INFLATED_PAYLOAD) {
        SW_ERROR("[ZLIB] " << payload_.size() << " inflated bytes without payload end");
        failed_ = true;
        return decompress::Result::BufferOverflow;
    }
    return decompress::Result::Ok;
}

decompress::Result Decompressor::inflate_(const char* data, std::size_t size, std::string& out) {
    z_stream_s& zs = *stream_;
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    zs.avail_in = static_cast<uInt>(size);

    char buf[config::gateway::INFLATE_CHUNK];
    for (;;) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = static_cast<uInt>(sizeof(buf));
        const int ret = inflate(&zs, Z_SYNC_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
            SW_ERROR("[ZLIB] inflate failed (" << ret << (zs.msg ? std::string(": ") + zs.msg : std::string()) << ")");
            return decompress::Result::CorruptStream;
        }
        const std::size_t produced = sizeof(buf) - zs.avail_out;
        out.append(buf, produced);
        // Z_BUF_ERROR: no progress possible, input consumed
        if (ret == Z_STREAM_END || ret == Z_BUF_ERROR || (zs.avail_in == 0 && zs.avail_out != 0)) {
            break;
        }
    }
    zs.next_in = Z_NULL;
    zs.avail_in = 0;
    return decompress::Result::Ok;
}

bool Decompressor::at_flush_boundary_() const noexcept {
    // data_type: unused bits of the last input byte, +128 when inflate waits
    // for the next block header
    const int dt = stream_->data_type;
    return (dt & 128) != 0 && (dt & 63) == 0;
}

} // namespace shardwire::core::gateway
