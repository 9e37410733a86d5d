#pragma once

#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

#include <zlib.h>

// Server-side zlib-stream: one deflate context, every payload sync-flushed.
class DeflateStream {
public:
    explicit DeflateStream(int level = Z_DEFAULT_COMPRESSION) {
        std::memset(&zs_, 0, sizeof(zs_));
        if (deflateInit(&zs_, level) != Z_OK) {
            throw std::runtime_error("deflateInit failed");
        }
    }

    ~DeflateStream() {
        deflateEnd(&zs_);
    }

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    // Compressed bytes of one payload, ending with 00 00 FF FF
    std::string compress(std::string_view payload) {
        std::string out;
        zs_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(payload.data()));
        zs_.avail_in = static_cast<uInt>(payload.size());
        char buf[4096];
        do {
            zs_.next_out = reinterpret_cast<Bytef*>(buf);
            zs_.avail_out = sizeof(buf);
            if (deflate(&zs_, Z_SYNC_FLUSH) == Z_STREAM_ERROR) {
                throw std::runtime_error("deflate failed");
            }
            out.append(buf, sizeof(buf) - zs_.avail_out);
        } while (zs_.avail_out == 0);
        return out;
    }

private:
    z_stream zs_;
};
