#include "usagedb/storage/compression.h"

#include <cstring>

#include <zlib.h>

namespace usagedb {
namespace storage {

namespace {
// 15 bits of window plus 16 selects gzip framing for deflate
constexpr int kGzipWindowBits = 15 + 16;
// 15 bits of window plus 32 auto-detects zlib or gzip framing for inflate
constexpr int kAutoWindowBits = 15 + 32;
constexpr size_t kChunkSize = 64 * 1024;
}

GzipCompressor::GzipCompressor(int level) : level_(level) {
    if (level < Z_DEFAULT_COMPRESSION || level > Z_BEST_COMPRESSION) {
        throw core::InvalidArgumentError("gzip level must be between -1 and 9");
    }
}

core::Result<std::string> GzipCompressor::compress(const std::string& data) const {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    if (deflateInit2(&stream, level_, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return core::Result<std::string>::error("deflateInit2 failed", core::Error::Code::INTERNAL);
    }

    std::string out;
    out.resize(deflateBound(&stream, static_cast<uLong>(data.size())));
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(&out[0]);
    stream.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&stream, Z_FINISH);
    size_t produced = stream.total_out;
    deflateEnd(&stream);
    if (rc != Z_STREAM_END) {
        return core::Result<std::string>::error("deflate failed with code " + std::to_string(rc),
                                                core::Error::Code::INTERNAL);
    }
    out.resize(produced);
    return out;
}

core::Result<std::string> GzipCompressor::decompress(const std::string& data) const {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    if (inflateInit2(&stream, kAutoWindowBits) != Z_OK) {
        return core::Result<std::string>::error("inflateInit2 failed", core::Error::Code::INTERNAL);
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char chunk[kChunkSize];
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(chunk);
        stream.avail_out = static_cast<uInt>(kChunkSize);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&stream);
            return core::Result<std::string>::from_error(
                core::CorruptionError("Corrupt gzip stream (inflate code " + std::to_string(rc) + ")"));
        }
        out.append(chunk, kChunkSize - stream.avail_out);
        if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            return core::Result<std::string>::from_error(core::CorruptionError("Truncated gzip stream"));
        }
    }
    inflateEnd(&stream);
    return out;
}

} // namespace storage
} // namespace usagedb
