#pragma once

#include <string>

#include "usagedb/core/result.h"

namespace usagedb {
namespace storage {

/**
 * @brief Interface for whole-buffer compression of bucket files
 */
class Compressor {
public:
    virtual ~Compressor() = default;

    /**
     * @brief Compress data
     * @param data Raw bytes
     * @return Compressed bytes or error
     */
    virtual core::Result<std::string> compress(const std::string& data) const = 0;

    /**
     * @brief Decompress data
     * @param data Compressed bytes
     * @return Raw bytes, or a DATA_CORRUPTION error when the stream is invalid
     */
    virtual core::Result<std::string> decompress(const std::string& data) const = 0;
};

/**
 * @brief gzip framed deflate (RFC 1952) backed by zlib
 */
class GzipCompressor : public Compressor {
public:
    explicit GzipCompressor(int level = 6);

    core::Result<std::string> compress(const std::string& data) const override;
    core::Result<std::string> decompress(const std::string& data) const override;

    int level() const { return level_; }

private:
    int level_;
};

} // namespace storage
} // namespace usagedb
