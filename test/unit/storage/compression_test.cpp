#include <gtest/gtest.h>

#include <string>

#include "usagedb/storage/compression.h"

namespace usagedb {
namespace storage {
namespace {

TEST(GzipCompressorTest, RoundTripsBucketJson) {
    std::string json = "[\n";
    for (int i = 0; i < 500; ++i) {
        json += "  {\"timestamp\": " + std::to_string(1704067200000 + i) + ", \"totalCost\": 0.25},\n";
    }
    json += "]";

    GzipCompressor compressor(6);
    auto compressed = compressor.compress(json);
    ASSERT_TRUE(compressed.ok()) << compressed.error();
    EXPECT_LT(compressed.value().size(), json.size());
    // gzip magic
    ASSERT_GE(compressed.value().size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(compressed.value()[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(compressed.value()[1]), 0x8b);

    auto restored = compressor.decompress(compressed.value());
    ASSERT_TRUE(restored.ok()) << restored.error();
    EXPECT_EQ(restored.value(), json);
}

TEST(GzipCompressorTest, EmptyInput) {
    GzipCompressor compressor;
    auto compressed = compressor.compress("");
    ASSERT_TRUE(compressed.ok());
    auto restored = compressor.decompress(compressed.value());
    ASSERT_TRUE(restored.ok());
    EXPECT_TRUE(restored.value().empty());
}

TEST(GzipCompressorTest, GarbageIsCorruption) {
    GzipCompressor compressor;
    auto result = compressor.decompress("this is not a gzip stream");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::DATA_CORRUPTION);
}

TEST(GzipCompressorTest, TruncatedStreamIsCorruption) {
    GzipCompressor compressor(9);
    auto compressed = compressor.compress(std::string(10000, 'x') + "tail");
    ASSERT_TRUE(compressed.ok());
    std::string truncated = compressed.value().substr(0, compressed.value().size() / 2);

    auto result = compressor.decompress(truncated);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::DATA_CORRUPTION);
}

TEST(GzipCompressorTest, RejectsInvalidLevel) {
    EXPECT_THROW(GzipCompressor(10), core::InvalidArgumentError);
    EXPECT_THROW(GzipCompressor(-2), core::InvalidArgumentError);
    EXPECT_EQ(GzipCompressor(0).level(), 0);
}

} // namespace
} // namespace storage
} // namespace usagedb
