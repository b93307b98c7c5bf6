#include <gtest/gtest.h>
#include "util/Compressor.hpp"
#include "util/bytes.hpp"

#include <stdexcept>
#include <string>

using namespace sp::util;

class CompressorTest : public ::testing::Test {
protected:
    std::string text;

    void SetUp() override {
        for (int i = 0; i < 500; ++i) text += "line " + std::to_string(i % 7) + " of a repetitive file\n";
    }
};

TEST_F(CompressorTest, RestoresOriginalBytes) {
    const GzipCompressor gz(6);
    const auto packed = gz.compress(asBytes(text));
    const auto unpacked = gz.decompress(packed);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_EQ(toString(*unpacked), text);
}

TEST_F(CompressorTest, ShrinksRepetitiveInput) {
    const auto packed = GzipCompressor(9).compress(asBytes(text));
    EXPECT_LT(packed.size(), text.size() / 4);
}

TEST_F(CompressorTest, WritesGzipMagic) {
    const auto packed = GzipCompressor().compress(asBytes(text));
    ASSERT_GE(packed.size(), 2u);
    EXPECT_EQ(packed[0], 0x1f);
    EXPECT_EQ(packed[1], 0x8b);
}

TEST_F(CompressorTest, EmptyInputIsStillAStream) {
    const GzipCompressor gz;
    const auto packed = gz.compress({});
    EXPECT_FALSE(packed.empty());
    const auto unpacked = gz.decompress(packed);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_TRUE(unpacked->empty());
}

TEST_F(CompressorTest, DecompressRejectsGarbage) {
    EXPECT_FALSE(GzipCompressor().decompress(asBytes("definitely not gzip")).has_value());
}

TEST_F(CompressorTest, DecompressRejectsTruncatedStream) {
    auto packed = GzipCompressor().compress(asBytes(text));
    packed.resize(packed.size() / 2);
    EXPECT_FALSE(GzipCompressor().decompress(packed).has_value());
}

TEST_F(CompressorTest, RejectsOutOfRangeLevel) {
    EXPECT_THROW(GzipCompressor(10), std::invalid_argument);
    EXPECT_THROW(GzipCompressor(-2), std::invalid_argument);
}
