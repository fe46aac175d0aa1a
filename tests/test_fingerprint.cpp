// =============================================================================
// Unit tests for Fingerprinter (src/vision/fingerprint.cpp)
// =============================================================================
#include <gtest/gtest.h>
#include "vision/fingerprint.hpp"
#include "test_support.hpp"

using namespace retina;
using namespace retina::vision;

// ---------------------------------------------------------------------------
// FP-1: determinism
// ---------------------------------------------------------------------------
TEST(FingerprintTest, SameContentSameFingerprint) {
    Fingerprinter fp;
    auto px = test::makePattern(64, 48, 1);
    auto a = fp.fingerprint(test::grayFrame(px, 64, 48));
    auto b = fp.fingerprint(test::grayFrame(px, 64, 48));
    ASSERT_TRUE(a.is_ok()) << a.error().message;
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value(), b.value());
}

TEST(FingerprintTest, CaptureTimeDoesNotMatter) {
    Fingerprinter fp;
    auto px = test::makePattern(32, 32, 4);
    Frame early(px, 32, 32, PixelFormat::Gray8, Frame::Clock::time_point{});
    Frame late(px, 32, 32, PixelFormat::Gray8, Frame::Clock::now());
    EXPECT_EQ(fp.fingerprint(early).value(), fp.fingerprint(late).value());
}

TEST(FingerprintTest, DifferentContentDifferentFingerprint) {
    Fingerprinter fp;
    auto a = fp.fingerprint(test::grayFrame(test::makePattern(64, 64, 1), 64, 64));
    auto b = fp.fingerprint(test::grayFrame(test::makePattern(64, 64, 2), 64, 64));
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_NE(a.value(), b.value());
}

// ---------------------------------------------------------------------------
// FP-2: format-aware gray conversion
// ---------------------------------------------------------------------------
TEST(FingerprintTest, RgbaAndBgraOfSameImageAgree) {
    Fingerprinter fp;
    auto pair = test::makeColourPair(40, 30, 9);
    auto a = fp.fingerprint(pair.rgba);
    auto b = fp.fingerprint(pair.bgra);
    ASSERT_TRUE(a.is_ok()) << a.error().message;
    ASSERT_TRUE(b.is_ok()) << b.error().message;
    EXPECT_EQ(a.value(), b.value());
}

TEST(FingerprintTest, GrayFrameMatchesReferenceMat) {
    Fingerprinter fp;
    auto px = test::makePattern(20, 20, 5);
    auto from_frame = fp.fingerprint(test::grayFrame(px, 20, 20));
    auto from_mat = fp.fingerprintGray(test::grayMat(px, 20, 20));
    ASSERT_TRUE(from_frame.is_ok());
    ASSERT_TRUE(from_mat.is_ok());
    EXPECT_EQ(from_frame.value(), from_mat.value());
}

TEST(FingerprintTest, RegionEqualsCroppedFrame) {
    Fingerprinter fp;
    Frame f = test::grayFrame(test::makePattern(64, 64, 3), 64, 64);
    Region r{8, 16, 24, 20};
    auto by_region = fp.fingerprint(f, &r);
    auto by_crop = fp.fingerprint(f.crop(r).value());
    ASSERT_TRUE(by_region.is_ok());
    ASSERT_TRUE(by_crop.is_ok());
    EXPECT_EQ(by_region.value(), by_crop.value());
}

TEST(FingerprintTest, ParametersAreMixedIntoDigest) {
    FingerprintConfig coarse;
    coarse.grid = 8;
    Fingerprinter a;
    Fingerprinter b(coarse);
    Frame f = test::grayFrame(test::makeFlat(32, 32, 0), 32, 32);
    EXPECT_NE(a.fingerprint(f).value(), b.fingerprint(f).value());
}

// ---------------------------------------------------------------------------
// FP-3: invalid input
// ---------------------------------------------------------------------------
TEST(FingerprintTest, ZeroWidthIsInvalidFrame) {
    Fingerprinter fp;
    Frame f(std::vector<uint8_t>{}, 0, 4, PixelFormat::Rgba8);
    auto r = fp.fingerprint(f);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidFrame);
}

TEST(FingerprintTest, ShortBufferIsInvalidFrame) {
    Fingerprinter fp;
    Frame f(std::vector<uint8_t>(10, 0), 4, 4, PixelFormat::Gray8);
    EXPECT_EQ(fp.fingerprint(f).error().kind, ErrorKind::InvalidFrame);
}

TEST(FingerprintTest, RegionOutsideFrameIsInvalidFrame) {
    Fingerprinter fp;
    Frame f = test::grayFrame(test::makePattern(16, 16, 1), 16, 16);
    Region r{10, 10, 8, 8};
    EXPECT_EQ(fp.fingerprint(f, &r).error().kind, ErrorKind::InvalidFrame);
}

TEST(FingerprintTest, ColourReferenceMatIsRejected) {
    Fingerprinter fp;
    cv::Mat colour(8, 8, CV_8UC3, cv::Scalar(1, 2, 3));
    EXPECT_TRUE(fp.fingerprintGray(colour).is_err());
    EXPECT_TRUE(fp.fingerprintGray(cv::Mat()).is_err());
}

// ---------------------------------------------------------------------------
// FP-4: config validation and hex form
// ---------------------------------------------------------------------------
TEST(FingerprintTest, ConfigRanges) {
    FingerprintConfig c;
    EXPECT_TRUE(validateFingerprintConfig(c).is_ok());
    c.grid = 1;
    EXPECT_EQ(validateFingerprintConfig(c).error().kind, ErrorKind::ConfigError);
    c.grid = 129;
    EXPECT_TRUE(validateFingerprintConfig(c).is_err());
    c.grid = 16;
    c.quant_bits = 0;
    EXPECT_TRUE(validateFingerprintConfig(c).is_err());
    c.quant_bits = 9;
    EXPECT_TRUE(validateFingerprintConfig(c).is_err());
    c.quant_bits = 8;
    EXPECT_TRUE(validateFingerprintConfig(c).is_ok());
}

TEST(FingerprintTest, HexFormatting) {
    Fingerprint f{0xABCull};
    EXPECT_EQ(f.toHex(), "0x0000000000000abc");

    Fingerprint parsed;
    ASSERT_TRUE(Fingerprint::parseHex("0x0000000000000ABC", parsed));
    EXPECT_EQ(parsed, f);
    ASSERT_TRUE(Fingerprint::parseHex("ffffffffffffffff", parsed));
    EXPECT_EQ(parsed.value, 0xffffffffffffffffull);

    EXPECT_FALSE(Fingerprint::parseHex("", parsed));
    EXPECT_FALSE(Fingerprint::parseHex("0x", parsed));
    EXPECT_FALSE(Fingerprint::parseHex("xyz", parsed));
    EXPECT_FALSE(Fingerprint::parseHex("0x1ffffffffffffffff", parsed));
}

TEST(FingerprintTest, Fnv1aKnownVector) {
    // FNV-1a 64 of "a"
    const uint8_t a = 'a';
    EXPECT_EQ(fnv1a64(&a, 1), 0xaf63dc4c8601ec8cull);
    EXPECT_EQ(fnv1a64(nullptr, 0), 14695981039346656037ull);
}
