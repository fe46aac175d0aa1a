// =============================================================================
// Unit tests for Frame / Region (src/frame.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "frame.hpp"
#include "test_support.hpp"

#include <climits>

using namespace retina;

TEST(FrameTest, CreateValidatesLength) {
    auto ok = Frame::create(std::vector<uint8_t>(4 * 3 * 4, 0), 4, 3, PixelFormat::Rgba8);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().stride(), 16u);
    EXPECT_EQ(ok.value().channels(), 4);

    auto short_buf = Frame::create(std::vector<uint8_t>(4 * 3 * 4 - 1, 0), 4, 3, PixelFormat::Rgba8);
    ASSERT_TRUE(short_buf.is_err());
    EXPECT_EQ(short_buf.error().kind, ErrorKind::InvalidFrame);
}

TEST(FrameTest, ZeroDimensionIsInvalid) {
    Frame f(std::vector<uint8_t>{}, 0, 10, PixelFormat::Gray8);
    auto v = f.validate();
    ASSERT_TRUE(v.is_err());
    EXPECT_EQ(v.error().kind, ErrorKind::InvalidFrame);
}

TEST(FrameTest, EmptyBufferIsInvalid) {
    Frame f(std::vector<uint8_t>{}, 2, 2, PixelFormat::Gray8);
    EXPECT_EQ(f.validate().error().kind, ErrorKind::InvalidFrame);
}

TEST(FrameTest, DefaultFrameIsInvalid) {
    Frame f;
    EXPECT_TRUE(f.validate().is_err());
    EXPECT_EQ(f.data(), nullptr);
}

TEST(FrameTest, CopiesShareImmutableBuffer) {
    Frame a(std::vector<uint8_t>(16, 7), 4, 4, PixelFormat::Gray8);
    Frame b = a;
    EXPECT_EQ(a.data(), b.data());
}

TEST(FrameTest, RegionWithin) {
    EXPECT_TRUE((Region{0, 0, 4, 4}).within(4, 4));
    EXPECT_TRUE((Region{1, 1, 2, 2}).within(4, 4));
    EXPECT_FALSE((Region{3, 0, 2, 1}).within(4, 4));
    EXPECT_FALSE((Region{-1, 0, 1, 1}).within(4, 4));
    EXPECT_FALSE((Region{0, 0, 0, 1}).within(4, 4));
}

TEST(FrameTest, RegionWithinRejectsHugeExtents) {
    EXPECT_FALSE((Region{1, 0, INT_MAX, 1}).within(4, 4));
    EXPECT_FALSE((Region{0, 2, 1, INT_MAX}).within(4, 4));
    EXPECT_FALSE((Region{INT_MAX, INT_MAX, 1, 1}).within(4, 4));
    EXPECT_TRUE((Region{0, 0, INT_MAX, INT_MAX}).within(INT_MAX, INT_MAX));
    EXPECT_TRUE((Region{1, 1, INT_MAX - 1, 1}).within(INT_MAX, 2));
}

TEST(FrameTest, CropWithOverflowingRegionIsInvalidFrame) {
    Frame f = test::grayFrame(test::makeFlat(4, 4, 10), 4, 4);
    auto c = f.crop(Region{2, 2, INT_MAX, INT_MAX});
    ASSERT_TRUE(c.is_err());
    EXPECT_EQ(c.error().kind, ErrorKind::InvalidFrame);
}

TEST(FrameTest, CropCopiesRegion) {
    std::vector<uint8_t> px(6 * 4);
    for (size_t i = 0; i < px.size(); ++i) px[i] = static_cast<uint8_t>(i);
    Frame f(px, 6, 4, PixelFormat::Gray8);

    auto c = f.crop(Region{2, 1, 3, 2});
    ASSERT_TRUE(c.is_ok());
    const Frame& out = c.value();
    EXPECT_EQ(out.width(), 3);
    EXPECT_EQ(out.height(), 2);
    EXPECT_EQ(out.data()[0], 8);   // (2,1)
    EXPECT_EQ(out.data()[2], 10);  // (4,1)
    EXPECT_EQ(out.data()[3], 14);  // (2,2)
}

TEST(FrameTest, CropOutsideBoundsIsInvalidFrame) {
    Frame f(std::vector<uint8_t>(16 * 4, 0), 4, 4, PixelFormat::Rgba8);
    auto c = f.crop(Region{2, 2, 3, 3});
    ASSERT_TRUE(c.is_err());
    EXPECT_EQ(c.error().kind, ErrorKind::InvalidFrame);
}

TEST(FrameTest, CropKeepsFormatAndTimestamp) {
    auto pair = test::makeColourPair(8, 8, 3);
    auto c = pair.bgra.crop(Region{0, 0, 4, 4});
    ASSERT_TRUE(c.is_ok());
    EXPECT_EQ(c.value().format(), PixelFormat::Bgra8);
    EXPECT_EQ(c.value().capturedAt(), pair.bgra.capturedAt());
}
