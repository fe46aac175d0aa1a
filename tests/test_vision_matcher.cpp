// =============================================================================
// Unit tests for VisionMatcher (src/vision/vision_matcher.cpp)
// =============================================================================
#include <gtest/gtest.h>
#include "vision/vision_matcher.hpp"
#include "test_support.hpp"

#include <algorithm>

using namespace retina;
using namespace retina::vision;

namespace {

constexpr int W = 64;
constexpr int H = 64;

TemplateLibrary makeLibrary(std::vector<TemplateSpec> specs) {
    Fingerprinter fp;
    auto lib = TemplateLibrary::load(std::move(specs), fp);
    EXPECT_TRUE(lib.is_ok()) << lib.error().message;
    return std::move(lib).value();
}

cv::Mat cropMat(const std::vector<uint8_t>& px, int w, int h, const Region& r) {
    return test::grayMat(px, w, h)(cv::Rect(r.x, r.y, r.w, r.h)).clone();
}

} // namespace

// ---------------------------------------------------------------------------
// VM-1: exact fingerprint path
// ---------------------------------------------------------------------------
TEST(VisionMatcherTest, ExactHitHasFullConfidence) {
    Fingerprinter fp;
    auto px = test::makePattern(W, H, 1);
    Frame frame = test::grayFrame(px, W, H);
    Fingerprint digest = fp.fingerprint(frame).value();

    std::vector<TemplateSpec> specs;
    specs.push_back(test::fingerprintTemplate("open", digest));
    TemplateLibrary lib = makeLibrary(std::move(specs));

    VisionMatcher m(lib, fp, nullptr, MatcherConfig{});
    auto r = m.match(frame);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_TRUE(r.value().matched);
    EXPECT_EQ(r.value().template_id, "open");
    EXPECT_FLOAT_EQ(r.value().confidence, 1.0f);
    EXPECT_EQ(r.value().source, MatchResult::Source::Exact);
    EXPECT_EQ(r.value().fingerprint, digest);
    EXPECT_EQ(m.structuralPasses(), 0u);
}

TEST(VisionMatcherTest, ExactHitOnRegionReportsRegionOrigin) {
    Fingerprinter fp;
    auto px = test::makePattern(W, H, 2);
    Frame frame = test::grayFrame(px, W, H);
    Region area{8, 12, 20, 16};
    Fingerprint digest = fp.fingerprint(frame, &area).value();

    std::vector<TemplateSpec> specs;
    specs.push_back(test::fingerprintTemplate("button", digest));
    TemplateLibrary lib = makeLibrary(std::move(specs));

    VisionMatcher m(lib, fp, nullptr, MatcherConfig{});
    auto r = m.match(frame, &area);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value().matched);
    EXPECT_EQ(r.value().x, 8);
    EXPECT_EQ(r.value().y, 12);
}

TEST(VisionMatcherTest, NoTemplatesNoMatch) {
    Fingerprinter fp;
    TemplateLibrary lib = makeLibrary({});
    VisionMatcher m(lib, fp, nullptr, MatcherConfig{});
    auto r = m.match(test::grayFrame(test::makePattern(W, H, 1), W, H));
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value().matched);
    EXPECT_TRUE(r.value().template_id.empty());
    EXPECT_EQ(r.value().source, MatchResult::Source::None);
}

TEST(VisionMatcherTest, InvalidFrameIsError) {
    Fingerprinter fp;
    TemplateLibrary lib = makeLibrary({});
    VisionMatcher m(lib, fp, nullptr, MatcherConfig{});
    Frame bad(std::vector<uint8_t>(3, 0), 4, 4, PixelFormat::Gray8);
    auto r = m.match(bad);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidFrame);
}

// ---------------------------------------------------------------------------
// VM-2: structural path
// ---------------------------------------------------------------------------
TEST(VisionMatcherTest, LocatesSmallerReference) {
    Fingerprinter fp;
    auto px = test::makePattern(W, H, 3);
    Region where{20, 24, 16, 16};

    std::vector<TemplateSpec> specs;
    specs.push_back(test::referenceTemplate("icon", cropMat(px, W, H, where)));
    TemplateLibrary lib = makeLibrary(std::move(specs));

    VisionMatcher m(lib, fp, nullptr, MatcherConfig{});
    auto r = m.match(test::grayFrame(px, W, H));
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_TRUE(r.value().matched);
    EXPECT_EQ(r.value().source, MatchResult::Source::Structural);
    EXPECT_GE(r.value().confidence, 0.99f);
    EXPECT_EQ(r.value().x, 20);
    EXPECT_EQ(r.value().y, 24);
    EXPECT_EQ(m.structuralPasses(), 1u);
}

TEST(VisionMatcherTest, SameSizeReferenceToleratesBrightnessShift) {
    Fingerprinter fp;
    auto px = test::makePattern(W, H, 4);
    std::vector<uint8_t> brighter(px);
    for (auto& v : brighter) v = (uint8_t)std::min(255, v + 20);

    std::vector<TemplateSpec> specs;
    specs.push_back(test::referenceTemplate("screen", test::grayMat(brighter, W, H)));
    TemplateLibrary lib = makeLibrary(std::move(specs));

    VisionMatcher m(lib, fp, nullptr, MatcherConfig{});
    auto r = m.match(test::grayFrame(px, W, H));
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value().matched);
    EXPECT_EQ(r.value().template_id, "screen");
    EXPECT_EQ(r.value().source, MatchResult::Source::Structural);
}

TEST(VisionMatcherTest, BelowThresholdIsNoMatchWithBestScore) {
    Fingerprinter fp;
    auto frame_px = test::makePattern(W, H, 5);
    auto other_px = test::makePattern(16, 16, 77);

    std::vector<TemplateSpec> specs;
    specs.push_back(test::referenceTemplate("other", test::grayMat(other_px, 16, 16)));
    TemplateLibrary lib = makeLibrary(std::move(specs));

    VisionMatcher m(lib, fp, nullptr, MatcherConfig{});
    auto r = m.match(test::grayFrame(frame_px, W, H));
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value().matched);
    EXPECT_LT(r.value().confidence, 0.90f);
    EXPECT_GE(r.value().confidence, 0.0f);
}

TEST(VisionMatcherTest, EqualScoresGoToEarliestTemplate) {
    Fingerprinter fp;
    auto px = test::makePattern(W, H, 6);
    cv::Mat ref = cropMat(px, W, H, Region{4, 4, 12, 12});

    std::vector<TemplateSpec> specs;
    specs.push_back(test::referenceTemplate("first", ref.clone()));
    specs.push_back(test::referenceTemplate("second", ref.clone(), "f2"));
    TemplateLibrary lib = makeLibrary(std::move(specs));

    VisionMatcher m(lib, fp, nullptr, MatcherConfig{});
    auto r = m.match(test::grayFrame(px, W, H));
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value().matched);
    EXPECT_EQ(r.value().template_id, "first");
    EXPECT_EQ(r.value().template_index, 0u);
}

TEST(VisionMatcherTest, TemplateRegionLimitsSearch) {
    Fingerprinter fp;
    auto px = test::makePattern(W, H, 7);
    cv::Mat ref = cropMat(px, W, H, Region{40, 40, 12, 12});

    // Search only the top-left quadrant: the reference lives elsewhere
    TemplateSpec s = test::referenceTemplate("corner", ref);
    s.region = Region{0, 0, 32, 32};
    std::vector<TemplateSpec> specs;
    specs.push_back(s);
    TemplateLibrary lib = makeLibrary(std::move(specs));

    VisionMatcher m(lib, fp, nullptr, MatcherConfig{});
    auto r = m.match(test::grayFrame(px, W, H));
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value().matched);
}

TEST(VisionMatcherTest, RegionOutsideFrameIsSkipped) {
    Fingerprinter fp;
    auto px = test::makePattern(W, H, 8);
    TemplateSpec s = test::referenceTemplate("off", cropMat(px, W, H, Region{0, 0, 8, 8}));
    s.region = Region{60, 60, 16, 16};
    std::vector<TemplateSpec> specs;
    specs.push_back(s);
    TemplateLibrary lib = makeLibrary(std::move(specs));

    VisionMatcher m(lib, fp, nullptr, MatcherConfig{});
    auto r = m.match(test::grayFrame(px, W, H));
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value().matched);
    EXPECT_FLOAT_EQ(r.value().confidence, 0.0f);
}

// ---------------------------------------------------------------------------
// VM-3: cache interaction
// ---------------------------------------------------------------------------
TEST(VisionMatcherTest, CacheSkipsSecondStructuralPass) {
    Fingerprinter fp;
    auto px = test::makePattern(W, H, 9);
    std::vector<TemplateSpec> specs;
    specs.push_back(test::referenceTemplate("icon", cropMat(px, W, H, Region{10, 10, 16, 16})));
    TemplateLibrary lib = makeLibrary(std::move(specs));

    MatchCache cache(8);
    VisionMatcher m(lib, fp, &cache, MatcherConfig{});
    Frame frame = test::grayFrame(px, W, H);

    auto first = m.match(frame);
    auto second = m.match(frame);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(m.structuralPasses(), 1u);
    EXPECT_EQ(cache.stats().hits, 1u);
}

TEST(VisionMatcherTest, NoMatchIsCachedToo) {
    Fingerprinter fp;
    std::vector<TemplateSpec> specs;
    specs.push_back(test::referenceTemplate("other",
                                            test::grayMat(test::makePattern(16, 16, 50), 16, 16)));
    TemplateLibrary lib = makeLibrary(std::move(specs));

    MatchCache cache(8);
    VisionMatcher m(lib, fp, &cache, MatcherConfig{});
    Frame frame = test::grayFrame(test::makePattern(W, H, 11), W, H);

    ASSERT_FALSE(m.match(frame).value().matched);
    ASSERT_FALSE(m.match(frame).value().matched);
    EXPECT_EQ(m.structuralPasses(), 1u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(VisionMatcherTest, ConfigValidation) {
    MatcherConfig c;
    EXPECT_TRUE(validateMatcherConfig(c).is_ok());
    c.threshold = 0.0f;
    EXPECT_EQ(validateMatcherConfig(c).error().kind, ErrorKind::ConfigError);
    c.threshold = 1.5f;
    EXPECT_TRUE(validateMatcherConfig(c).is_err());
    c.threshold = 1.0f;
    EXPECT_TRUE(validateMatcherConfig(c).is_ok());
    c.compare_size = 2;
    EXPECT_TRUE(validateMatcherConfig(c).is_err());
}
