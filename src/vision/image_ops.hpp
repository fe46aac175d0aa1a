// =============================================================================
// Retina - Image primitives (OpenCV)
// =============================================================================
// Gray conversion, area downscale and normalized cross-correlation used by the
// fingerprinter and the structural matcher.
// =============================================================================
#pragma once

#include "frame.hpp"
#include "result.hpp"

#include <opencv2/core.hpp>

namespace retina::vision {

// Wraps the frame (or region) and converts it to a CV_8UC1 image.
// The result owns its pixels; the frame may be released afterwards.
Result<cv::Mat> toGray(const Frame& frame, const Region* region = nullptr);

// Wraps caller-owned Gray8 bytes (no copy)
cv::Mat wrapGray8(const uint8_t* data, int w, int h);

// Area-interpolated resize to w x h
cv::Mat downscale(const cv::Mat& gray, int w, int h);

struct Correlation {
    float score = 0.0f;  // clamped to [0, 1]
    int x = 0;           // best location (top-left) in the haystack
    int y = 0;
};

// Single-score NCC for two images of equal size
float correlateSameSize(const cv::Mat& a, const cv::Mat& b);

// Sliding NCC of needle over haystack; needle must not exceed haystack
Correlation locate(const cv::Mat& haystack, const cv::Mat& needle);

} // namespace retina::vision
