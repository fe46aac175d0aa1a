// =============================================================================
// Retina - Image primitives (OpenCV)
// =============================================================================
#include "vision/image_ops.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace retina::vision {

// Standard deviation below this is treated as a flat image; NCC is undefined there
static constexpr double kFlatStdDev = 1e-3;

static float clamp01(double v) {
    if (std::isnan(v)) return 0.0f;
    return (float)std::clamp(v, 0.0, 1.0);
}

static bool isFlat(const cv::Mat& m, double* mean_out) {
    cv::Scalar mean, stddev;
    cv::meanStdDev(m, mean, stddev);
    if (mean_out) *mean_out = mean[0];
    return stddev[0] < kFlatStdDev;
}

Result<cv::Mat> toGray(const Frame& frame, const Region* region) {
    auto v = frame.validate();
    if (v.is_err()) return v.error();

    cv::Mat src(frame.height(), frame.width(), CV_8UC(frame.channels()),
                const_cast<uint8_t*>(frame.data()), frame.stride());
    if (region) {
        auto vr = frame.validateRegion(*region);
        if (vr.is_err()) return vr.error();
        src = src(cv::Rect(region->x, region->y, region->w, region->h));
    }

    cv::Mat gray;
    switch (frame.format()) {
        case PixelFormat::Gray8: gray = src.clone(); break;
        case PixelFormat::Rgb8:  cv::cvtColor(src, gray, cv::COLOR_RGB2GRAY); break;
        case PixelFormat::Bgr8:  cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY); break;
        case PixelFormat::Rgba8: cv::cvtColor(src, gray, cv::COLOR_RGBA2GRAY); break;
        case PixelFormat::Bgra8: cv::cvtColor(src, gray, cv::COLOR_BGRA2GRAY); break;
    }
    return gray;
}

cv::Mat wrapGray8(const uint8_t* data, int w, int h) {
    return cv::Mat(h, w, CV_8UC1, const_cast<uint8_t*>(data));
}

cv::Mat downscale(const cv::Mat& gray, int w, int h) {
    if (gray.cols == w && gray.rows == h) return gray.clone();
    cv::Mat out;
    cv::resize(gray, out, cv::Size(w, h), 0, 0, cv::INTER_AREA);
    return out;
}

float correlateSameSize(const cv::Mat& a, const cv::Mat& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;

    double mean_a = 0.0, mean_b = 0.0;
    bool flat_a = isFlat(a, &mean_a);
    bool flat_b = isFlat(b, &mean_b);
    if (flat_a || flat_b) {
        return (flat_a && flat_b && std::fabs(mean_a - mean_b) < 0.5) ? 1.0f : 0.0f;
    }

    cv::Mat res;
    cv::matchTemplate(a, b, res, cv::TM_CCOEFF_NORMED);
    return clamp01(res.at<float>(0, 0));
}

Correlation locate(const cv::Mat& haystack, const cv::Mat& needle) {
    Correlation c;
    if (needle.empty() || haystack.empty() ||
        needle.cols > haystack.cols || needle.rows > haystack.rows) {
        return c;
    }

    double needle_mean = 0.0;
    if (isFlat(needle, &needle_mean)) {
        // Flat needle: best position by squared difference, accepted only when
        // the window is practically identical.
        cv::Mat res;
        cv::matchTemplate(haystack, needle, res, cv::TM_SQDIFF);
        double minv, maxv;
        cv::Point minp, maxp;
        cv::minMaxLoc(res, &minv, &maxv, &minp, &maxp);
        double per_pixel = minv / (double)(needle.cols * needle.rows);
        c.score = per_pixel < 1.0 ? 1.0f : 0.0f;
        c.x = minp.x;
        c.y = minp.y;
        return c;
    }

    cv::Mat res;
    cv::matchTemplate(haystack, needle, res, cv::TM_CCOEFF_NORMED);
    double minv, maxv;
    cv::Point minp, maxp;
    cv::minMaxLoc(res, &minv, &maxv, &minp, &maxp);
    c.score = clamp01(maxv);
    c.x = maxp.x;
    c.y = maxp.y;
    return c;
}

} // namespace retina::vision
