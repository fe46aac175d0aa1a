// =============================================================================
// Retina - Frame / Region
// =============================================================================
// Immutable raw capture buffer. Pixel storage is shared between copies, so a
// Frame can be handed from the capture stage to the matcher without copying.
// =============================================================================
#pragma once

#include "result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace retina {

enum class PixelFormat {
    Gray8,
    Rgb8,
    Bgr8,
    Rgba8,
    Bgra8
};

inline int channelCount(PixelFormat f) {
    switch (f) {
        case PixelFormat::Gray8: return 1;
        case PixelFormat::Rgb8:
        case PixelFormat::Bgr8:  return 3;
        case PixelFormat::Rgba8:
        case PixelFormat::Bgra8: return 4;
    }
    return 0;
}

inline const char* pixelFormatToString(PixelFormat f) {
    switch (f) {
        case PixelFormat::Gray8: return "Gray8";
        case PixelFormat::Rgb8:  return "Rgb8";
        case PixelFormat::Bgr8:  return "Bgr8";
        case PixelFormat::Rgba8: return "Rgba8";
        case PixelFormat::Bgra8: return "Bgra8";
    }
    return "?";
}

// Rectangular sub-area of a frame (pixels, top-left origin)
struct Region {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    bool empty() const { return w <= 0 || h <= 0; }

    bool within(int frame_w, int frame_h) const {
        // Subtract instead of add: x + w can overflow int.
        return !empty() && x >= 0 && y >= 0 &&
               x <= frame_w && y <= frame_h &&
               w <= frame_w - x && h <= frame_h - y;
    }

    bool operator==(const Region& o) const {
        return x == o.x && y == o.y && w == o.w && h == o.h;
    }
};

class Frame {
public:
    using Clock = std::chrono::steady_clock;

    Frame() = default;

    // No validation here: a malformed buffer is reported as InvalidFrame by
    // the stage that consumes it.
    Frame(std::vector<uint8_t> pixels, int width, int height, PixelFormat format,
          Clock::time_point captured_at = Clock::now());

    // Validating constructor
    static Result<Frame> create(std::vector<uint8_t> pixels, int width, int height,
                                PixelFormat format,
                                Clock::time_point captured_at = Clock::now());

    int width() const { return width_; }
    int height() const { return height_; }
    PixelFormat format() const { return format_; }
    int channels() const { return channelCount(format_); }
    size_t stride() const { return (size_t)width_ * channels(); }
    Clock::time_point capturedAt() const { return captured_at_; }

    const uint8_t* data() const { return pixels_ ? pixels_->data() : nullptr; }
    size_t byteSize() const { return pixels_ ? pixels_->size() : 0; }

    // Non-empty, positive dimensions, buffer length == w * h * channels
    Result<void> validate() const;

    // Region must lie within the frame
    Result<void> validateRegion(const Region& r) const;

    // Copies the region into a new frame of the same format
    Result<Frame> crop(const Region& r) const;

    Region bounds() const { return Region{0, 0, width_, height_}; }

private:
    std::shared_ptr<const std::vector<uint8_t>> pixels_;
    int width_ = 0;
    int height_ = 0;
    PixelFormat format_ = PixelFormat::Gray8;
    Clock::time_point captured_at_{};
};

} // namespace retina
