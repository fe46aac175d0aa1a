// =============================================================================
// Retina - Frame validation and cropping
// =============================================================================
#include "frame.hpp"

#include <cstring>

namespace retina {

Frame::Frame(std::vector<uint8_t> pixels, int width, int height, PixelFormat format,
             Clock::time_point captured_at)
    : pixels_(std::make_shared<const std::vector<uint8_t>>(std::move(pixels))),
      width_(width), height_(height), format_(format), captured_at_(captured_at) {}

Result<Frame> Frame::create(std::vector<uint8_t> pixels, int width, int height,
                            PixelFormat format, Clock::time_point captured_at) {
    Frame f(std::move(pixels), width, height, format, captured_at);
    auto v = f.validate();
    if (v.is_err()) return v.error();
    return f;
}

Result<void> Frame::validate() const {
    if (width_ <= 0 || height_ <= 0) {
        return Error("frame has zero dimension (" + std::to_string(width_) + "x" +
                     std::to_string(height_) + ")", ErrorKind::InvalidFrame);
    }
    if (!pixels_ || pixels_->empty()) {
        return Error("frame buffer is empty", ErrorKind::InvalidFrame);
    }
    size_t expected = (size_t)width_ * (size_t)height_ * (size_t)channels();
    if (pixels_->size() != expected) {
        return Error("frame buffer length " + std::to_string(pixels_->size()) +
                     " != " + std::to_string(width_) + "x" + std::to_string(height_) +
                     "x" + std::to_string(channels()), ErrorKind::InvalidFrame);
    }
    return Ok();
}

Result<void> Frame::validateRegion(const Region& r) const {
    if (!r.within(width_, height_)) {
        return Error("region (" + std::to_string(r.x) + "," + std::to_string(r.y) + " " +
                     std::to_string(r.w) + "x" + std::to_string(r.h) +
                     ") outside frame " + std::to_string(width_) + "x" +
                     std::to_string(height_), ErrorKind::InvalidFrame);
    }
    return Ok();
}

Result<Frame> Frame::crop(const Region& r) const {
    auto v = validate();
    if (v.is_err()) return v.error();
    auto vr = validateRegion(r);
    if (vr.is_err()) return vr.error();

    const size_t ch = (size_t)channels();
    const size_t row_bytes = (size_t)r.w * ch;
    std::vector<uint8_t> out(row_bytes * (size_t)r.h);
    const uint8_t* src = data();
    for (int row = 0; row < r.h; ++row) {
        const uint8_t* s = src + ((size_t)(r.y + row) * stride()) + (size_t)r.x * ch;
        std::memcpy(out.data() + (size_t)row * row_bytes, s, row_bytes);
    }
    return Frame(std::move(out), r.w, r.h, format_, captured_at_);
}

} // namespace retina
