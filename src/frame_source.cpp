// =============================================================================
// FrameSource implementations
// =============================================================================
#include "frame_source.hpp"
#include "image_loader.hpp"
#include "retina_log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

static constexpr const char* TAG = "capture";

namespace fs = std::filesystem;

namespace retina {

// =============================================================================
// MemoryFrameSource
// =============================================================================

void MemoryFrameSource::push(Frame frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.push_back(std::move(frame));
}

size_t MemoryFrameSource::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

Result<Frame> MemoryFrameSource::grab() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.empty()) return Error("no frame queued", ErrorKind::CaptureFailed);
    Frame f = std::move(frames_.front());
    frames_.pop_front();
    return f;
}

bool MemoryFrameSource::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.empty();
}

// =============================================================================
// ImageFileFrameSource
// =============================================================================

static bool isImageFile(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" ||
           ext == ".tga" || ext == ".gif" || ext == ".pgm" || ext == ".ppm";
}

Result<ImageFileFrameSource> ImageFileFrameSource::open(const std::string& dir, bool loop) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Error("frames directory not found: " + dir, ErrorKind::CaptureFailed);
    }

    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && isImageFile(entry.path())) {
            files.push_back(entry.path().string());
        }
    }
    if (ec) {
        return Error("cannot list " + dir + ": " + ec.message(), ErrorKind::CaptureFailed,
                     ec.value());
    }
    std::sort(files.begin(), files.end());

    RLOG_INFO(TAG, "replaying %zu frame(s) from %s%s", files.size(), dir.c_str(),
              loop ? " (loop)" : "");
    return ImageFileFrameSource(std::move(files), loop);
}

ImageFileFrameSource::ImageFileFrameSource(std::vector<std::string> files, bool loop)
    : files_(std::move(files)), loop_(loop) {}

Result<Frame> ImageFileFrameSource::grab() {
    if (files_.empty()) return Error("no frames to replay", ErrorKind::CaptureFailed);
    if (next_ >= files_.size()) {
        if (!loop_) return Error("frame replay finished", ErrorKind::CaptureFailed);
        next_ = 0;
    }
    const std::string& path = files_[next_++];
    return loadFrame(path);
}

bool ImageFileFrameSource::exhausted() const {
    return !loop_ && next_ >= files_.size();
}

} // namespace retina
