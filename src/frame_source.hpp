#pragma once
// =============================================================================
// FrameSource - capture backend seam
// =============================================================================
// The concrete screen grabber lives outside this module. Provided here:
//   MemoryFrameSource     frames pushed by the host or a test
//   ImageFileFrameSource  replays image files from a directory in name order
// =============================================================================
#include "frame.hpp"
#include "result.hpp"

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace retina {

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // CaptureFailed when no frame can be produced
    virtual Result<Frame> grab() = 0;

    // true once a finite source has nothing left
    virtual bool exhausted() const { return false; }
};

class MemoryFrameSource : public FrameSource {
public:
    void push(Frame frame);
    size_t pending() const;

    Result<Frame> grab() override;
    bool exhausted() const override;

private:
    mutable std::mutex mutex_;
    std::deque<Frame> frames_;
};

class ImageFileFrameSource : public FrameSource {
public:
    // png/jpg/jpeg/bmp/tga/gif/pgm/ppm in `dir`, sorted by file name.
    // CaptureFailed if the directory cannot be listed.
    static Result<ImageFileFrameSource> open(const std::string& dir, bool loop = false);

    Result<Frame> grab() override;
    bool exhausted() const override;

    size_t size() const { return files_.size(); }

private:
    ImageFileFrameSource(std::vector<std::string> files, bool loop);

    std::vector<std::string> files_;
    size_t next_ = 0;
    bool loop_ = false;
};

} // namespace retina
