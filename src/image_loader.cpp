// =============================================================================
// Image file decoding — stbi_load into Gray8 / Rgba8
// =============================================================================
#include "image_loader.hpp"
#include "retina_log.hpp"

#include <cstring>

// STB_IMAGE_IMPLEMENTATION is defined in stb_image_impl.cpp
#include "stb_image.h"

static constexpr const char* TAG = "image";

namespace retina {

Result<cv::Mat> loadGray8(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    unsigned char* img = stbi_load(path.c_str(), &w, &h, &channels, 1);
    if (!img) {
        std::string err = "stbi_load failed: " + path + " (" +
                          (stbi_failure_reason() ? stbi_failure_reason() : "unknown") + ")";
        RLOG_ERROR(TAG, "%s", err.c_str());
        return Error(err, ErrorKind::TemplateLoadError);
    }

    cv::Mat gray(h, w, CV_8UC1);
    std::memcpy(gray.data, img, (size_t)w * h);
    stbi_image_free(img);

    RLOG_DEBUG(TAG, "loaded %s %dx%d (src channels=%d)", path.c_str(), w, h, channels);
    return gray;
}

Result<Frame> loadFrame(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    unsigned char* img = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!img) {
        std::string err = "stbi_load failed: " + path + " (" +
                          (stbi_failure_reason() ? stbi_failure_reason() : "unknown") + ")";
        RLOG_WARN(TAG, "%s", err.c_str());
        return Error(err, ErrorKind::CaptureFailed);
    }

    std::vector<uint8_t> rgba(img, img + (size_t)w * h * 4);
    stbi_image_free(img);
    return Frame(std::move(rgba), w, h, PixelFormat::Rgba8);
}

} // namespace retina
