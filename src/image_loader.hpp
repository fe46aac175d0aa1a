#pragma once
// =============================================================================
// Image file decoding (stb_image)
// =============================================================================
#include "frame.hpp"
#include "result.hpp"

#include <opencv2/core.hpp>

#include <string>

namespace retina {

// Decodes any stb-supported file to an owning CV_8UC1 image.
// TemplateLoadError if the file cannot be read or decoded.
Result<cv::Mat> loadGray8(const std::string& path);

// Decodes to an Rgba8 frame stamped with the current time.
// CaptureFailed if the file cannot be read or decoded.
Result<Frame> loadFrame(const std::string& path);

} // namespace retina
