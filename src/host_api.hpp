#pragma once
// =============================================================================
// HostApi - data-only surface for the embedding host
// =============================================================================
// Everything crossing this boundary is a plain value: byte vectors, strings,
// integers. No references into the Controller escape, and every call returns
// a structured result rather than throwing.
// =============================================================================
#include "config_loader.hpp"
#include "controller.hpp"
#include "result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace retina {

struct HostTemplate {
    std::string id;
    std::string fingerprint;             // "0x..." hex, optional if reference given
    std::vector<uint8_t> reference;      // Gray8 pixels, optional
    int reference_width = 0;
    int reference_height = 0;
    bool has_region = false;
    int region_x = 0, region_y = 0, region_w = 0, region_h = 0;
    std::string command_type = "press";  // press/keyDown/keyUp/write/hotkey/raw
    std::vector<std::string> keys;
    std::string text;
    std::string ack;                     // empty = device.ack
    int timeout_ms = 0;                  // 0 = device.timeout_ms
};

struct HostFrame {
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    std::string format = "rgba8";        // gray8/rgb8/bgr8/rgba8/bgra8
};

struct HostOutcome {
    uint64_t tick = 0;
    std::string status;                  // no_match/dispatched/busy/error
    bool matched = false;
    std::string template_id;
    float confidence = 0.0f;
    std::string source;                  // exact/structural/none
    std::string fingerprint;
    bool from_cache = false;
    int x = 0, y = 0;
    std::string error_kind;              // empty when no error
    std::string error;
};

struct HostDispatchStatus {
    std::string state;
    bool in_flight = false;
    std::string last_label;
    std::string last_outcome;
    int last_attempts = 0;
    std::string last_error_kind;
    std::string last_error;
    uint64_t submitted = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
};

class HostApi {
public:
    // ConfigError for invalid configuration. A null link opens the one
    // described by config.device.
    static Result<std::unique_ptr<HostApi>> create(const config::AppConfig& config,
                                                   std::unique_ptr<device::SerialLink> link = nullptr);

    // Replaces the template set. Returns the number of templates loaded.
    Result<size_t> loadTemplates(const std::vector<HostTemplate>& templates);
    Result<size_t> loadManifest(const std::string& path);

    HostOutcome processFrame(const HostFrame& frame);
    HostDispatchStatus dispatchStatus() const;

private:
    HostApi(config::AppConfig config, std::unique_ptr<Controller> controller);

    config::AppConfig config_;
    std::unique_ptr<Controller> controller_;
};

// "rgba8" etc. (case-insensitive)
bool parsePixelFormat(const std::string& s, PixelFormat& out);

} // namespace retina
