// =============================================================================
// Retina - Controller
// =============================================================================
// Per tick: frame -> fingerprint -> cache get -> (miss) match + cache put ->
// (accepted match) submit the template's command to the DeviceSession.
// Owns the template library, the cache, the matcher, the session and the
// event bus; nothing here is process-global.
// =============================================================================

#pragma once

#include "config_loader.hpp"
#include "device/device_session.hpp"
#include "device/serial_link.hpp"
#include "vision/fingerprint.hpp"
#include "vision/match_result.hpp"
#include "vision/template_library.hpp"
#include "vision/vision_matcher.hpp"
#include "event_bus.hpp"
#include "frame.hpp"
#include "frame_source.hpp"
#include "result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace retina {

struct ControllerConfig {
    vision::FingerprintConfig fingerprint;
    vision::MatcherConfig matcher;
    size_t cache_capacity = 256;
    device::SessionConfig session;
    std::chrono::milliseconds tick{100};
    // tick() blocks until the dispatched command is acknowledged or failed
    bool wait_for_dispatch = false;
    std::chrono::milliseconds dispatch_timeout{250};  // default per-attempt ack timeout
    // Keep each processed frame in its FrameOutcome (diagnostics). Off: the
    // frame is released as soon as the tick returns.
    bool retain_frames = false;
};

ControllerConfig controllerConfigFrom(const config::AppConfig& app);
Result<void> validateControllerConfig(const ControllerConfig& cfg);

// Real termios port or, with device.simulate, an always-acknowledging FakeLink
Result<std::unique_ptr<device::SerialLink>> openDeviceLink(const config::DeviceConfig& cfg);

struct FrameOutcome {
    enum class Status {
        NoMatch,     // frame processed, nothing recognized
        Dispatched,  // command submitted (and acknowledged, when waiting)
        Busy,        // recognized, but a command was already in flight
        Error        // see error
    };

    uint64_t tick = 0;
    Status status = Status::NoMatch;
    std::optional<vision::MatchResult> match;  // set once fingerprinting succeeded
    bool from_cache = false;
    std::optional<Error> error;
    double process_time_ms = 0.0;
    std::optional<Frame> frame;  // only with ControllerConfig::retain_frames
};

const char* frameOutcomeStatusToString(FrameOutcome::Status s);

class Controller {
public:
    // ConfigError for invalid policy. link may be nullptr (recognition only).
    static Result<std::unique_ptr<Controller>> create(const ControllerConfig& config,
                                                      vision::TemplateLibrary library,
                                                      std::unique_ptr<device::SerialLink> link);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // Never fails; problems are reported inside the outcome. Once the device
    // link has failed every tick reports its LinkIoError, matched or not.
    FrameOutcome tick(const Frame& frame, const Region* region = nullptr);
    FrameOutcome tick(FrameSource& source);

    // Runs tick(source) every config.tick on a background thread until stop()
    // or the source is exhausted
    Result<void> start(FrameSource& source);
    void stop();
    bool running() const;

    // Replaces the template set; the cache is cleared
    void setLibrary(vision::TemplateLibrary library);

    EventBus& bus();
    const vision::TemplateLibrary& library() const;
    const vision::MatchCache& cache() const;
    const vision::VisionMatcher& matcher() const;
    device::DeviceSession* session();
    const ControllerConfig& config() const;
    std::optional<FrameOutcome> lastOutcome() const;

private:
    Controller();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace retina
