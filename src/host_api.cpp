// =============================================================================
// HostApi - implementation
// =============================================================================
#include "host_api.hpp"
#include "device/keyboard_protocol.hpp"
#include "vision/image_ops.hpp"
#include "vision/template_manifest.hpp"
#include "retina_log.hpp"

#include <algorithm>
#include <cctype>

static constexpr const char* TAG = "host";

namespace retina {

bool parsePixelFormat(const std::string& s, PixelFormat& out) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    if (lower == "gray8") { out = PixelFormat::Gray8; return true; }
    if (lower == "rgb8")  { out = PixelFormat::Rgb8;  return true; }
    if (lower == "bgr8")  { out = PixelFormat::Bgr8;  return true; }
    if (lower == "rgba8") { out = PixelFormat::Rgba8; return true; }
    if (lower == "bgra8") { out = PixelFormat::Bgra8; return true; }
    return false;
}

static vision::CommandDefaults commandDefaults(const config::AppConfig& c) {
    vision::CommandDefaults d;
    d.ack = c.device.ack;
    d.timeout = std::chrono::milliseconds(c.device.timeout_ms);
    return d;
}

Result<std::unique_ptr<HostApi>> HostApi::create(const config::AppConfig& config,
                                                 std::unique_ptr<device::SerialLink> link) {
    auto valid = config::validateConfig(config);
    if (valid.is_err()) return valid.error();

    if (!link) {
        auto opened = openDeviceLink(config.device);
        if (opened.is_err()) return opened.error();
        link = std::move(opened).value();
    }

    auto controller = Controller::create(controllerConfigFrom(config), vision::TemplateLibrary(),
                                         std::move(link));
    if (controller.is_err()) return controller.error();

    return std::unique_ptr<HostApi>(new HostApi(config, std::move(controller).value()));
}

HostApi::HostApi(config::AppConfig config, std::unique_ptr<Controller> controller)
    : config_(std::move(config)), controller_(std::move(controller)) {}

Result<size_t> HostApi::loadTemplates(const std::vector<HostTemplate>& templates) {
    const auto defaults = commandDefaults(config_);
    std::vector<vision::TemplateSpec> specs;
    specs.reserve(templates.size());

    for (const auto& h : templates) {
        vision::TemplateSpec s;
        s.id = h.id;

        if (!h.fingerprint.empty()) {
            vision::Fingerprint fp;
            if (!vision::Fingerprint::parseHex(h.fingerprint, fp)) {
                return Error("template '" + h.id + "': bad fingerprint '" + h.fingerprint + "'",
                             ErrorKind::TemplateLoadError);
            }
            s.fingerprint = fp;
        }

        if (!h.reference.empty()) {
            if (h.reference_width <= 0 || h.reference_height <= 0 ||
                h.reference.size() != (size_t)h.reference_width * h.reference_height) {
                return Error("template '" + h.id + "': reference must be Gray8 of "
                             "reference_width x reference_height bytes",
                             ErrorKind::TemplateLoadError);
            }
            // Copy: the library must not alias host memory
            s.reference = vision::wrapGray8(h.reference.data(), h.reference_width,
                                            h.reference_height).clone();
        }

        if (h.has_region) s.region = Region{h.region_x, h.region_y, h.region_w, h.region_h};

        device::CommandSpec cs;
        if (!device::parseCommandType(h.command_type, cs.type)) {
            return Error("template '" + h.id + "': unknown command type '" + h.command_type + "'",
                         ErrorKind::TemplateLoadError);
        }
        cs.keys = h.keys;
        cs.text = h.text;
        auto timeout = h.timeout_ms > 0 ? std::chrono::milliseconds(h.timeout_ms) : defaults.timeout;
        auto cmd = device::buildCommand(cs, h.ack.empty() ? defaults.ack : h.ack, timeout);
        if (cmd.is_err()) {
            return cmd.error().wrap("template '" + h.id + "'", ErrorKind::TemplateLoadError);
        }
        s.command = std::move(cmd).value();
        specs.push_back(std::move(s));
    }

    auto lib = vision::TemplateLibrary::load(std::move(specs),
                                             vision::Fingerprinter(controllerConfigFrom(config_).fingerprint));
    if (lib.is_err()) return lib.error();

    size_t n = lib.value().size();
    controller_->setLibrary(std::move(lib).value());
    return n;
}

Result<size_t> HostApi::loadManifest(const std::string& path) {
    vision::Fingerprinter fingerprinter(controllerConfigFrom(config_).fingerprint);
    auto lib = vision::loadTemplateLibrary(path, fingerprinter, commandDefaults(config_));
    if (lib.is_err()) return lib.error();

    size_t n = lib.value().size();
    controller_->setLibrary(std::move(lib).value());
    return n;
}

HostOutcome HostApi::processFrame(const HostFrame& frame) {
    HostOutcome out;

    PixelFormat fmt;
    if (!parsePixelFormat(frame.format, fmt)) {
        out.status = frameOutcomeStatusToString(FrameOutcome::Status::Error);
        out.error_kind = errorKindToString(ErrorKind::InvalidFrame);
        out.error = "unknown pixel format '" + frame.format + "'";
        return out;
    }

    // The frame owns a copy; nothing aliases the host buffer after return
    Frame f(frame.pixels, frame.width, frame.height, fmt);
    FrameOutcome r = controller_->tick(f);

    out.tick = r.tick;
    out.status = frameOutcomeStatusToString(r.status);
    out.from_cache = r.from_cache;
    if (r.match) {
        out.matched = r.match->matched;
        out.template_id = r.match->template_id;
        out.confidence = r.match->confidence;
        out.source = vision::matchSourceToString(r.match->source);
        out.fingerprint = r.match->fingerprint.toHex();
        out.x = r.match->x;
        out.y = r.match->y;
    }
    if (r.error) {
        out.error_kind = errorKindToString(r.error->kind);
        out.error = r.error->message;
    }
    return out;
}

HostDispatchStatus HostApi::dispatchStatus() const {
    HostDispatchStatus out;
    device::DeviceSession* session = controller_->session();
    if (!session) {
        out.state = device::sessionStateToString(device::SessionState::Closed);
        return out;
    }

    device::DispatchStatus s = session->status();
    out.state = device::sessionStateToString(s.state);
    out.in_flight = s.in_flight;
    out.last_label = s.last_label;
    out.last_outcome = device::dispatchOutcomeToString(s.last_outcome);
    out.last_attempts = s.last_attempts;
    if (s.last_error) {
        out.last_error_kind = errorKindToString(s.last_error->kind);
        out.last_error = s.last_error->message;
    }
    out.submitted = s.submitted;
    out.succeeded = s.succeeded;
    out.failed = s.failed;
    return out;
}

} // namespace retina
