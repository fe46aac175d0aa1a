// =============================================================================
// Retina - Controller implementation
// =============================================================================
#include "controller.hpp"
#include "device/fake_link.hpp"
#include "device/posix_serial_link.hpp"
#include "vision/match_cache.hpp"
#include "retina_log.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

static constexpr const char* TAG = "controller";

namespace retina {

// =============================================================================
// Configuration helpers
// =============================================================================

ControllerConfig controllerConfigFrom(const config::AppConfig& app) {
    ControllerConfig c;
    c.fingerprint.grid = app.match.fingerprint_grid;
    c.fingerprint.quant_bits = app.match.quant_bits;
    c.matcher.threshold = app.match.threshold;
    c.matcher.compare_size = app.match.compare_size;
    c.cache_capacity = app.match.cache_capacity > 0 ? (size_t)app.match.cache_capacity : 0;
    c.session.max_retries = app.device.max_retries;
    c.tick = std::chrono::milliseconds(app.capture.tick_ms);
    c.retain_frames = app.capture.retain_frames;
    c.dispatch_timeout = std::chrono::milliseconds(app.device.timeout_ms);
    return c;
}

Result<void> validateControllerConfig(const ControllerConfig& cfg) {
    auto f = vision::validateFingerprintConfig(cfg.fingerprint);
    if (f.is_err()) return f;
    auto m = vision::validateMatcherConfig(cfg.matcher);
    if (m.is_err()) return m;
    if (cfg.cache_capacity < 1) {
        return Error("cache capacity must be >= 1", ErrorKind::ConfigError);
    }
    auto s = device::validateSessionConfig(cfg.session);
    if (s.is_err()) return s;
    if (cfg.tick.count() <= 0) {
        return Error("tick interval must be > 0", ErrorKind::ConfigError);
    }
    if (cfg.dispatch_timeout.count() <= 0) {
        return Error("dispatch timeout must be > 0", ErrorKind::ConfigError);
    }
    return Ok();
}

Result<std::unique_ptr<device::SerialLink>> openDeviceLink(const config::DeviceConfig& cfg) {
    if (cfg.simulate) {
        device::FakeLink::Behavior b;
        b.ack = cfg.ack;
        RLOG_INFO(TAG, "device simulated (ack '%s')", cfg.ack.c_str());
        return std::unique_ptr<device::SerialLink>(std::make_unique<device::FakeLink>(b));
    }
    auto link = device::PosixSerialLink::open(cfg.port, cfg.baud);
    if (link.is_err()) return link.error();
    return std::unique_ptr<device::SerialLink>(std::move(link).value());
}

const char* frameOutcomeStatusToString(FrameOutcome::Status s) {
    switch (s) {
        case FrameOutcome::Status::NoMatch:    return "no_match";
        case FrameOutcome::Status::Dispatched: return "dispatched";
        case FrameOutcome::Status::Busy:       return "busy";
        case FrameOutcome::Status::Error:      return "error";
    }
    return "?";
}

// =============================================================================
// Impl
// =============================================================================

struct Controller::Impl {
    ControllerConfig config;
    EventBus bus;
    std::unique_ptr<vision::Fingerprinter> fingerprinter;
    std::unique_ptr<vision::TemplateLibrary> library;
    std::unique_ptr<vision::MatchCache> cache;
    std::unique_ptr<vision::VisionMatcher> matcher;
    std::unique_ptr<device::DeviceSession> session;

    // Serializes ticks (run thread vs. direct callers) and library swaps
    std::mutex tick_mutex;
    uint64_t tick_count = 0;

    mutable std::mutex outcome_mutex;
    std::optional<FrameOutcome> last_outcome;

    std::thread run_thread;
    std::atomic<bool> running{false};
    std::mutex run_mutex;
    std::condition_variable run_cv;
    bool stop_requested = false;

    FrameOutcome process(const Frame& frame, const Region* region);
    void dispatch(const vision::MatchResult& match, FrameOutcome& out);
    void runLoop(FrameSource* source);
};

void Controller::Impl::dispatch(const vision::MatchResult& match, FrameOutcome& out) {
    if (!session) {
        out.status = FrameOutcome::Status::Error;
        out.error = Error("no device session", ErrorKind::SessionClosed);
        return;
    }
    if (match.template_index >= library->size()) {
        out.status = FrameOutcome::Status::Error;
        out.error = Error("stale match for '" + match.template_id + "'", ErrorKind::Generic);
        return;
    }

    const vision::Template& t = library->all()[match.template_index];
    auto submitted = session->submit(t.command);
    if (submitted.is_err()) {
        const Error& e = submitted.error();
        if (e.kind == ErrorKind::DeviceBusy) {
            RLOG_DEBUG(TAG, "tick %llu: '%s' skipped, %s", (unsigned long long)out.tick,
                       t.id.c_str(), e.message.c_str());
            out.status = FrameOutcome::Status::Busy;
        } else {
            RLOG_WARN(TAG, "tick %llu: dispatch of '%s' refused: %s",
                      (unsigned long long)out.tick, t.id.c_str(), e.message.c_str());
            out.status = FrameOutcome::Status::Error;
        }
        out.error = e;
        return;
    }
    out.status = FrameOutcome::Status::Dispatched;

    if (config.wait_for_dispatch) {
        auto bound = t.command.timeout * (config.session.max_retries + 1) +
                     std::chrono::milliseconds(500);
        auto done = session->waitForCompletion(
            std::chrono::duration_cast<std::chrono::milliseconds>(bound));
        if (done.is_err()) {
            out.status = FrameOutcome::Status::Error;
            out.error = done.error();
        }
    }
}

FrameOutcome Controller::Impl::process(const Frame& frame, const Region* region) {
    std::lock_guard<std::mutex> lock(tick_mutex);
    auto t0 = std::chrono::steady_clock::now();

    FrameOutcome out;
    out.tick = ++tick_count;

    auto fp = fingerprinter->fingerprint(frame, region);
    if (fp.is_err()) {
        RLOG_WARN(TAG, "tick %llu: %s", (unsigned long long)out.tick, fp.error().message.c_str());
        out.status = FrameOutcome::Status::Error;
        out.error = fp.error();
    } else {
        std::optional<vision::MatchResult> cached = cache->get(fp.value());
        if (cached) {
            out.match = *cached;
            out.from_cache = true;
        } else {
            auto r = matcher->evaluate(frame, fp.value(), region);
            if (r.is_err()) {
                out.status = FrameOutcome::Status::Error;
                out.error = r.error();
            } else {
                cache->put(fp.value(), r.value());
                out.match = r.value();
            }
        }
    }

    if (out.match) {
        MatchEvent ev;
        ev.tick = out.tick;
        ev.matched = out.match->matched;
        ev.from_cache = out.from_cache;
        ev.template_id = out.match->template_id;
        ev.confidence = out.match->confidence;
        ev.source = vision::matchSourceToString(out.match->source);
        ev.fingerprint = out.match->fingerprint.toHex();
        ev.process_time_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - t0).count();
        bus.publish(ev);

        if (out.match->matched) dispatch(*out.match, out);
    }

    // The worker may have lost the link after an earlier submit returned
    if (!out.error && session) {
        if (auto failure = session->linkFailure()) {
            out.status = FrameOutcome::Status::Error;
            out.error = *failure;
        }
    }
    if (config.retain_frames) out.frame = frame;

    out.process_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    {
        std::lock_guard<std::mutex> ol(outcome_mutex);
        last_outcome = out;
    }
    return out;
}

void Controller::Impl::runLoop(FrameSource* source) {
    RLOG_INFO(TAG, "run loop started (tick %lld ms)", (long long)config.tick.count());
    auto next = std::chrono::steady_clock::now();
    while (true) {
        {
            std::unique_lock<std::mutex> lock(run_mutex);
            if (run_cv.wait_until(lock, next, [this] { return stop_requested; })) break;
        }
        next += config.tick;

        if (source->exhausted()) {
            RLOG_INFO(TAG, "frame source exhausted");
            break;
        }
        auto frame = source->grab();
        if (frame.is_err()) {
            RLOG_WARN(TAG, "capture: %s", frame.error().message.c_str());
            continue;
        }
        auto out = process(frame.value(), nullptr);
        if (out.error && out.error->kind == ErrorKind::LinkIoError) {
            RLOG_ERROR(TAG, "device link lost, stopping run loop");
            break;
        }

        // Do not try to catch up after a slow tick
        auto now = std::chrono::steady_clock::now();
        if (next < now) next = now;
    }
    running = false;
    RLOG_INFO(TAG, "run loop stopped after %llu tick(s)", (unsigned long long)tick_count);
}

// =============================================================================
// Controller
// =============================================================================

Controller::Controller() : impl_(std::make_unique<Impl>()) {}

Controller::~Controller() {
    stop();
    if (impl_->session) impl_->session->close();
}

Result<std::unique_ptr<Controller>> Controller::create(const ControllerConfig& config,
                                                       vision::TemplateLibrary library,
                                                       std::unique_ptr<device::SerialLink> link) {
    auto valid = validateControllerConfig(config);
    if (valid.is_err()) return valid.error();

    std::unique_ptr<Controller> c(new Controller());
    Impl& d = *c->impl_;
    d.config = config;
    d.fingerprinter = std::make_unique<vision::Fingerprinter>(config.fingerprint);
    d.library = std::make_unique<vision::TemplateLibrary>(std::move(library));
    d.cache = std::make_unique<vision::MatchCache>(config.cache_capacity);
    d.matcher = std::make_unique<vision::VisionMatcher>(*d.library, *d.fingerprinter,
                                                        d.cache.get(), config.matcher);
    if (link) {
        d.session = std::make_unique<device::DeviceSession>(std::move(link), config.session, &d.bus);
    }

    RLOG_INFO(TAG, "controller ready: %zu template(s), cache %zu, threshold %.2f%s",
              d.library->size(), config.cache_capacity, config.matcher.threshold,
              d.session ? "" : ", no device");
    return std::move(c);
}

FrameOutcome Controller::tick(const Frame& frame, const Region* region) {
    return impl_->process(frame, region);
}

FrameOutcome Controller::tick(FrameSource& source) {
    auto frame = source.grab();
    if (frame.is_err()) {
        FrameOutcome out;
        out.status = FrameOutcome::Status::Error;
        out.error = frame.error();
        return out;
    }
    return impl_->process(frame.value(), nullptr);
}

Result<void> Controller::start(FrameSource& source) {
    if (impl_->running.exchange(true)) {
        return Error("run loop already started", ErrorKind::Generic);
    }
    if (impl_->run_thread.joinable()) impl_->run_thread.join();
    {
        std::lock_guard<std::mutex> lock(impl_->run_mutex);
        impl_->stop_requested = false;
    }
    impl_->run_thread = std::thread(&Impl::runLoop, impl_.get(), &source);
    return Ok();
}

void Controller::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->run_mutex);
        impl_->stop_requested = true;
    }
    impl_->run_cv.notify_all();
    if (impl_->run_thread.joinable()) impl_->run_thread.join();
}

bool Controller::running() const {
    return impl_->running.load();
}

void Controller::setLibrary(vision::TemplateLibrary library) {
    std::lock_guard<std::mutex> lock(impl_->tick_mutex);
    Impl& d = *impl_;
    d.matcher.reset();
    d.library = std::make_unique<vision::TemplateLibrary>(std::move(library));
    d.matcher = std::make_unique<vision::VisionMatcher>(*d.library, *d.fingerprinter,
                                                        d.cache.get(), d.config.matcher);
    d.cache->clear();
    RLOG_INFO(TAG, "template library replaced: %zu template(s)", d.library->size());
}

EventBus& Controller::bus() { return impl_->bus; }
const vision::TemplateLibrary& Controller::library() const { return *impl_->library; }
const vision::MatchCache& Controller::cache() const { return *impl_->cache; }
const vision::VisionMatcher& Controller::matcher() const { return *impl_->matcher; }
device::DeviceSession* Controller::session() { return impl_->session.get(); }
const ControllerConfig& Controller::config() const { return impl_->config; }

std::optional<FrameOutcome> Controller::lastOutcome() const {
    std::lock_guard<std::mutex> lock(impl_->outcome_mutex);
    return impl_->last_outcome;
}

} // namespace retina
