// retina_cli: replay captured frames through the matcher and drive the device
//   retina_cli --config <file> [--frames <dir>] [--simulate] [--once] [--loop]

#include "config_loader.hpp"
#include "controller.hpp"
#include "frame_source.hpp"
#include "vision/template_manifest.hpp"
#include "retina_log.hpp"

#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>

static constexpr const char* TAG = "cli";

static volatile std::sig_atomic_t g_interrupted = 0;

static void onSignal(int) { g_interrupted = 1; }

static void usage(const char* argv0) {
    fprintf(stderr,
            "usage: %s --config <file> [--frames <dir>] [--simulate] [--once] [--loop]\n"
            "  --config <file>  JSON configuration (default: config.json)\n"
            "  --frames <dir>   replay image files from <dir> (overrides capture.frames_dir)\n"
            "  --simulate       use the in-process device simulator\n"
            "  --once           process a single frame and wait for its dispatch\n"
            "  --loop           restart the replay when the directory is exhausted\n",
            argv0);
}

int main(int argc, char** argv) {
    std::string config_path = "config.json";
    std::string frames_dir;
    bool simulate = false;
    bool once = false;
    bool loop = false;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--frames") == 0 && i + 1 < argc) {
            frames_dir = argv[++i];
        } else if (strcmp(argv[i], "--simulate") == 0) {
            simulate = true;
        } else if (strcmp(argv[i], "--once") == 0) {
            once = true;
        } else if (strcmp(argv[i], "--loop") == 0) {
            loop = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else {
            fprintf(stderr, "unknown argument: %s\n", argv[i]);
            usage(argv[0]);
            return 2;
        }
    }

    auto loaded = retina::config::loadConfig(config_path, true);
    if (loaded.is_err()) {
        fprintf(stderr, "config: %s\n", loaded.error().message.c_str());
        return 1;
    }
    retina::config::AppConfig cfg = loaded.value();
    if (simulate) cfg.device.simulate = true;
    if (!frames_dir.empty()) cfg.capture.frames_dir = frames_dir;

    auto valid = retina::config::validateConfig(cfg);
    if (valid.is_err()) {
        fprintf(stderr, "config: %s\n", valid.error().message.c_str());
        return 1;
    }

    retina::log::Level level = retina::log::Level::Info;
    retina::log::parseLevel(cfg.log.level, level);
    retina::log::setLogLevel(level);
    retina::log::ScopedLogFile log_file(cfg.log.path);
    if (!cfg.log.path.empty() && !log_file.isOpen()) {
        RLOG_WARN(TAG, "cannot open log file %s", cfg.log.path.c_str());
    }

    // Templates
    retina::ControllerConfig ccfg = retina::controllerConfigFrom(cfg);
    ccfg.wait_for_dispatch = once;
    retina::vision::Fingerprinter fingerprinter(ccfg.fingerprint);
    retina::vision::CommandDefaults defaults;
    defaults.ack = cfg.device.ack;
    defaults.timeout = ccfg.dispatch_timeout;
    auto library = retina::vision::loadTemplateLibrary(cfg.templates.manifest, fingerprinter, defaults);
    if (library.is_err()) {
        RLOG_FATAL(TAG, "%s", library.error().message.c_str());
        return 1;
    }

    // Device
    auto link = retina::openDeviceLink(cfg.device);
    if (link.is_err()) {
        RLOG_FATAL(TAG, "device: %s (%s)", link.error().message.c_str(),
                   retina::errorKindToString(link.error().kind));
        return 1;
    }

    auto created = retina::Controller::create(ccfg, std::move(library).value(),
                                              std::move(link).value());
    if (created.is_err()) {
        RLOG_FATAL(TAG, "%s", created.error().message.c_str());
        return 1;
    }
    auto controller = std::move(created).value();

    auto match_sub = controller->bus().subscribe<retina::MatchEvent>(
        [](const retina::MatchEvent& e) {
            if (e.matched) {
                RLOG_INFO(TAG, "tick %llu: %s (%s, %.3f%s) %.2f ms",
                          (unsigned long long)e.tick, e.template_id.c_str(), e.source.c_str(),
                          e.confidence, e.from_cache ? ", cached" : "", e.process_time_ms);
            } else {
                RLOG_DEBUG(TAG, "tick %llu: no match %s", (unsigned long long)e.tick,
                           e.fingerprint.c_str());
            }
        });
    auto dispatch_sub = controller->bus().subscribe<retina::DispatchEvent>(
        [](const retina::DispatchEvent& e) {
            if (e.success) {
                RLOG_INFO(TAG, "sent '%s' (%d attempt(s))", e.label.c_str(), e.attempts);
            } else {
                RLOG_ERROR(TAG, "'%s' failed: %s", e.label.c_str(), e.error.c_str());
            }
        });

    // Frames
    auto source = retina::ImageFileFrameSource::open(cfg.capture.frames_dir, loop && !once);
    if (source.is_err()) {
        RLOG_FATAL(TAG, "%s", source.error().message.c_str());
        return 1;
    }
    retina::ImageFileFrameSource frames = std::move(source).value();

    int rc = 0;
    if (once) {
        retina::FrameOutcome out = controller->tick(frames);
        printf("%s", retina::frameOutcomeStatusToString(out.status));
        if (out.match && out.match->matched) printf(" %s", out.match->template_id.c_str());
        if (out.error) {
            printf(" %s: %s", retina::errorKindToString(out.error->kind), out.error->message.c_str());
            rc = 1;
        }
        printf("\n");
    } else {
        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
        auto started = controller->start(frames);
        if (started.is_err()) {
            RLOG_FATAL(TAG, "%s", started.error().message.c_str());
            rc = 1;
        } else {
            while (controller->running() && !g_interrupted) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            controller->stop();
        }

        if (auto* session = controller->session()) {
            // Let an in-flight command finish before the link closes
            auto last = session->waitForCompletion(ccfg.dispatch_timeout * (ccfg.session.max_retries + 1));
            if (last.is_err()) RLOG_WARN(TAG, "last command: %s", last.error().message.c_str());
            auto st = session->status();
            RLOG_INFO(TAG, "dispatch: %llu submitted, %llu ok, %llu failed, state %s",
                      (unsigned long long)st.submitted, (unsigned long long)st.succeeded,
                      (unsigned long long)st.failed, retina::device::sessionStateToString(st.state));
            if (st.state == retina::device::SessionState::Broken) rc = 1;
        }
        auto cs = controller->cache().stats();
        RLOG_INFO(TAG, "cache: %zu/%zu entries, hit rate %.1f%%, %llu eviction(s)",
                  cs.size, cs.capacity, cs.hitRate() * 100.0, (unsigned long long)cs.evictions);
    }

    match_sub = retina::SubscriptionHandle();
    dispatch_sub = retina::SubscriptionHandle();
    controller.reset();
    return rc;
}
