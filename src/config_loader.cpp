// =============================================================================
// Retina Config Loader — implementation
// =============================================================================
#include "config_loader.hpp"
#include "device/device_session.hpp"
#include "device/posix_serial_link.hpp"
#include "vision/fingerprint.hpp"
#include "vision/vision_matcher.hpp"
#include "retina_log.hpp"

#include <fstream>

namespace retina {
namespace config {

Result<AppConfig> parseConfig(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error("config root must be a JSON object", ErrorKind::ConfigError);
    }

    AppConfig config;
    const AppConfig def;

    config.match.threshold        = RETINA_TRY(jsonGet<float>(j, "match", "threshold", def.match.threshold));
    config.match.cache_capacity   = RETINA_TRY(jsonGet<int>(j, "match", "cache_capacity", def.match.cache_capacity));
    config.match.fingerprint_grid = RETINA_TRY(jsonGet<int>(j, "match", "fingerprint_grid", def.match.fingerprint_grid));
    config.match.quant_bits       = RETINA_TRY(jsonGet<int>(j, "match", "quant_bits", def.match.quant_bits));
    config.match.compare_size     = RETINA_TRY(jsonGet<int>(j, "match", "compare_size", def.match.compare_size));

    config.device.port        = RETINA_TRY(jsonGet<std::string>(j, "device", "port", def.device.port));
    config.device.baud        = RETINA_TRY(jsonGet<int>(j, "device", "baud", def.device.baud));
    config.device.max_retries = RETINA_TRY(jsonGet<int>(j, "device", "max_retries", def.device.max_retries));
    config.device.timeout_ms  = RETINA_TRY(jsonGet<int>(j, "device", "timeout_ms", def.device.timeout_ms));
    config.device.ack         = RETINA_TRY(jsonGet<std::string>(j, "device", "ack", def.device.ack));
    config.device.simulate    = RETINA_TRY(jsonGet<bool>(j, "device", "simulate", def.device.simulate));

    config.capture.tick_ms    = RETINA_TRY(jsonGet<int>(j, "capture", "tick_ms", def.capture.tick_ms));
    config.capture.frames_dir = RETINA_TRY(jsonGet<std::string>(j, "capture", "frames_dir", def.capture.frames_dir));
    config.capture.retain_frames = RETINA_TRY(jsonGet<bool>(j, "capture", "retain_frames", def.capture.retain_frames));

    config.templates.manifest = RETINA_TRY(jsonGet<std::string>(j, "templates", "manifest", def.templates.manifest));

    config.log.level = RETINA_TRY(jsonGet<std::string>(j, "log", "level", def.log.level));
    config.log.path  = RETINA_TRY(jsonGet<std::string>(j, "log", "path", def.log.path));

    return config;
}

Result<AppConfig> loadConfig(const std::string& configPath, bool strict) {
    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("config.json");
        if (!file.is_open()) {
            file.open("../config.json");
        }
    }
    if (!file.is_open()) {
        RLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return AppConfig{};
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        RLOG_ERROR("config", "JSON parse error: %s", e.what());
        return Error(std::string("config parse error: ") + e.what(), ErrorKind::ConfigError);
    }

    auto config = parseConfig(j);
    if (config.is_err()) return config;

    RLOG_INFO("config", "Loaded: threshold=%.2f, cache=%d, port=%s%s, retries=%d, timeout=%dms",
              config.value().match.threshold, config.value().match.cache_capacity,
              config.value().device.port.c_str(),
              config.value().device.simulate ? " (simulated)" : "",
              config.value().device.max_retries, config.value().device.timeout_ms);
    return config;
}

Result<void> validateConfig(const AppConfig& c) {
    auto bad = [](const std::string& msg) {
        return Result<void>(Error(msg, ErrorKind::ConfigError));
    };

    vision::MatcherConfig mc;
    mc.threshold = c.match.threshold;
    mc.compare_size = c.match.compare_size;
    auto m = vision::validateMatcherConfig(mc);
    if (m.is_err()) return m;

    if (c.match.cache_capacity < 1) {
        return bad("match.cache_capacity must be >= 1, got " + std::to_string(c.match.cache_capacity));
    }

    vision::FingerprintConfig fc;
    fc.grid = c.match.fingerprint_grid;
    fc.quant_bits = c.match.quant_bits;
    auto f = vision::validateFingerprintConfig(fc);
    if (f.is_err()) return f;

    device::SessionConfig sc;
    sc.max_retries = c.device.max_retries;
    auto s = device::validateSessionConfig(sc);
    if (s.is_err()) return s;

    if (c.device.timeout_ms <= 0) {
        return bad("device.timeout_ms must be > 0, got " + std::to_string(c.device.timeout_ms));
    }
    if (c.device.ack.empty()) {
        return bad("device.ack must not be empty");
    }
    if (!c.device.simulate) {
        if (c.device.port.empty()) return bad("device.port must be set unless device.simulate");
        if (!device::isSupportedBaud(c.device.baud)) {
            return bad("device.baud " + std::to_string(c.device.baud) + " is not supported");
        }
    }

    if (c.capture.tick_ms <= 0) {
        return bad("capture.tick_ms must be > 0, got " + std::to_string(c.capture.tick_ms));
    }

    log::Level lvl;
    if (!log::parseLevel(c.log.level, lvl)) {
        return bad("log.level '" + c.log.level + "' is not a known level");
    }
    return Ok();
}

} // namespace config
} // namespace retina
