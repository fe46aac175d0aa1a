#pragma once
// =============================================================================
// Retina Config Loader
// =============================================================================
// Loads settings from config.json with nlohmann/json. Every key is optional;
// a missing file yields defaults with a warning. A present but malformed file,
// or a value of the wrong type, is a ConfigError. Out-of-range policy values
// are rejected by validateConfig(), never clamped.
// =============================================================================

#include <string>

#include <nlohmann/json.hpp>

#include "result.hpp"

namespace retina {
namespace config {

struct MatchConfig {
    float threshold = 0.90f;
    int cache_capacity = 256;
    int fingerprint_grid = 16;
    int quant_bits = 4;
    int compare_size = 32;
};

struct DeviceConfig {
    std::string port = "/dev/ttyACM0";
    int baud = 115200;
    int max_retries = 2;
    int timeout_ms = 250;
    std::string ack = "OK";
    bool simulate = false;
};

struct CaptureConfig {
    int tick_ms = 100;
    std::string frames_dir = "frames";
    bool retain_frames = false;
};

struct TemplatesConfig {
    std::string manifest = "templates/manifest.json";
};

struct LogConfig {
    std::string level = "info";
    std::string path = "retina.log";  // empty = stderr only
};

struct AppConfig {
    MatchConfig match;
    DeviceConfig device;
    CaptureConfig capture;
    TemplatesConfig templates;
    LogConfig log;
};

// Typed accessor with section/key and default value.
// ConfigError when the key exists with an incompatible type.
template<typename T>
Result<T> jsonGet(const nlohmann::json& j, const std::string& section,
                  const std::string& key, const T& def) {
    if (!j.contains(section)) return def;
    const auto& sec = j[section];
    if (!sec.is_object()) {
        return Error("config section '" + section + "' must be an object", ErrorKind::ConfigError);
    }
    if (!sec.contains(key) || sec[key].is_null()) return def;
    try {
        return sec[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        return Error("config " + section + "." + key + ": " + e.what(), ErrorKind::ConfigError);
    }
}

// Parse an already decoded document (defaults for absent keys)
Result<AppConfig> parseConfig(const nlohmann::json& j);

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
Result<AppConfig> loadConfig(const std::string& configPath = "config.json", bool strict = false);

// ConfigError for out-of-range policy values
Result<void> validateConfig(const AppConfig& config);

} // namespace config
} // namespace retina
