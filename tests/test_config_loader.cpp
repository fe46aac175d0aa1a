// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, typed accessors, file loading, range validation
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "config_loader.hpp"

using namespace retina;
using namespace retina::config;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

// ---------------------------------------------------------------------------
// C-1: AppConfig defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_FLOAT_EQ(cfg.match.threshold,      0.90f);
    EXPECT_EQ(cfg.match.cache_capacity,       256);
    EXPECT_EQ(cfg.match.fingerprint_grid,     16);
    EXPECT_EQ(cfg.match.quant_bits,           4);
    EXPECT_EQ(cfg.device.port,                "/dev/ttyACM0");
    EXPECT_EQ(cfg.device.baud,                115200);
    EXPECT_EQ(cfg.device.max_retries,         2);
    EXPECT_EQ(cfg.device.timeout_ms,          250);
    EXPECT_EQ(cfg.device.ack,                 "OK");
    EXPECT_FALSE(cfg.device.simulate);
    EXPECT_EQ(cfg.capture.tick_ms,            100);
    EXPECT_FALSE(cfg.capture.retain_frames);
    EXPECT_EQ(cfg.templates.manifest,         "templates/manifest.json");
    EXPECT_EQ(cfg.log.level,                  "info");
    EXPECT_TRUE(validateConfig(cfg).is_ok());
}

// ---------------------------------------------------------------------------
// C-2: parseConfig overrides only present keys
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, ParsePartialDocument) {
    json j = {{"match", {{"threshold", 0.75}, {"cache_capacity", 8}}},
              {"device", {{"simulate", true}, {"ack", "READY"}, {"port", nullptr}}}};
    auto r = parseConfig(j);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    const AppConfig& c = r.value();
    EXPECT_FLOAT_EQ(c.match.threshold, 0.75f);
    EXPECT_EQ(c.match.cache_capacity, 8);
    EXPECT_EQ(c.match.fingerprint_grid, 16);
    EXPECT_TRUE(c.device.simulate);
    EXPECT_EQ(c.device.ack, "READY");
    EXPECT_EQ(c.device.port, "/dev/ttyACM0");  // null keeps the default
}

TEST(ConfigLoaderTest, WrongTypeIsConfigError) {
    auto r = parseConfig(json{{"device", {{"baud", "fast"}}}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::ConfigError);
    EXPECT_NE(r.error().message.find("device.baud"), std::string::npos);
}

TEST(ConfigLoaderTest, NonObjectSectionIsConfigError) {
    auto r = parseConfig(json{{"match", 3}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::ConfigError);
}

TEST(ConfigLoaderTest, NonObjectRootIsConfigError) {
    EXPECT_EQ(parseConfig(json::array()).error().kind, ErrorKind::ConfigError);
}

TEST(ConfigLoaderTest, JsonGetDefaults) {
    json j = {{"s", {{"k", 5}}}};
    EXPECT_EQ(jsonGet<int>(j, "s", "k", 1).value(), 5);
    EXPECT_EQ(jsonGet<int>(j, "s", "missing", 1).value(), 1);
    EXPECT_EQ(jsonGet<int>(j, "absent", "k", 2).value(), 2);
    EXPECT_TRUE(jsonGet<std::string>(j, "s", "k", "x").is_err());
}

// ---------------------------------------------------------------------------
// C-3: file loading
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigMissingFileReturnsDefaults) {
    auto r = loadConfig("__nonexistent_retina_config.json", true);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().device.port, "/dev/ttyACM0");
}

TEST(ConfigLoaderTest, LoadConfigFromFile) {
    const char* path = "__test_retina_config.json";
    writeTmpJson(path, R"({
        "match":   { "threshold": 0.8, "compare_size": 24 },
        "device":  { "max_retries": 4, "timeout_ms": 120, "baud": 9600 },
        "capture": { "tick_ms": 40, "retain_frames": true },
        "log":     { "level": "debug", "path": "" }
    })");
    auto r = loadConfig(path, true);
    std::remove(path);

    ASSERT_TRUE(r.is_ok()) << r.error().message;
    const AppConfig& c = r.value();
    EXPECT_FLOAT_EQ(c.match.threshold, 0.8f);
    EXPECT_EQ(c.match.compare_size, 24);
    EXPECT_EQ(c.device.max_retries, 4);
    EXPECT_EQ(c.device.timeout_ms, 120);
    EXPECT_EQ(c.device.baud, 9600);
    EXPECT_EQ(c.capture.tick_ms, 40);
    EXPECT_TRUE(c.capture.retain_frames);
    EXPECT_EQ(c.log.level, "debug");
    EXPECT_TRUE(c.log.path.empty());
    EXPECT_TRUE(validateConfig(c).is_ok());
}

TEST(ConfigLoaderTest, MalformedFileIsConfigError) {
    const char* path = "__test_retina_bad.json";
    writeTmpJson(path, "{ \"match\": { \"threshold\": ");
    auto r = loadConfig(path, true);
    std::remove(path);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::ConfigError);
}

// ---------------------------------------------------------------------------
// C-4: validation rejects, never clamps
// ---------------------------------------------------------------------------
static ErrorKind kindOf(const AppConfig& c) {
    auto v = validateConfig(c);
    return v.is_err() ? v.error().kind : ErrorKind::Generic;
}

TEST(ConfigLoaderTest, ValidationRanges) {
    AppConfig c;
    c.match.threshold = 0.0f;
    EXPECT_EQ(kindOf(c), ErrorKind::ConfigError);

    c = AppConfig{};
    c.match.threshold = 1.01f;
    EXPECT_EQ(kindOf(c), ErrorKind::ConfigError);

    c = AppConfig{};
    c.match.cache_capacity = 0;
    EXPECT_EQ(kindOf(c), ErrorKind::ConfigError);

    c = AppConfig{};
    c.match.quant_bits = 12;
    EXPECT_EQ(kindOf(c), ErrorKind::ConfigError);

    c = AppConfig{};
    c.device.max_retries = -1;
    EXPECT_EQ(kindOf(c), ErrorKind::ConfigError);

    c = AppConfig{};
    c.device.timeout_ms = 0;
    EXPECT_EQ(kindOf(c), ErrorKind::ConfigError);

    c = AppConfig{};
    c.device.ack.clear();
    EXPECT_EQ(kindOf(c), ErrorKind::ConfigError);

    c = AppConfig{};
    c.capture.tick_ms = 0;
    EXPECT_EQ(kindOf(c), ErrorKind::ConfigError);

    c = AppConfig{};
    c.log.level = "chatty";
    EXPECT_EQ(kindOf(c), ErrorKind::ConfigError);
}

TEST(ConfigLoaderTest, PortAndBaudOnlyCheckedForRealDevice) {
    AppConfig c;
    c.device.port.clear();
    c.device.baud = 12345;
    EXPECT_EQ(kindOf(c), ErrorKind::ConfigError);

    c.device.simulate = true;
    EXPECT_TRUE(validateConfig(c).is_ok());
}
