#pragma once
// =============================================================================
// Template manifest - JSON list of templates in registration order
// =============================================================================
// {
//   "version": 1,
//   "templates": [
//     { "id": "open_door", "image": "open_door.png",
//       "fingerprint": "0x00ff...",            (optional if image given)
//       "region": {"x":0,"y":0,"w":64,"h":32}, (optional)
//       "command": {"type":"press","key":"f1"},
//       "ack": "OK", "timeout_ms": 300 }       (optional, session defaults)
//   ]
// }
// Image paths are relative to the manifest's directory.
// =============================================================================
#include "device/keyboard_protocol.hpp"
#include "vision/fingerprint.hpp"
#include "vision/template_library.hpp"
#include "frame.hpp"
#include "result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace retina::vision {

struct ManifestEntry {
    std::string id;
    std::string image;                     // relative path, may be empty
    std::optional<Fingerprint> fingerprint;
    std::optional<Region> region;
    device::CommandSpec command;
    std::string ack;                       // empty = default
    int timeout_ms = 0;                    // 0 = default
};

struct TemplateManifest {
    int version = 1;
    std::string root_dir;
    std::vector<ManifestEntry> entries;
};

// Ack token and timeout applied to entries that do not set their own
struct CommandDefaults {
    std::string ack = "OK";
    std::chrono::milliseconds timeout{250};
};

// TemplateLoadError on structural problems (missing id, bad fingerprint
// text, unknown command type, wrong value types)
Result<TemplateManifest> parseManifest(const nlohmann::json& j, const std::string& root_dir);
Result<TemplateManifest> loadManifestJson(const std::string& path);

// Decodes reference images and encodes commands
Result<std::vector<TemplateSpec>> buildTemplateSpecs(const TemplateManifest& manifest,
                                                     const CommandDefaults& defaults);

// loadManifestJson + buildTemplateSpecs + TemplateLibrary::load
Result<TemplateLibrary> loadTemplateLibrary(const std::string& manifest_path,
                                            const Fingerprinter& fingerprinter,
                                            const CommandDefaults& defaults);

} // namespace retina::vision
