// =============================================================================
// Template manifest - JSON parsing and library construction
// =============================================================================
#include "vision/template_manifest.hpp"
#include "image_loader.hpp"
#include "retina_log.hpp"

#include <filesystem>
#include <fstream>

static constexpr const char* TAG = "TplManifest";

namespace fs = std::filesystem;

namespace retina::vision {

namespace {

Error manifestError(const std::string& where, const std::string& msg) {
    return Error("manifest " + where + ": " + msg, ErrorKind::TemplateLoadError);
}

Result<device::CommandSpec> parseCommand(const nlohmann::json& c, const std::string& where) {
    if (!c.is_object()) return manifestError(where, "'command' must be an object");

    device::CommandSpec spec;
    std::string type = c.value("type", std::string("press"));
    if (!device::parseCommandType(type, spec.type)) {
        return manifestError(where, "unknown command type '" + type + "'");
    }

    switch (spec.type) {
        case device::CommandSpec::Type::Press:
        case device::CommandSpec::Type::KeyDown:
        case device::CommandSpec::Type::KeyUp:
            if (!c.contains("key")) return manifestError(where, "command needs 'key'");
            spec.keys.push_back(c.at("key").get<std::string>());
            break;
        case device::CommandSpec::Type::Hotkey:
            if (!c.contains("keys") || !c.at("keys").is_array()) {
                return manifestError(where, "hotkey needs a 'keys' array");
            }
            spec.keys = c.at("keys").get<std::vector<std::string>>();
            break;
        case device::CommandSpec::Type::Write:
            spec.text = c.value("text", std::string());
            break;
        case device::CommandSpec::Type::Raw:
            spec.text = c.value("line", std::string());
            break;
    }
    return spec;
}

Result<ManifestEntry> parseEntry(const nlohmann::json& t, size_t index) {
    std::string where = "templates[" + std::to_string(index) + "]";
    if (!t.is_object()) return manifestError(where, "entry must be an object");

    ManifestEntry e;
    e.id = t.value("id", std::string());
    if (e.id.empty()) return manifestError(where, "missing 'id'");
    where += " '" + e.id + "'";

    e.image = t.value("image", std::string());

    if (t.contains("fingerprint")) {
        Fingerprint fp;
        std::string text = t.at("fingerprint").get<std::string>();
        if (!Fingerprint::parseHex(text, fp)) {
            return manifestError(where, "bad fingerprint '" + text + "'");
        }
        e.fingerprint = fp;
    }

    if (t.contains("region")) {
        const auto& r = t.at("region");
        if (!r.is_object()) return manifestError(where, "'region' must be an object");
        Region reg;
        reg.x = r.value("x", 0);
        reg.y = r.value("y", 0);
        reg.w = r.value("w", 0);
        reg.h = r.value("h", 0);
        e.region = reg;
    }

    if (!t.contains("command")) return manifestError(where, "missing 'command'");
    auto cmd = parseCommand(t.at("command"), where);
    if (cmd.is_err()) return cmd.error();
    e.command = std::move(cmd).value();

    e.ack = t.value("ack", std::string());
    e.timeout_ms = t.value("timeout_ms", 0);
    if (e.timeout_ms < 0) return manifestError(where, "timeout_ms must be >= 0");
    return e;
}

} // namespace

Result<TemplateManifest> parseManifest(const nlohmann::json& j, const std::string& root_dir) {
    if (!j.is_object()) return manifestError("root", "must be a JSON object");

    TemplateManifest m;
    m.root_dir = root_dir;
    try {
        m.version = j.value("version", 1);
        if (m.version != 1) {
            return manifestError("root", "unsupported version " + std::to_string(m.version));
        }
        if (!j.contains("templates") || !j.at("templates").is_array()) {
            return manifestError("root", "'templates' array missing");
        }
        const auto& arr = j.at("templates");
        for (size_t i = 0; i < arr.size(); i++) {
            auto e = parseEntry(arr[i], i);
            if (e.is_err()) return e.error();
            m.entries.push_back(std::move(e).value());
        }
    } catch (const nlohmann::json::exception& e) {
        return manifestError("root", std::string("type error: ") + e.what());
    }
    return m;
}

Result<TemplateManifest> loadManifestJson(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return Error("manifest not found: " + path, ErrorKind::TemplateLoadError);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::exception& e) {
        return Error("manifest " + path + ": " + e.what(), ErrorKind::TemplateLoadError);
    }

    std::string root = fs::path(path).parent_path().string();
    auto m = parseManifest(j, root);
    if (m.is_ok()) {
        RLOG_INFO(TAG, "manifest %s: %zu entries", path.c_str(), m.value().entries.size());
    }
    return m;
}

Result<std::vector<TemplateSpec>> buildTemplateSpecs(const TemplateManifest& manifest,
                                                     const CommandDefaults& defaults) {
    std::vector<TemplateSpec> specs;
    specs.reserve(manifest.entries.size());

    for (const auto& e : manifest.entries) {
        TemplateSpec s;
        s.id = e.id;
        s.fingerprint = e.fingerprint;
        s.region = e.region;

        if (!e.image.empty()) {
            fs::path p = fs::path(manifest.root_dir) / e.image;
            s.source_path = p.string();
            auto img = loadGray8(s.source_path);
            if (img.is_err()) return img.error();
            s.reference = std::move(img).value();
        }

        const std::string& ack = e.ack.empty() ? defaults.ack : e.ack;
        auto timeout = e.timeout_ms > 0 ? std::chrono::milliseconds(e.timeout_ms) : defaults.timeout;
        auto cmd = device::buildCommand(e.command, ack, timeout);
        if (cmd.is_err()) {
            return cmd.error().wrap("template '" + e.id + "'", ErrorKind::TemplateLoadError);
        }
        s.command = std::move(cmd).value();
        specs.push_back(std::move(s));
    }
    return specs;
}

Result<TemplateLibrary> loadTemplateLibrary(const std::string& manifest_path,
                                            const Fingerprinter& fingerprinter,
                                            const CommandDefaults& defaults) {
    auto manifest = loadManifestJson(manifest_path);
    if (manifest.is_err()) return manifest.error();

    auto specs = buildTemplateSpecs(manifest.value(), defaults);
    if (specs.is_err()) return specs.error();

    return TemplateLibrary::load(std::move(specs).value(), fingerprinter);
}

} // namespace retina::vision
