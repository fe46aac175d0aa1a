// =============================================================================
// TemplateLibrary - load + exact index
// =============================================================================
#include "vision/template_library.hpp"
#include "retina_log.hpp"

static constexpr const char* TAG = "TplLibrary";

namespace retina::vision {

Result<TemplateLibrary> TemplateLibrary::load(std::vector<TemplateSpec> specs,
                                              const Fingerprinter& fingerprinter) {
    TemplateLibrary lib;
    lib.templates_.reserve(specs.size());

    for (auto& spec : specs) {
        if (spec.id.empty()) {
            return Err<TemplateLibrary>("template #" + std::to_string(lib.templates_.size()) +
                                        " has an empty id", ErrorKind::TemplateLoadError);
        }
        if (lib.by_id_.count(spec.id)) {
            return Err<TemplateLibrary>("duplicate template id '" + spec.id + "'",
                                        ErrorKind::TemplateLoadError);
        }
        if (!spec.reference.empty() && spec.reference.type() != CV_8UC1) {
            return Err<TemplateLibrary>("template '" + spec.id + "': reference must be Gray8",
                                        ErrorKind::TemplateLoadError);
        }
        if (!spec.command.valid()) {
            return Err<TemplateLibrary>("template '" + spec.id + "': invalid command",
                                        ErrorKind::TemplateLoadError);
        }
        if (spec.region && spec.region->empty()) {
            return Err<TemplateLibrary>("template '" + spec.id + "': empty region",
                                        ErrorKind::TemplateLoadError);
        }

        Template t;
        t.id = spec.id;
        if (spec.fingerprint) {
            t.fingerprint = *spec.fingerprint;
        } else if (!spec.reference.empty()) {
            auto fp = fingerprinter.fingerprintGray(spec.reference);
            if (fp.is_err()) {
                return fp.error().wrap("template '" + spec.id + "'", ErrorKind::TemplateLoadError);
            }
            t.fingerprint = fp.value();
        } else {
            return Err<TemplateLibrary>("template '" + spec.id +
                                        "' has neither fingerprint nor reference image",
                                        ErrorKind::TemplateLoadError);
        }
        t.reference = spec.reference;
        t.region = spec.region;
        t.command = std::move(spec.command);
        t.source_path = std::move(spec.source_path);
        t.index = lib.templates_.size();

        // First registration keeps the fingerprint slot
        auto ins = lib.by_fingerprint_.emplace(t.fingerprint, t.index);
        if (!ins.second) {
            RLOG_WARN(TAG, "template '%s' shares fingerprint %s with '%s'; exact hits go to the earlier one",
                      t.id.c_str(), t.fingerprint.toHex().c_str(),
                      lib.templates_[ins.first->second].id.c_str());
        }
        lib.by_id_.emplace(t.id, t.index);

        RLOG_DEBUG(TAG, "template #%zu '%s' fp=%s ref=%dx%d cmd=%s",
                   t.index, t.id.c_str(), t.fingerprint.toHex().c_str(),
                   t.reference.cols, t.reference.rows, t.command.label.c_str());
        lib.templates_.push_back(std::move(t));
    }

    RLOG_INFO(TAG, "loaded %zu templates", lib.templates_.size());
    return lib;
}

const Template* TemplateLibrary::lookupExact(const Fingerprint& fp) const {
    auto it = by_fingerprint_.find(fp);
    if (it == by_fingerprint_.end()) return nullptr;
    return &templates_[it->second];
}

const Template* TemplateLibrary::findById(const std::string& id) const {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return nullptr;
    return &templates_[it->second];
}

} // namespace retina::vision
