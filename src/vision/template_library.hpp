#pragma once

// =============================================================================
// TemplateLibrary - bounded, immutable set of known visual states
// =============================================================================
// Built once from TemplateSpec entries; lookups never mutate. Changing the set
// means building a new library.
// =============================================================================

#include "device/command.hpp"
#include "vision/fingerprint.hpp"
#include "frame.hpp"
#include "result.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace retina::vision {

// Loader input. Either fingerprint or reference (or both) must be present.
struct TemplateSpec {
    std::string id;
    std::optional<Fingerprint> fingerprint;  // explicit digest
    cv::Mat reference;                       // Gray8, optional
    std::optional<Region> region;            // search area within the frame
    device::Command command;
    std::string source_path;                 // diagnostics only
};

struct Template {
    std::string id;
    Fingerprint fingerprint;
    cv::Mat reference;               // empty = exact-only template
    std::optional<Region> region;
    device::Command command;
    size_t index = 0;                // registration order
    std::string source_path;

    bool hasReference() const { return !reference.empty(); }
};

class TemplateLibrary {
public:
    TemplateLibrary() = default;

    // TemplateLoadError: duplicate id, empty id, no fingerprint source,
    // non-Gray8 reference, invalid command, empty region
    static Result<TemplateLibrary> load(std::vector<TemplateSpec> specs,
                                        const Fingerprinter& fingerprinter);

    // Earliest registered template with this fingerprint, nullptr if none
    const Template* lookupExact(const Fingerprint& fp) const;

    const Template* findById(const std::string& id) const;

    const std::vector<Template>& all() const { return templates_; }
    size_t size() const { return templates_.size(); }
    bool empty() const { return templates_.empty(); }

private:
    std::vector<Template> templates_;
    std::unordered_map<Fingerprint, size_t> by_fingerprint_;
    std::unordered_map<std::string, size_t> by_id_;
};

} // namespace retina::vision
