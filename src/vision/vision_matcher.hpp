// =============================================================================
// VisionMatcher — exact fingerprint lookup, then structural comparison
// =============================================================================
// match():
//   1. fingerprint frame/region
//   2. MatchCache hit -> return cached outcome
//   3. TemplateLibrary exact hit -> confidence 1.0
//   4. NCC against every template with a reference image; best score wins,
//      exact ties go to the earliest registered template
//   5. accept only if score >= threshold, else no match
//   6. store the outcome (match or no match) in the cache
// No match is a normal result, never an error.
// =============================================================================

#pragma once

#include "vision/fingerprint.hpp"
#include "vision/match_cache.hpp"
#include "vision/match_result.hpp"
#include "vision/template_library.hpp"
#include "frame.hpp"
#include "result.hpp"

#include <atomic>
#include <cstdint>

namespace retina::vision {

struct MatcherConfig {
    float threshold = 0.90f;  // acceptance threshold, (0, 1]
    int compare_size = 32;    // side length for same-size structural comparison
};

Result<void> validateMatcherConfig(const MatcherConfig& cfg);

class VisionMatcher {
public:
    // All collaborators are owned by the caller and must outlive the matcher.
    // cache may be nullptr (no memoization).
    VisionMatcher(const TemplateLibrary& library, const Fingerprinter& fingerprinter,
                  MatchCache* cache, const MatcherConfig& config);

    // Full pipeline (steps 1-6)
    Result<MatchResult> match(const Frame& frame, const Region* region = nullptr);

    // Steps 3-5 for an already fingerprinted frame; no cache access
    Result<MatchResult> evaluate(const Frame& frame, const Fingerprint& fp,
                                 const Region* region = nullptr) const;

    const MatcherConfig& config() const { return config_; }

    // Number of structural passes performed (cache effectiveness)
    uint64_t structuralPasses() const { return structural_passes_.load(); }

private:
    const TemplateLibrary& library_;
    const Fingerprinter& fingerprinter_;
    MatchCache* cache_;
    MatcherConfig config_;
    mutable std::atomic<uint64_t> structural_passes_{0};
};

} // namespace retina::vision
