#pragma once
// =============================================================================
// MatchResult — outcome of comparing one fingerprint against the library
// =============================================================================
#include "vision/fingerprint.hpp"

#include <string>

namespace retina::vision {

struct MatchResult {
    enum class Source { None, Exact, Structural };

    bool matched = false;
    std::string template_id;      // empty when !matched
    size_t template_index = 0;    // registration index when matched
    float confidence = 0.0f;      // [0, 1]; best rejected score when !matched
    Fingerprint fingerprint;
    Source source = Source::None;
    int x = 0, y = 0;             // located position (frame coordinates)

    static MatchResult noMatch(const Fingerprint& fp, float best_score = 0.0f) {
        MatchResult r;
        r.fingerprint = fp;
        r.confidence = best_score;
        return r;
    }

    bool operator==(const MatchResult& o) const {
        return matched == o.matched && template_id == o.template_id &&
               template_index == o.template_index && confidence == o.confidence &&
               fingerprint == o.fingerprint && source == o.source &&
               x == o.x && y == o.y;
    }
};

inline const char* matchSourceToString(MatchResult::Source s) {
    switch (s) {
        case MatchResult::Source::None:       return "none";
        case MatchResult::Source::Exact:      return "exact";
        case MatchResult::Source::Structural: return "structural";
    }
    return "?";
}

} // namespace retina::vision
