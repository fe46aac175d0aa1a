// =============================================================================
// VisionMatcher — implementation
// =============================================================================
#include "vision/vision_matcher.hpp"
#include "vision/image_ops.hpp"
#include "retina_log.hpp"

#include <algorithm>

static constexpr const char* TAG = "vision";

namespace retina::vision {

Result<void> validateMatcherConfig(const MatcherConfig& cfg) {
    if (!(cfg.threshold > 0.0f && cfg.threshold <= 1.0f)) {
        return Error("match threshold must be in (0, 1], got " + std::to_string(cfg.threshold),
                     ErrorKind::ConfigError);
    }
    if (cfg.compare_size < 4 || cfg.compare_size > 512) {
        return Error("compare_size must be in [4, 512], got " + std::to_string(cfg.compare_size),
                     ErrorKind::ConfigError);
    }
    return Ok();
}

VisionMatcher::VisionMatcher(const TemplateLibrary& library, const Fingerprinter& fingerprinter,
                             MatchCache* cache, const MatcherConfig& config)
    : library_(library), fingerprinter_(fingerprinter), cache_(cache), config_(config) {}

Result<MatchResult> VisionMatcher::match(const Frame& frame, const Region* region) {
    auto fp = fingerprinter_.fingerprint(frame, region);
    if (fp.is_err()) return fp.error();

    if (cache_) {
        if (auto cached = cache_->get(fp.value())) {
            RLOG_TRACE(TAG, "cache hit %s", fp.value().toHex().c_str());
            return *cached;
        }
    }

    auto result = evaluate(frame, fp.value(), region);
    if (result.is_err()) return result.error();

    if (cache_) cache_->put(fp.value(), result.value());
    return result;
}

Result<MatchResult> VisionMatcher::evaluate(const Frame& frame, const Fingerprint& fp,
                                            const Region* region) const {
    // === Exact ===
    if (const Template* t = library_.lookupExact(fp)) {
        MatchResult r;
        r.matched = true;
        r.template_id = t->id;
        r.template_index = t->index;
        r.confidence = 1.0f;
        r.fingerprint = fp;
        r.source = MatchResult::Source::Exact;
        if (t->region) {
            r.x = t->region->x;
            r.y = t->region->y;
        } else if (region) {
            r.x = region->x;
            r.y = region->y;
        }
        RLOG_DEBUG(TAG, "exact hit %s -> %s", fp.toHex().c_str(), t->id.c_str());
        return r;
    }

    // === Structural ===
    bool any_reference = std::any_of(library_.all().begin(), library_.all().end(),
                                     [](const Template& t) { return t.hasReference(); });
    if (!any_reference) return MatchResult::noMatch(fp);

    auto gray_res = toGray(frame);
    if (gray_res.is_err()) return gray_res.error();
    const cv::Mat& gray = gray_res.value();
    structural_passes_.fetch_add(1);

    const Region default_area = region ? *region : frame.bounds();
    const Template* best = nullptr;
    Correlation best_corr;
    best_corr.score = -1.0f;

    for (const Template& t : library_.all()) {
        if (!t.hasReference()) continue;

        const Region area = t.region ? *t.region : default_area;
        if (!area.within(frame.width(), frame.height())) {
            RLOG_DEBUG(TAG, "template '%s' region outside %dx%d frame, skipped",
                       t.id.c_str(), frame.width(), frame.height());
            continue;
        }
        cv::Mat search = gray(cv::Rect(area.x, area.y, area.w, area.h));

        Correlation c;
        if (t.reference.cols == area.w && t.reference.rows == area.h) {
            int cw = std::min(config_.compare_size, area.w);
            int ch = std::min(config_.compare_size, area.h);
            c.score = correlateSameSize(downscale(search, cw, ch), downscale(t.reference, cw, ch));
        } else if (t.reference.cols <= area.w && t.reference.rows <= area.h) {
            c = locate(search, t.reference);
        } else {
            continue;  // reference larger than the search area
        }
        c.x += area.x;
        c.y += area.y;

        RLOG_TRACE(TAG, "template '%s' score=%.4f at (%d,%d)", t.id.c_str(), c.score, c.x, c.y);

        // Strictly greater: equal scores keep the earlier registration
        if (c.score > best_corr.score) {
            best = &t;
            best_corr = c;
        }
    }

    if (!best || best_corr.score < config_.threshold) {
        float best_score = best ? best_corr.score : 0.0f;
        RLOG_DEBUG(TAG, "no match %s (best=%.3f thr=%.3f)",
                   fp.toHex().c_str(), best_score, config_.threshold);
        return MatchResult::noMatch(fp, best_score);
    }

    MatchResult r;
    r.matched = true;
    r.template_id = best->id;
    r.template_index = best->index;
    r.confidence = best_corr.score;
    r.fingerprint = fp;
    r.source = MatchResult::Source::Structural;
    r.x = best_corr.x;
    r.y = best_corr.y;
    RLOG_DEBUG(TAG, "structural hit %s -> %s score=%.3f",
               fp.toHex().c_str(), best->id.c_str(), best_corr.score);
    return r;
}

} // namespace retina::vision
