#pragma once
// =============================================================================
// MatchCache — bounded LRU memo of fingerprint -> MatchResult
// =============================================================================
// get() and put() both refresh recency. Inserting a new key at capacity evicts
// the least recently accessed entry. One mutex guards list + index, so capture
// and control threads may call concurrently.
// =============================================================================
#include "vision/match_result.hpp"

#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace retina::vision {

struct MatchCacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t insertions = 0;
    uint64_t evictions = 0;
    size_t size = 0;
    size_t capacity = 0;

    double hitRate() const {
        auto total = hits + misses;
        return total > 0 ? (double)hits / total : 0.0;
    }
};

class MatchCache {
public:
    // capacity must be >= 1 (std::invalid_argument otherwise; validate config first)
    explicit MatchCache(size_t capacity);

    MatchCache(const MatchCache&) = delete;
    MatchCache& operator=(const MatchCache&) = delete;

    std::optional<MatchResult> get(const Fingerprint& fp);
    void put(const Fingerprint& fp, const MatchResult& result);

    // Lookup without touching recency or stats
    bool contains(const Fingerprint& fp) const;

    void clear();
    size_t size() const;
    size_t capacity() const { return capacity_; }
    MatchCacheStats stats() const;

private:
    using Entry = std::pair<Fingerprint, MatchResult>;

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::list<Entry> lru_;  // front = most recent
    std::unordered_map<Fingerprint, std::list<Entry>::iterator> index_;
    MatchCacheStats stats_;
};

} // namespace retina::vision
