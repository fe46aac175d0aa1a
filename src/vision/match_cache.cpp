// =============================================================================
// MatchCache — LRU implementation (list + hash index under one mutex)
// =============================================================================
#include "vision/match_cache.hpp"
#include "retina_log.hpp"

#include <optional>
#include <stdexcept>

static constexpr const char* TAG = "MatchCache";

namespace retina::vision {

MatchCache::MatchCache(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) throw std::invalid_argument("MatchCache capacity must be >= 1");
    stats_.capacity = capacity_;
    index_.reserve(capacity_);
}

std::optional<MatchResult> MatchCache::get(const Fingerprint& fp) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(fp);
    if (it == index_.end()) {
        stats_.misses++;
        return std::nullopt;
    }
    lru_.splice(lru_.begin(), lru_, it->second);
    stats_.hits++;
    return it->second->second;
}

void MatchCache::put(const Fingerprint& fp, const MatchResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(fp);
    if (it != index_.end()) {
        it->second->second = result;
        lru_.splice(lru_.begin(), lru_, it->second);
        return;
    }

    if (lru_.size() >= capacity_) {
        const Entry& victim = lru_.back();
        RLOG_TRACE(TAG, "evict %s", victim.first.toHex().c_str());
        index_.erase(victim.first);
        lru_.pop_back();
        stats_.evictions++;
    }
    lru_.emplace_front(fp, result);
    index_[fp] = lru_.begin();
    stats_.insertions++;
}

bool MatchCache::contains(const Fingerprint& fp) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(fp) > 0;
}

void MatchCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
}

size_t MatchCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

MatchCacheStats MatchCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MatchCacheStats s = stats_;
    s.size = lru_.size();
    return s;
}

} // namespace retina::vision
