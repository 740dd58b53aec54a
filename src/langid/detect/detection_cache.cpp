#include <langid/detect/detection_cache.hpp>

#include <algorithm>

namespace langid {

DetectionCache::DetectionCache(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1))
{}

std::optional<DetectionResult> DetectionCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }

    // Move to front (MRU)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.position);
    ++hits_;
    return it->second.result;
}

void DetectionCache::put(const std::string& key, DetectionResult result) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        // Already cached, replace and move to front (MRU)
        it->second.result = std::move(result);
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second.position);
        return;
    }

    if (entries_.size() >= capacity_) {
        // Evict from back (LRU)
        const std::string& victim = lru_list_.back();
        entries_.erase(victim);
        lru_list_.pop_back();
        ++evictions_;
    }

    lru_list_.push_front(key);
    entries_.emplace(key, Entry{std::move(result), lru_list_.begin()});
}

bool DetectionCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(key) != entries_.end();
}

void DetectionCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_list_.clear();
}

size_t DetectionCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

CacheStats DetectionCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s;
    s.size = entries_.size();
    s.capacity = capacity_;
    s.hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    return s;
}

}  // namespace langid
