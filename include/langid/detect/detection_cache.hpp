#pragma once

#include <langid/types.hpp>

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace langid {

struct CacheStats {
    size_t size = 0;
    size_t capacity = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
};

/**
 * DetectionCache - Bounded LRU map from normalized text to results.
 *
 * get() refreshes recency; put() of a new key at capacity evicts the least
 * recently used entry first. The cache does not interpret keys; callers
 * normalize them.
 *
 * Every operation runs under one mutex, so eviction never races a lookup.
 */
class DetectionCache {
public:
    /**
     * Create a cache holding at most capacity entries.
     *
     * @param capacity Maximum entry count (values below 1 are raised to 1)
     */
    explicit DetectionCache(size_t capacity);

    /**
     * Look up a result and mark it most recently used.
     *
     * @return A copy of the cached result, or std::nullopt on a miss
     */
    std::optional<DetectionResult> get(const std::string& key);

    /**
     * Insert or replace a result and mark it most recently used.
     */
    void put(const std::string& key, DetectionResult result);

    /**
     * Check presence without touching recency or hit counters.
     */
    bool contains(const std::string& key) const;

    // Drop every entry; counters are kept
    void clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    bool empty() const { return size() == 0; }

    CacheStats stats() const;

private:
    struct Entry {
        DetectionResult result;
        std::list<std::string>::iterator position;
    };

    const size_t capacity_;

    // Doubly-linked list: front = MRU, back = LRU
    std::list<std::string> lru_list_;

    // Map from key to result and its position in lru_list_
    std::unordered_map<std::string, Entry> entries_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;

    mutable std::mutex mutex_;
};

}  // namespace langid
