/**
 * MetadataCache - shared cache of parsed snapshot and segment records
 *
 * Records are immutable once written and their locations are never
 * reused, so an entry never goes stale. Eviction is the only policy a
 * cache needs; the storage core never invalidates.
 */

#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <basalt/metadata.h>

namespace basalt {

/**
 * @brief {Get, Put} capability keyed by storage location
 *
 * Must tolerate concurrent Get/Put from several pruning workers. A hit
 * returns exactly the value stored earlier.
 */
template<typename V>
class MetadataCache {
public:
    virtual ~MetadataCache() = default;

    // Returns nullptr on miss
    virtual std::shared_ptr<const V> Get(const std::string& location) = 0;

    virtual void Put(const std::string& location, std::shared_ptr<const V> value) = 0;
};

/**
 * @brief LRU cache with coarse-grained locking
 */
template<typename V>
class LruMetadataCache : public MetadataCache<V> {
public:
    explicit LruMetadataCache(size_t capacity) : capacity_(capacity) {}

    std::shared_ptr<const V> Get(const std::string& location) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_.find(location);
        if (it == cache_.end()) {
            misses_++;
            return nullptr;
        }

        // Move to front (most recently used)
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_iter);
        hits_++;
        return it->second.value;
    }

    void Put(const std::string& location, std::shared_ptr<const V> value) override {
        if (capacity_ == 0) return;

        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_.find(location);
        if (it != cache_.end()) {
            it->second.value = std::move(value);
            lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_iter);
            return;
        }

        if (cache_.size() >= capacity_) {
            cache_.erase(lru_list_.back());
            lru_list_.pop_back();
        }

        lru_list_.push_front(location);
        cache_[location] = {std::move(value), lru_list_.begin()};
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    size_t Capacity() const { return capacity_; }
    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }

private:
    struct Entry {
        std::shared_ptr<const V> value;
        std::list<std::string>::iterator lru_iter;
    };

    mutable std::mutex mutex_;
    size_t capacity_;
    std::unordered_map<std::string, Entry> cache_;
    std::list<std::string> lru_list_;  // Front = MRU, Back = LRU
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

using SnapshotCache = MetadataCache<TableSnapshot>;
using SegmentCache = MetadataCache<SegmentInfo>;

/**
 * @brief Caches a caller may hand to readers; either may be null
 */
struct MetadataCaches {
    std::shared_ptr<SnapshotCache> snapshots;
    std::shared_ptr<SegmentCache> segments;
};

inline MetadataCaches CreateLruMetadataCaches(size_t snapshot_capacity,
                                              size_t segment_capacity) {
    MetadataCaches caches;
    caches.snapshots = std::make_shared<LruMetadataCache<TableSnapshot>>(snapshot_capacity);
    caches.segments = std::make_shared<LruMetadataCache<SegmentInfo>>(segment_capacity);
    return caches;
}

} // namespace basalt
