#pragma once

#include <unordered_map>
#include <list>
#include <mutex>
#include <optional>
#include <chrono>
#include <vector>
#include <string>

namespace merlt {

template<typename Key, typename Value>
class LRUCache {
public:
    explicit LRUCache(size_t max_size, std::chrono::seconds ttl = std::chrono::seconds(300))
        : max_size_(max_size == 0 ? 1 : max_size), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            ++misses_;
            return std::nullopt;
        }

        if (std::chrono::steady_clock::now() > it->second.expiry_time) {
            cache_list_.erase(it->second.list_it);
            cache_map_.erase(it);
            ++misses_;
            return std::nullopt;
        }

        // Move to front (most recently used)
        cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
        ++hits_;
        return it->second.value;
    }

    void set(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto expiry = std::chrono::steady_clock::now() + ttl_;

        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            it->second.value = value;
            it->second.expiry_time = expiry;
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
            return;
        }

        if (cache_map_.size() >= max_size_) {
            cache_map_.erase(cache_list_.back());
            cache_list_.pop_back();
        }
        cache_list_.push_front(key);
        cache_map_[key] = {value, cache_list_.begin(), expiry};
    }

    void erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) return;
        cache_list_.erase(it->second.list_it);
        cache_map_.erase(it);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_map_.clear();
        cache_list_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_map_.size();
    }

    size_t hits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    size_t misses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

private:
    struct CacheEntry {
        Value value;
        typename std::list<Key>::iterator list_it;
        std::chrono::steady_clock::time_point expiry_time;
    };

    size_t max_size_;
    std::chrono::seconds ttl_;
    std::list<Key> cache_list_;
    std::unordered_map<Key, CacheEntry> cache_map_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    mutable std::mutex mutex_;
};

// Caches in front of the slow collaborators: the embedding endpoint and the
// authority score computed from the user store.
class CacheManager {
public:
    CacheManager(size_t authority_capacity = 4096,
                 std::chrono::seconds authority_ttl = std::chrono::seconds(300))
        : embedding_cache_(2000, std::chrono::seconds(3600)),
          authority_cache_(authority_capacity, authority_ttl) {}

    std::optional<std::vector<float>> get_embedding(const std::string& text) {
        return embedding_cache_.get(text);
    }

    void set_embedding(const std::string& text, const std::vector<float>& embedding) {
        embedding_cache_.set(text, embedding);
    }

    std::optional<double> get_authority(const std::string& user_id) {
        return authority_cache_.get(user_id);
    }

    void set_authority(const std::string& user_id, double score) {
        authority_cache_.set(user_id, score);
    }

    void invalidate_authority(const std::string& user_id) {
        authority_cache_.erase(user_id);
    }

    void clear_all() {
        embedding_cache_.clear();
        authority_cache_.clear();
    }

    const LRUCache<std::string, double>& authority_cache() const { return authority_cache_; }

private:
    LRUCache<std::string, std::vector<float>> embedding_cache_;
    LRUCache<std::string, double> authority_cache_;
};

} // namespace merlt
