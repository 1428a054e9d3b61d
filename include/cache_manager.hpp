#pragma once

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace code_agent {

// Thread-safe LRU with a per-entry time-to-live. A max_size of 0 disables it.
template<typename Key, typename Value>
class LRUCache {
public:
    explicit LRUCache(size_t max_size, std::chrono::seconds ttl = std::chrono::seconds(300))
        : max_size_(max_size), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++misses_;
            return std::nullopt;
        }
        if (std::chrono::steady_clock::now() > it->second.expiry_time) {
            order_.erase(it->second.order_it);
            entries_.erase(it);
            ++misses_;
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second.order_it);
        ++hits_;
        return it->second.value;
    }

    void set(const Key& key, const Value& value) {
        if (max_size_ == 0) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto expiry = std::chrono::steady_clock::now() + ttl_;

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.value = value;
            it->second.expiry_time = expiry;
            order_.splice(order_.begin(), order_, it->second.order_it);
            return;
        }
        if (entries_.size() >= max_size_) {
            entries_.erase(order_.back());
            order_.pop_back();
        }
        order_.push_front(key);
        entries_.emplace(key, Entry{value, order_.begin(), expiry});
    }

    bool erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return false;
        order_.erase(it->second.order_it);
        entries_.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        order_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
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
    struct Entry {
        Value value;
        typename std::list<Key>::iterator order_it;
        std::chrono::steady_clock::time_point expiry_time;
    };

    size_t max_size_;
    std::chrono::seconds ttl_;
    std::list<Key> order_;
    std::unordered_map<Key, Entry> entries_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    mutable std::mutex mutex_;
};

// Exact key for a (language, source) pair; the source is kept whole so two
// different sources can never share an entry.
inline std::string content_key(const std::string& language, const std::string& content) {
    std::string key;
    key.reserve(language.size() + 1 + content.size());
    key += language;
    key += '\0';
    key += content;
    return key;
}

} // namespace code_agent
