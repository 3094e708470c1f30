#include "InMemoryRateLimitStorage.hpp"

#include <chrono>

using namespace std::chrono;

InMemoryRateLimitStorage::InMemoryRateLimitStorage(size_t max_size)
    : max_size_(max_size == 0 ? 1 : max_size) {}

bool InMemoryRateLimitStorage::set(const std::string& key, const std::string& value, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);

    StorageEntry entry;
    entry.value = value;
    entry.expiry = steady_clock::now() + seconds(ttl_seconds > 0 ? ttl_seconds : 1);

    auto lru_it = lru_map_.find(key);
    if (lru_it != lru_map_.end()) {
        lru_list_.erase(lru_it->second);
    } else {
        if (lru_map_.size() >= max_size_) {
            removeExpired();
        }
        evictIfNeeded();
    }

    entries_[key] = std::move(entry);
    lru_list_.push_front(key);
    lru_map_[key] = lru_list_.begin();
    return true;
}

std::optional<std::string> InMemoryRateLimitStorage::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entry_it = entries_.find(key);
    if (entry_it == entries_.end()) {
        return std::nullopt;
    }
    if (entry_it->second.expiry <= steady_clock::now()) {
        eraseKey(key);
        return std::nullopt;
    }

    auto lru_it = lru_map_.find(key);
    if (lru_it != lru_map_.end()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, lru_it->second);
    }
    return entry_it->second.value;
}

size_t InMemoryRateLimitStorage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// Callers hold mutex_.
void InMemoryRateLimitStorage::eraseKey(const std::string& key) {
    auto lru_it = lru_map_.find(key);
    if (lru_it != lru_map_.end()) {
        lru_list_.erase(lru_it->second);
        lru_map_.erase(lru_it);
    }
    entries_.erase(key);
}

// Callers hold mutex_.
void InMemoryRateLimitStorage::removeExpired() {
    auto now = steady_clock::now();
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->second.expiry <= now) {
            auto lru_it = lru_map_.find(it->first);
            if (lru_it != lru_map_.end()) {
                lru_list_.erase(lru_it->second);
                lru_map_.erase(lru_it);
            }
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

// Callers hold mutex_.
void InMemoryRateLimitStorage::evictIfNeeded() {
    while (lru_map_.size() >= max_size_ && !lru_list_.empty()) {
        std::string oldest_key = lru_list_.back();
        lru_list_.pop_back();
        lru_map_.erase(oldest_key);
        entries_.erase(oldest_key);
    }
}
