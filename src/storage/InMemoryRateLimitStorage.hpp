#ifndef INMEMORYRATELIMITSTORAGE_HPP
#define INMEMORYRATELIMITSTORAGE_HPP

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../interfaces/RateLimitStorage.hpp"

struct StorageEntry {
    std::string value;
    std::chrono::time_point<std::chrono::steady_clock> expiry;
};

// Process-local limiter state. Entries expire after their TTL; once max_size
// keys are held the least recently used key is evicted. All operations take
// the instance mutex, so one instance may be shared across threads.
class InMemoryRateLimitStorage : public RateLimitStorage {
private:
    std::unordered_map<std::string, StorageEntry> entries_;
    std::list<std::string> lru_list_; // front = most recent
    std::unordered_map<std::string, std::list<std::string>::iterator> lru_map_;

    mutable std::mutex mutex_;
    const size_t max_size_;

    void removeExpired();
    void evictIfNeeded();
    void eraseKey(const std::string& key);

public:
    explicit InMemoryRateLimitStorage(size_t max_size = 100000);

    ~InMemoryRateLimitStorage() override = default;

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value, int ttl_seconds) override;

    size_t size() const;
};

#endif // INMEMORYRATELIMITSTORAGE_HPP
