#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../interfaces/RateLimitStorage.hpp"

// Forward declarations
struct redisContext;
class ILogger;

// Limiter state shared between processes through Redis (GET / SETEX).
class RedisRateLimitStorage : public RateLimitStorage {
public:
    RedisRateLimitStorage(const std::string& host, int port, std::shared_ptr<ILogger> logger);
    ~RedisRateLimitStorage() override;

    RedisRateLimitStorage(const RedisRateLimitStorage&) = delete;
    RedisRateLimitStorage& operator=(const RedisRateLimitStorage&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value, int ttl_seconds) override;

    bool isConnected() const;

private:
    void connect();

    std::string host_;
    int port_;
    std::shared_ptr<ILogger> logger_;
    redisContext* redis_context_;
    std::mutex mutex_;
};
