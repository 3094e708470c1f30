#include <stdexcept>

#include <hiredis/hiredis.h>

#include "RedisRateLimitStorage.hpp"
#include "../interfaces/ILogger.hpp"

RedisRateLimitStorage::RedisRateLimitStorage(const std::string& host, int port, std::shared_ptr<ILogger> logger)
    : host_(host), port_(port), logger_(logger), redis_context_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisRateLimitStorage");
    }
    connect();
}

RedisRateLimitStorage::~RedisRateLimitStorage() {
    if (redis_context_) {
        redisFree(redis_context_);
    }
}

void RedisRateLimitStorage::connect() {
    redis_context_ = redisConnect(host_.c_str(), port_);
    if (redis_context_ == nullptr || redis_context_->err) {
        std::string error_msg;
        if (redis_context_) {
            error_msg = "Redis connection error: " + std::string(redis_context_->errstr);
            redisFree(redis_context_);
            redis_context_ = nullptr;
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        logger_->error(error_msg);
    }
}

bool RedisRateLimitStorage::set(const std::string& key, const std::string& value, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot SETEX key: " + key);
        return false;
    }

    auto* reply = static_cast<redisReply*>(redisCommand(redis_context_,
        "SETEX %b %d %b",
        key.data(), key.size(),
        ttl_seconds > 0 ? ttl_seconds : 1,
        value.data(), value.size()));

    if (reply == nullptr) {
        logger_->error("Redis SETEX command failed (nullptr reply) for key: " + key);
        return false;
    }

    bool success = (reply->type != REDIS_REPLY_ERROR);
    if (!success) {
        logger_->error("Redis SETEX error for key " + key + ": " + std::string(reply->str, reply->len));
    }
    freeReplyObject(reply);
    return success;
}

std::optional<std::string> RedisRateLimitStorage::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot GET key: " + key);
        return std::nullopt;
    }

    auto* reply = static_cast<redisReply*>(redisCommand(redis_context_, "GET %b", key.data(), key.size()));
    if (reply == nullptr) {
        logger_->error("Redis GET command failed (nullptr reply) for key: " + key);
        return std::nullopt;
    }

    std::optional<std::string> result;
    if (reply->type == REDIS_REPLY_STRING) {
        result = std::string(reply->str, reply->len);
    }

    freeReplyObject(reply);
    return result;
}

bool RedisRateLimitStorage::isConnected() const {
    return redis_context_ != nullptr;
}
