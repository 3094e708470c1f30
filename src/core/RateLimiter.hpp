#ifndef RATELIMITER_HPP
#define RATELIMITER_HPP

#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/RateLimitStorage.hpp"
#include "../models/Errors.hpp"
#include "../models/RateLimitTypes.hpp"

// Admission control keyed by endpoint, caller class and caller identifier.
//
// Limits resolve as: exact (endpoint, caller class) entry, then the "*"
// endpoint entry for that caller class, then the default limit. State lives
// in the injected storage with a TTL equal to the limit window, so idle keys
// expire on their own.
class RateLimiter {
public:
    RateLimiter(std::shared_ptr<RateLimitStorage> storage,
                EndpointLimits limits_by_endpoint,
                LimitConfig default_limit,
                std::shared_ptr<ILogger> logger,
                std::shared_ptr<IClock> clock);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Admits or rejects one request. Throws RateLimitExceededError when the
    // request is not admitted. now defaults to the injected clock.
    RateLimitResult check(const std::string& endpoint,
                          CallerClass caller_class,
                          const std::optional<std::string>& identifier = std::nullopt,
                          std::optional<double> now = std::nullopt);

    LimitConfig resolveLimit(const std::string& endpoint, CallerClass caller_class) const;

    static std::string buildKey(const std::string& endpoint,
                                CallerClass caller_class,
                                const std::optional<std::string>& identifier);

private:
    static constexpr size_t LOCK_STRIPES = 64;

    RateLimitResult checkTokenBucket(const std::string& key, const LimitConfig& limit, double now);
    RateLimitResult checkSlidingWindow(const std::string& key, const LimitConfig& limit, double now);
    std::optional<std::string> loadState(const std::string& key);
    void storeState(const std::string& key, const std::string& value, int ttl_seconds);
    std::mutex& stripeFor(const std::string& key);

    std::shared_ptr<RateLimitStorage> storage_;
    EndpointLimits limits_by_endpoint_;
    LimitConfig default_limit_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IClock> clock_;
    // Serializes the read-modify-write of a key; different keys mostly map to
    // different stripes and proceed in parallel.
    std::array<std::mutex, LOCK_STRIPES> key_locks_;
};

#endif // RATELIMITER_HPP
