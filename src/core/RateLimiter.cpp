#include "RateLimiter.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"

using json = nlohmann::json;

RateLimiter::RateLimiter(std::shared_ptr<RateLimitStorage> storage,
                         EndpointLimits limits_by_endpoint,
                         LimitConfig default_limit,
                         std::shared_ptr<ILogger> logger,
                         std::shared_ptr<IClock> clock)
    : storage_(storage),
      limits_by_endpoint_(std::move(limits_by_endpoint)),
      default_limit_(default_limit),
      logger_(logger),
      clock_(clock) {
    if (!storage_) {
        throw std::invalid_argument("Storage cannot be null for RateLimiter");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RateLimiter");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for RateLimiter");
    }
    auto validate = [](const LimitConfig& limit) {
        if (limit.requests <= 0 || limit.window_seconds <= 0) {
            throw std::invalid_argument("Rate limits need positive requests and window_seconds");
        }
    };
    validate(default_limit_);
    for (const auto& [endpoint, limits] : limits_by_endpoint_) {
        for (const auto& [caller_class, limit] : limits) {
            validate(limit);
        }
    }
}

std::string RateLimiter::buildKey(const std::string& endpoint,
                                  CallerClass caller_class,
                                  const std::optional<std::string>& identifier) {
    const std::string suffix = (identifier && !identifier->empty()) ? *identifier : Constants::ANONYMOUS_IDENTIFIER;
    return "rl:" + endpoint + ":" + callerClassToString(caller_class) + ":" + suffix;
}

LimitConfig RateLimiter::resolveLimit(const std::string& endpoint, CallerClass caller_class) const {
    auto endpoint_it = limits_by_endpoint_.find(endpoint);
    if (endpoint_it != limits_by_endpoint_.end()) {
        auto limit_it = endpoint_it->second.find(caller_class);
        if (limit_it != endpoint_it->second.end()) {
            return limit_it->second;
        }
    }
    auto wildcard_it = limits_by_endpoint_.find(Constants::WILDCARD_ENDPOINT);
    if (wildcard_it != limits_by_endpoint_.end()) {
        auto limit_it = wildcard_it->second.find(caller_class);
        if (limit_it != wildcard_it->second.end()) {
            return limit_it->second;
        }
    }
    return default_limit_;
}

RateLimitResult RateLimiter::check(const std::string& endpoint,
                                   CallerClass caller_class,
                                   const std::optional<std::string>& identifier,
                                   std::optional<double> now) {
    const double current_time = now ? *now : clock_->now();
    const std::string key = buildKey(endpoint, caller_class, identifier);
    const LimitConfig limit = resolveLimit(endpoint, caller_class);

    RateLimitResult result;
    {
        std::lock_guard<std::mutex> lock(stripeFor(key));
        if (limit.strategy == RateLimitStrategy::TokenBucket) {
            result = checkTokenBucket(key, limit, current_time);
        } else {
            result = checkSlidingWindow(key, limit, current_time);
        }
    }

    logger_->event("rate_limit_event", json{
        {"endpoint", endpoint},
        {"user_type", callerClassToString(caller_class)},
        {"identifier", (identifier && !identifier->empty()) ? *identifier : Constants::ANONYMOUS_IDENTIFIER},
        {"strategy", strategyToString(limit.strategy)},
        {"allowed", result.allowed},
        {"remaining", result.remaining},
        {"reset_at", result.reset_at}
    });

    if (!result.allowed) {
        throw RateLimitExceededError("Rate limit exceeded", result.reset_at,
                                     endpoint, callerClassToString(caller_class));
    }
    return result;
}

RateLimitResult RateLimiter::checkTokenBucket(const std::string& key, const LimitConfig& limit, double now) {
    const double capacity = static_cast<double>(limit.requests);
    const double refill_rate = capacity / static_cast<double>(limit.window_seconds);

    double tokens = capacity;
    double last = now;
    bool seeded = false;
    if (auto raw = loadState(key)) {
        try {
            json state = json::parse(*raw);
            tokens = state.value("tokens", capacity);
            last = state.value("last", now);
            seeded = true;
        } catch (const json::exception& e) {
            logger_->warn("Discarding unreadable token bucket state for " + key + ": " + e.what());
        }
    }

    if (!seeded) {
        // First request charges itself; the bucket has never been drained.
        tokens = capacity - 1.0;
        storeState(key, json{{"tokens", tokens}, {"last", now}}.dump(), limit.window_seconds);
        return RateLimitResult{true, static_cast<int>(tokens), std::numeric_limits<double>::infinity()};
    }

    const double elapsed = std::max(0.0, now - last);
    tokens = std::min(capacity, tokens + elapsed * refill_rate);

    if (tokens < 1.0) {
        const double retry_after = now + (1.0 - tokens) / refill_rate;
        storeState(key, json{{"tokens", tokens}, {"last", now}}.dump(), limit.window_seconds);
        return RateLimitResult{false, static_cast<int>(tokens), retry_after};
    }

    tokens -= 1.0;
    storeState(key, json{{"tokens", tokens}, {"last", now}}.dump(), limit.window_seconds);
    const double reset_at = now + (capacity - tokens) / refill_rate;
    return RateLimitResult{true, static_cast<int>(tokens), reset_at};
}

RateLimitResult RateLimiter::checkSlidingWindow(const std::string& key, const LimitConfig& limit, double now) {
    const double window = static_cast<double>(limit.window_seconds);
    const double window_start = now - window;

    std::vector<double> timestamps;
    if (auto raw = loadState(key)) {
        try {
            for (const auto& value : json::parse(*raw)) {
                const double timestamp = value.get<double>();
                if (timestamp >= window_start) {
                    timestamps.push_back(timestamp);
                }
            }
        } catch (const json::exception& e) {
            logger_->warn("Discarding unreadable sliding window state for " + key + ": " + e.what());
            timestamps.clear();
        }
    }
    timestamps.push_back(now);

    // The request is recorded even when rejected so a sustained burst keeps
    // the window full.
    storeState(key, json(timestamps).dump(), limit.window_seconds);

    const int used = static_cast<int>(timestamps.size());
    const double oldest = *std::min_element(timestamps.begin(), timestamps.end());
    if (used > limit.requests) {
        return RateLimitResult{false, 0, oldest + window};
    }
    return RateLimitResult{true, std::max(0, limit.requests - used), oldest + window};
}

std::optional<std::string> RateLimiter::loadState(const std::string& key) {
    return storage_->get(key);
}

void RateLimiter::storeState(const std::string& key, const std::string& value, int ttl_seconds) {
    if (!storage_->set(key, value, ttl_seconds)) {
        logger_->error("Failed to persist rate limit state for " + key);
    }
}

std::mutex& RateLimiter::stripeFor(const std::string& key) {
    return key_locks_[std::hash<std::string>{}(key) % LOCK_STRIPES];
}
