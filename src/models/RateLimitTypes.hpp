#ifndef RATELIMITTYPES_HPP
#define RATELIMITTYPES_HPP

#include <map>
#include <stdexcept>
#include <string>

enum class RateLimitStrategy {
    TokenBucket,
    SlidingWindow
};

enum class CallerClass {
    Anonymous,
    Authenticated
};

struct LimitConfig {
    int requests = 0;
    int window_seconds = 0;
    RateLimitStrategy strategy = RateLimitStrategy::TokenBucket;
};

// Outcome of an admitted check. reset_at is an absolute epoch time in seconds.
struct RateLimitResult {
    bool allowed = false;
    int remaining = 0;
    double reset_at = 0.0;
};

// endpoint (or "*") -> caller class -> limit
using EndpointLimits = std::map<std::string, std::map<CallerClass, LimitConfig>>;

inline std::string strategyToString(RateLimitStrategy strategy) {
    switch (strategy) {
    case RateLimitStrategy::TokenBucket: return "token_bucket";
    case RateLimitStrategy::SlidingWindow: return "sliding_window";
    }
    return "token_bucket";
}

inline RateLimitStrategy stringToStrategy(const std::string& value) {
    if (value == "token_bucket") return RateLimitStrategy::TokenBucket;
    if (value == "sliding_window") return RateLimitStrategy::SlidingWindow;
    throw std::invalid_argument("Invalid rate limit strategy: " + value);
}

inline std::string callerClassToString(CallerClass caller_class) {
    return caller_class == CallerClass::Authenticated ? "authenticated" : "anonymous";
}

inline CallerClass stringToCallerClass(const std::string& value) {
    if (value == "anonymous") return CallerClass::Anonymous;
    if (value == "authenticated") return CallerClass::Authenticated;
    throw std::invalid_argument("Invalid caller class: " + value);
}

#endif // RATELIMITTYPES_HPP
