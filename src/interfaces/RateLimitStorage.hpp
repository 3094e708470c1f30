#ifndef RATELIMITSTORAGE_HPP
#define RATELIMITSTORAGE_HPP

#include <optional>
#include <string>

class RateLimitStorage {
public:
    virtual ~RateLimitStorage() = default;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual bool set(const std::string& key, const std::string& value, int ttl_seconds) = 0;
};

#endif // RATELIMITSTORAGE_HPP
