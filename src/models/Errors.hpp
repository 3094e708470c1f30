#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

// Thrown by CircuitBreaker::execute when the breaker is open and its backoff
// deadline has not passed. No call was attempted.
class CircuitOpenError : public std::runtime_error {
public:
    explicit CircuitOpenError(double retry_at)
        : std::runtime_error("circuit_open"), retry_at_(retry_at) {}

    double retryAt() const { return retry_at_; }

private:
    double retry_at_;
};

// Thrown by RateLimiter::check when a request is not admitted.
class RateLimitExceededError : public std::runtime_error {
public:
    RateLimitExceededError(const std::string& message,
                           double retry_after,
                           std::string endpoint,
                           std::string caller_class)
        : std::runtime_error(message),
          retry_after_(retry_after),
          endpoint_(std::move(endpoint)),
          caller_class_(std::move(caller_class)) {}

    // Absolute epoch time (seconds) after which a retry may be admitted.
    double retryAfter() const { return retry_after_; }
    const std::string& endpoint() const { return endpoint_; }
    const std::string& callerClass() const { return caller_class_; }

private:
    double retry_after_;
    std::string endpoint_;
    std::string caller_class_;
};

#endif // ERRORS_HPP
