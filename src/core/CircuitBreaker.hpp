#ifndef CIRCUITBREAKER_HPP
#define CIRCUITBREAKER_HPP

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "../interfaces/IClock.hpp"
#include "../models/CircuitState.hpp"
#include "../models/Errors.hpp"

struct CircuitBreakerConfig {
    int max_failures = 3;
    double base_backoff_seconds = 0.5;
    double max_backoff_seconds = 30.0;
};

// Guards one logical call site.
//
//   closed --failures >= max_failures--> open --backoff elapsed--> half_open
//   half_open --success--> closed,  half_open --failure--> open
//
// Each time the breaker opens, the retry deadline is pushed to
// now + min(max_backoff, base_backoff * 2^(failures - 1)).
//
// Not synchronized: share an instance across threads only under an external lock.
class CircuitBreaker {
public:
    CircuitBreaker(CircuitBreakerConfig config, std::shared_ptr<IClock> clock)
        : config_(config), clock_(clock) {
        if (!clock_) {
            throw std::invalid_argument("Clock cannot be null for CircuitBreaker");
        }
        if (config_.max_failures < 1) {
            throw std::invalid_argument("CircuitBreaker max_failures must be at least 1");
        }
    }

    // Runs fn and returns its result. Throws CircuitOpenError without calling
    // fn while the breaker is open; otherwise any exception from fn is
    // recorded and rethrown unchanged.
    template <typename Fn>
    auto execute(Fn&& fn) -> decltype(fn()) {
        const double now = clock_->now();
        if (state_.state == BreakerState::Open) {
            if (state_.next_try_at && now < *state_.next_try_at) {
                throw CircuitOpenError(*state_.next_try_at);
            }
            state_.state = BreakerState::HalfOpen;
        }

        try {
            if constexpr (std::is_void_v<decltype(fn())>) {
                fn();
                state_ = CircuitState{};
                return;
            } else {
                decltype(auto) result = fn();
                state_ = CircuitState{};
                if constexpr (std::is_reference_v<decltype(fn())>) {
                    return static_cast<decltype(fn())>(result);
                } else {
                    return result;
                }
            }
        } catch (...) {
            recordFailure(now);
            throw;
        }
    }

    CircuitState state() const { return state_; }

    // Backoff applied after the given number of consecutive failures.
    double backoffFor(int failures) const {
        const double exponent = static_cast<double>(std::max(0, failures - 1));
        return std::min(config_.max_backoff_seconds, config_.base_backoff_seconds * std::pow(2.0, exponent));
    }

private:
    void recordFailure(double now) {
        state_.failures += 1;
        state_.last_failure_at = now;
        if (state_.state == BreakerState::HalfOpen || state_.failures >= config_.max_failures) {
            state_.next_try_at = now + backoffFor(state_.failures);
            state_.state = BreakerState::Open;
        }
    }

    CircuitBreakerConfig config_;
    std::shared_ptr<IClock> clock_;
    CircuitState state_;
};

#endif // CIRCUITBREAKER_HPP
