#pragma once

#include <optional>
#include <string>

enum class BreakerState {
    Closed,
    Open,
    HalfOpen
};

struct CircuitState {
    BreakerState state = BreakerState::Closed;
    int failures = 0;
    std::optional<double> last_failure_at;
    std::optional<double> next_try_at;
};

inline std::string breakerStateToString(BreakerState state) {
    switch (state) {
    case BreakerState::Closed: return "closed";
    case BreakerState::Open: return "open";
    case BreakerState::HalfOpen: return "half_open";
    }
    return "closed";
}
