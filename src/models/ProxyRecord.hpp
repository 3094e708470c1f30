#ifndef PROXYRECORD_HPP
#define PROXYRECORD_HPP

#include <optional>
#include <string>

// Health statistics for one pool address.
struct ProxyRecord {
    std::string address;
    long successes = 0;
    long failures = 0;
    int consecutive_failures = 0;
    std::optional<double> last_success_at;
    std::optional<double> last_failure_at;
    bool active = true;
    // Set when the address leaves rotation; cleared on reactivation.
    std::optional<double> inactive_since;
    double total_duration_ms = 0.0;
    long requests = 0;
};

struct PoolPolicy {
    int max_consecutive_failures = 3;
    double failure_cooldown_seconds = 60.0;
};

// Derived per-address view used by diagnostics.
struct ProxyDiagnostic {
    std::string address;
    long successes = 0;
    long failures = 0;
    int consecutive_failures = 0;
    long requests = 0;
    double avg_latency_ms = 0.0;
    double error_rate = 0.0;
    double availability = 0.0;
    bool active = true;
    std::optional<double> last_success_at;
    std::optional<double> last_failure_at;
};

#endif // PROXYRECORD_HPP
