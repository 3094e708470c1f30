#pragma once

#include <nlohmann/json.hpp>

struct RecalibrationPolicies {
    int max_failures = 3;
    int timeout_seconds = 10;
    int retry_attempts = 3;
    int base_cooldown = 60;
    int exponential_backoff = 2;
    int max_cooldown = 600;

    bool operator==(const RecalibrationPolicies& other) const {
        return max_failures == other.max_failures &&
               timeout_seconds == other.timeout_seconds &&
               retry_attempts == other.retry_attempts &&
               base_cooldown == other.base_cooldown &&
               exponential_backoff == other.exponential_backoff &&
               max_cooldown == other.max_cooldown;
    }

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"max_failures", max_failures},
            {"timeout_seconds", timeout_seconds},
            {"retry_attempts", retry_attempts},
            {"base_cooldown", base_cooldown},
            {"exponential_backoff", exponential_backoff},
            {"max_cooldown", max_cooldown}
        };
    }
};
