#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include "../models/RateLimitTypes.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

// Telemetry event names shared by the pool, the limiter and the controller.
namespace MetricsDefinitions {
    static std::string PROXY_SUCCESS = "proxy_success";

    static std::string PROXY_FAILURE = "proxy_failure";

    static std::string RECALIBRATION_UPDATE = "recalibration_update";

    static std::string STATSD_PREFIX = "egressguard.";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "egressguard.config";
    static constexpr auto ANONYMOUS_IDENTIFIER = "anonymous";
    static constexpr auto WILDCARD_ENDPOINT = "*";
    static constexpr int RECALIBRATION_HISTORY_SECONDS = 30 * 24 * 60 * 60;
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Logging Level
    LogUtils::LogLevel log_level;

    // Proxy pool
    std::string proxy_list_path;
    int max_consecutive_failures;
    double failure_cooldown_seconds;
    double health_check_interval_seconds;

    // Circuit breaker
    int circuit_max_failures;
    double circuit_base_backoff_seconds;
    double circuit_max_backoff_seconds;

    // Rate limiting storage
    bool use_redis;
    std::string redis_host;
    int redis_port;
    int in_memory_storage_max_size;

    // Rate limits
    LimitConfig default_limit;
    EndpointLimits endpoint_limits; // Key: endpoint or "*"

    // Recalibration
    int recalibration_interval_seconds;
    std::string metrics_samples_path;

    // Metrics
    std::string metrics_backend; // "console" or "statsd"
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    AppConfig() {
        // --- Set Defaults  ---
        log_level = LogUtils::LogLevel::INFO;

        max_consecutive_failures = 3;
        failure_cooldown_seconds = 60.0;
        health_check_interval_seconds = 30.0;

        circuit_max_failures = 3;
        circuit_base_backoff_seconds = 0.5;
        circuit_max_backoff_seconds = 30.0;

        use_redis = false;
        redis_host = "localhost";
        redis_port = 6379;
        in_memory_storage_max_size = 100000;

        default_limit = LimitConfig{60, 60, RateLimitStrategy::TokenBucket};

        recalibration_interval_seconds = 3600;

        metrics_backend = "console";
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "// --- Proxy Pool --- //" << std::endl
            << "proxy_list_path: " << proxy_list_path << std::endl
            << "max_consecutive_failures: " << max_consecutive_failures << std::endl
            << "failure_cooldown_seconds: " << failure_cooldown_seconds << std::endl
            << "health_check_interval_seconds: " << health_check_interval_seconds << std::endl
            << "// --- Circuit Breaker --- //" << std::endl
            << "circuit_max_failures: " << circuit_max_failures << std::endl
            << "circuit_base_backoff_seconds: " << circuit_base_backoff_seconds << std::endl
            << "circuit_max_backoff_seconds: " << circuit_max_backoff_seconds << std::endl
            << "// --- Rate Limiting --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "in_memory_storage_max_size: " << in_memory_storage_max_size << std::endl
            << "default_limit: " << default_limit.requests << " requests / "
            << default_limit.window_seconds << "s (" << strategyToString(default_limit.strategy) << ")" << std::endl
            << "// --- Recalibration --- //" << std::endl
            << "recalibration_interval_seconds: " << recalibration_interval_seconds << std::endl
            << "metrics_samples_path: " << metrics_samples_path << std::endl
            << "// --- Metrics --- //" << std::endl
            << "metrics_backend: " << metrics_backend << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl;

        ss << "--- Endpoint : caller class : limit ---" << std::endl;
        for (const auto& [endpoint, limits] : endpoint_limits) {
            for (const auto& [caller_class, limit] : limits) {
                ss << endpoint << " : " << callerClassToString(caller_class) << " : "
                   << limit.requests << "/" << limit.window_seconds << "s "
                   << strategyToString(limit.strategy) << std::endl;
            }
        }
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
