#include "StatsDMetricsSink.hpp"

#include <stdexcept>

#include "../config/AppConfig.hpp"

StatsDMetricsSink::StatsDMetricsSink(std::shared_ptr<IStatsDClient> statsd_client, std::shared_ptr<ILogger> logger)
    : statsd_client_(statsd_client), logger_(logger) {
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for StatsDMetricsSink");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDMetricsSink");
    }
}

void StatsDMetricsSink::publishField(const std::string& key, const nlohmann::json& value) {
    if (value.is_boolean()) {
        statsd_client_->gauge(key, value.get<bool>() ? 1.0 : 0.0);
    } else if (value.is_number()) {
        statsd_client_->gauge(key, value.get<double>());
    }
}

void StatsDMetricsSink::emit(const std::string& event, const nlohmann::json& payload) {
    const std::string prefix = MetricsDefinitions::STATSD_PREFIX + event;
    try {
        statsd_client_->increment(prefix);
        if (!payload.is_object()) {
            return;
        }
        for (const auto& [field, value] : payload.items()) {
            if (value.is_object()) {
                for (const auto& [nested_field, nested_value] : value.items()) {
                    publishField(prefix + "." + field + "." + nested_field, nested_value);
                }
            } else {
                publishField(prefix + "." + field, value);
            }
        }
    } catch (const std::exception& e) {
        logger_->error("StatsDMetricsSink: failed to emit '" + event + "': " + e.what());
    }
}
