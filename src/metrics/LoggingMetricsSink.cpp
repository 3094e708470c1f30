#include "LoggingMetricsSink.hpp"

#include <stdexcept>

LoggingMetricsSink::LoggingMetricsSink(std::shared_ptr<ILogger> logger) : logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for LoggingMetricsSink");
    }
}

void LoggingMetricsSink::emit(const std::string& event, const nlohmann::json& payload) {
    try {
        logger_->info("metrics_event=" + event + " " + payload.dump());
    } catch (const nlohmann::json::exception& e) {
        logger_->error("LoggingMetricsSink: failed to serialize '" + event + "': " + e.what());
    }
}
