#pragma once

#include <memory>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IMetricsSink.hpp"

// Writes every event to the logger as "metrics_event=<event> <json>".
class LoggingMetricsSink : public IMetricsSink {
public:
    explicit LoggingMetricsSink(std::shared_ptr<ILogger> logger);

    void emit(const std::string& event, const nlohmann::json& payload) override;

private:
    std::shared_ptr<ILogger> logger_;
};
