#pragma once

#include <string>

#include <nlohmann/json.hpp>

class IMetricsSink {
public:
    virtual ~IMetricsSink() = default;

    // Fire-and-forget. Implementations must not let delivery errors escape.
    virtual void emit(const std::string& event, const nlohmann::json& payload) = 0;
};
