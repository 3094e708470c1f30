#pragma once

#include <string>

#include <nlohmann/json.hpp>

class ILogger {
public:
    virtual ~ILogger() noexcept = default;
    virtual void info(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void setup(const std::string& message) = 0;
    // Structured observability record, written at info level as "<name>=<json>".
    virtual void event(const std::string& name, const nlohmann::json& payload) = 0;
    virtual int getLogLevel() = 0;
};
