#pragma once

#include <iostream>
#include <memory>
#include <mutex>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(LogUtils::LogLevel logLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : logLevel(logLevel), out_(out), err_(err) {}
    ~ConsoleLogger() override = default;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    void event(const std::string& name, const nlohmann::json& payload) override;
    int getLogLevel() override { return logLevel; }

private:
    void write(std::ostream& stream, const std::string& prefix, const std::string& message);

    LogUtils::LogLevel logLevel;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex cout_mutex_; // Serializes writes to both streams

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;
    ConsoleLogger(ConsoleLogger&&) = delete;
    ConsoleLogger& operator=(ConsoleLogger&&) = delete;
};
