// tests/mocks.hpp
#ifndef EGRESSGUARD_TEST_MOCKS_HPP
#define EGRESSGUARD_TEST_MOCKS_HPP

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gmock/gmock.h"

#include "../src/interfaces/IClock.hpp"
#include "../src/interfaces/IHealthCheck.hpp"
#include "../src/interfaces/ILogger.hpp"
#include "../src/interfaces/IMetricsSink.hpp"
#include "../src/interfaces/IMetricsSource.hpp"
#include "../src/interfaces/IStatsDClient.hpp"
#include "../src/interfaces/RateLimitStorage.hpp"

// --- Mock Logger ---
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, setup, (const std::string& message), (override));
    MOCK_METHOD(void, event, (const std::string& name, const nlohmann::json& payload), (override));
    MOCK_METHOD(int, getLogLevel, (), (override));
};

// Mock class for StatsDClient
class MockStatsDClient : public IStatsDClient {
public:
    MOCK_METHOD(void, increment, (const std::string& key, int value), (override));
    MOCK_METHOD(void, gauge, (const std::string& key, double value), (override));
    MOCK_METHOD(void, timing, (const std::string& key, std::chrono::milliseconds value), (override));
};

class MockMetricsSink : public IMetricsSink {
public:
    MOCK_METHOD(void, emit, (const std::string& event, const nlohmann::json& payload), (override));
};

class MockMetricsSource : public IMetricsSource {
public:
    MOCK_METHOD(std::vector<MetricSample>, fetchSamples, (int since_seconds, double now), (override));
};

class MockHealthCheck : public IHealthCheck {
public:
    MOCK_METHOD(bool, probe, (const std::string& address), (override));
};

class MockStorage : public RateLimitStorage {
public:
    MOCK_METHOD(std::optional<std::string>, get, (const std::string& key), (override));
    MOCK_METHOD(bool, set, (const std::string& key, const std::string& value, int ttl_seconds), (override));
};

// Time only moves when a test says so.
class ManualClock : public IClock {
public:
    explicit ManualClock(double start = 1700000000.0) : now_(start) {}

    double now() override { return now_; }
    void set(double value) { now_ = value; }
    void advance(double seconds) { now_ += seconds; }

private:
    double now_;
};

#endif // EGRESSGUARD_TEST_MOCKS_HPP
