// tests/test_metrics.cpp
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/config/AppConfig.hpp"
#include "../src/logging/ConsoleLogger.hpp"
#include "../src/metrics/FileMetricsSource.hpp"
#include "../src/metrics/InMemoryMetricsSource.hpp"
#include "../src/metrics/LoggingMetricsSink.hpp"
#include "../src/metrics/StatsDClient.hpp"
#include "../src/metrics/StatsDMetricsSink.hpp"
#include "mocks.hpp"

using json = nlohmann::json;
using ::testing::_;
using ::testing::DoubleEq;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::StartsWith;
using ::testing::StrictMock;
using ::testing::Throw;

// --- StatsDMetricsSink ---

TEST(StatsDMetricsSinkTest, CountsEventAndPublishesNumericFields) {
    auto statsd = std::make_shared<StrictMock<MockStatsDClient>>();
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    StatsDMetricsSink sink(statsd, logger);

    EXPECT_CALL(*statsd, increment("egressguard.proxy_failure", 1)).Times(1);
    EXPECT_CALL(*statsd, gauge("egressguard.proxy_failure.failures", DoubleEq(4.0))).Times(1);
    EXPECT_CALL(*statsd, gauge("egressguard.proxy_failure.active", DoubleEq(0.0))).Times(1);

    sink.emit(MetricsDefinitions::PROXY_FAILURE, json{
        {"address", "10.0.0.1:8080"},
        {"duration_ms", nullptr},
        {"failures", 4},
        {"active", false}
    });
}

TEST(StatsDMetricsSinkTest, FlattensOneLevelOfNesting) {
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    StatsDMetricsSink sink(statsd, logger);

    EXPECT_CALL(*statsd, gauge(_, _)).Times(::testing::AnyNumber());
    EXPECT_CALL(*statsd, gauge("egressguard.recalibration_update.policies.base_cooldown", DoubleEq(90.0))).Times(1);
    EXPECT_CALL(*statsd, gauge("egressguard.recalibration_update.anomaly_score", DoubleEq(0.25))).Times(1);

    sink.emit(MetricsDefinitions::RECALIBRATION_UPDATE, json{
        {"anomaly_score", 0.25},
        {"policies", {{"base_cooldown", 90}, {"max_failures", 2}}}
    });
}

TEST(StatsDMetricsSinkTest, ClientErrorsAreLoggedNotPropagated) {
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    StatsDMetricsSink sink(statsd, logger);

    ON_CALL(*statsd, increment(_, _)).WillByDefault(Throw(std::runtime_error("socket closed")));
    EXPECT_CALL(*logger, error(HasSubstr("socket closed"))).Times(1);
    EXPECT_NO_THROW(sink.emit("proxy_success", json{{"successes", 1}}));
}

TEST(StatsDClientTest, RejectsMalformedEndpoint) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    AppConfig config;
    EXPECT_THROW({ StatsDClient client(config, logger, "no-port-here"); }, std::runtime_error);
    EXPECT_THROW({ StatsDClient client(config, logger, "localhost:notaport"); }, std::runtime_error);
}

// --- LoggingMetricsSink ---

TEST(LoggingMetricsSinkTest, WritesEventAsJson) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    LoggingMetricsSink sink(logger);
    EXPECT_CALL(*logger, info(R"(metrics_event=proxy_success {"address":"a","successes":3})")).Times(1);
    sink.emit("proxy_success", json{{"address", "a"}, {"successes", 3}});
}

// --- ConsoleLogger ---

TEST(ConsoleLoggerTest, FiltersByLevelAndRoutesErrors) {
    std::ostringstream out;
    std::ostringstream err;
    ConsoleLogger logger(LogUtils::LogLevel::WARN, out, err);

    logger.debug("hidden debug");
    logger.info("hidden info");
    logger.warn("visible warning");
    logger.error("visible error");
    logger.setup("always shown");

    EXPECT_EQ(out.str().find("hidden"), std::string::npos);
    EXPECT_NE(out.str().find("[Warning] visible warning"), std::string::npos);
    EXPECT_NE(out.str().find("[Setup] always shown"), std::string::npos);
    EXPECT_NE(err.str().find("[Error] visible error"), std::string::npos);
    EXPECT_EQ(logger.getLogLevel(), LogUtils::LogLevel::WARN);
}

TEST(ConsoleLoggerTest, EventsAreNameEqualsJson) {
    std::ostringstream out;
    std::ostringstream err;
    ConsoleLogger logger(LogUtils::LogLevel::INFO, out, err);

    logger.event("rate_limit_event", json{{"allowed", true}});
    EXPECT_NE(out.str().find(R"([Info] rate_limit_event={"allowed":true})"), std::string::npos);
}

// --- FileMetricsSource ---

TEST(FileMetricsSourceTest, ParseLine) {
    auto sample = FileMetricsSource::parseLine(R"({"ts": 100.5, "latency_ms": 80, "error_rate": 0.02, "throughput": 12})");
    ASSERT_TRUE(sample.has_value());
    EXPECT_DOUBLE_EQ(sample->timestamp, 100.5);
    EXPECT_DOUBLE_EQ(sample->latency_ms, 80.0);
    EXPECT_DOUBLE_EQ(sample->error_rate, 0.02);
    EXPECT_DOUBLE_EQ(sample->throughput, 12.0);

    EXPECT_FALSE(FileMetricsSource::parseLine("not json").has_value());
    EXPECT_FALSE(FileMetricsSource::parseLine(R"({"latency_ms": 80})").has_value());
    EXPECT_FALSE(FileMetricsSource::parseLine("[1, 2, 3]").has_value());
}

TEST(FileMetricsSourceTest, SkipsMalformedLinesAndFiltersByWindow) {
    const std::string path = ::testing::TempDir() + "egressguard_samples.jsonl";
    {
        std::ofstream out(path);
        out << R"({"ts": 1000, "latency_ms": 100, "error_rate": 0.01, "throughput": 5})" << "\n"
            << "garbage line\n"
            << R"({"ts": 500, "latency_ms": 900, "error_rate": 0.5, "throughput": 1})" << "\n"
            << R"({"ts": 1500, "latency_ms": 100, "error_rate": 0.01, "throughput": 5})" << "\n"
            << R"({"ts": 950, "latency_ms": 110, "error_rate": 0.02, "throughput": 6})" << "\n";
    }
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    EXPECT_CALL(*logger, warn(HasSubstr("skipped 1 malformed line(s)"))).Times(1);

    FileMetricsSource source(path, logger);
    auto samples = source.fetchSamples(100, 1000.0);
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_DOUBLE_EQ(samples[0].timestamp, 1000.0);
    EXPECT_DOUBLE_EQ(samples[1].timestamp, 950.0);
}

TEST(FileMetricsSourceTest, MissingFileYieldsNoSamples) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    EXPECT_CALL(*logger, warn(StartsWith("FileMetricsSource: cannot open"))).Times(1);
    FileMetricsSource source("/nonexistent/samples.jsonl", logger);
    EXPECT_TRUE(source.fetchSamples(3600, 1000.0).empty());
}

// --- InMemoryMetricsSource ---

TEST(InMemoryMetricsSourceTest, ReturnsSamplesInsideWindow) {
    InMemoryMetricsSource source;
    MetricSample old_sample;
    old_sample.timestamp = 100.0;
    MetricSample recent_sample;
    recent_sample.timestamp = 950.0;
    source.add(old_sample);
    source.add(recent_sample);

    auto samples = source.fetchSamples(100, 1000.0);
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_DOUBLE_EQ(samples[0].timestamp, 950.0);
}
