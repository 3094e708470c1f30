// tests/test_anomalydetector.cpp
#include <cmath>
#include <vector>

#include "gtest/gtest.h"

#include "../src/core/AnomalyDetector.hpp"

namespace {
    constexpr double NOW = 1700000000.0;
    constexpr double DAY = 24 * 60 * 60;

    MetricSample sampleAt(double timestamp, double latency, double error_rate, double throughput) {
        MetricSample sample;
        sample.timestamp = timestamp;
        sample.latency_ms = latency;
        sample.error_rate = error_rate;
        sample.throughput = throughput;
        return sample;
    }

    void expectAllZero(const WindowThresholds& w) {
        EXPECT_DOUBLE_EQ(w.p95, 0.0);
        EXPECT_DOUBLE_EQ(w.p99, 0.0);
        EXPECT_DOUBLE_EQ(w.two_sigma, 0.0);
        EXPECT_DOUBLE_EQ(w.three_sigma, 0.0);
    }
}

TEST(AnomalyDetectorTest, EmptySamplesGiveZeroThresholdsAndZeroScore) {
    MetricThresholds thresholds = AnomalyDetector::computeThresholds({}, NOW);
    for (TimeWindow window : {TimeWindow::Day, TimeWindow::Week, TimeWindow::Month}) {
        expectAllZero(thresholds.latency_ms.at(window));
        expectAllZero(thresholds.error_rate.at(window));
        expectAllZero(thresholds.throughput.at(window));
    }

    AnomalyResult result = AnomalyDetector::detectAnomaly(500.0, 0.9, 1.0, thresholds);
    EXPECT_DOUBLE_EQ(result.anomaly_score, 0.0);
    EXPECT_FALSE(result.is_anomalous);
}

TEST(AnomalyDetectorTest, PercentilesUseFloorIndexAndSigmaIsPopulation) {
    std::vector<double> values = {10, 1, 9, 2, 8, 3, 7, 4, 6, 5};
    WindowThresholds w = AnomalyDetector::thresholdsFor(values);

    EXPECT_DOUBLE_EQ(w.p95, 9.0); // floor(0.95 * 9) = 8
    EXPECT_DOUBLE_EQ(w.p99, 9.0); // floor(0.99 * 9) = 8
    const double sigma = std::sqrt(8.25);
    EXPECT_NEAR(w.two_sigma, 5.5 + 2 * sigma, 1e-9);
    EXPECT_NEAR(w.three_sigma, 5.5 + 3 * sigma, 1e-9);
}

TEST(AnomalyDetectorTest, SamplesAreBucketedByWindow) {
    std::vector<MetricSample> samples = {
        sampleAt(NOW - 60, 100.0, 0.01, 10.0),
        sampleAt(NOW - 2 * DAY, 400.0, 0.02, 20.0),
        sampleAt(NOW - 10 * DAY, 900.0, 0.03, 30.0),
        sampleAt(NOW - 40 * DAY, 5000.0, 0.5, 40.0)
    };
    MetricThresholds thresholds = AnomalyDetector::computeThresholds(samples, NOW);

    EXPECT_DOUBLE_EQ(thresholds.latency_ms.at(TimeWindow::Day).p99, 100.0);
    EXPECT_DOUBLE_EQ(thresholds.latency_ms.at(TimeWindow::Week).p99, 100.0);  // floor(0.99 * 1) = 0
    EXPECT_DOUBLE_EQ(thresholds.latency_ms.at(TimeWindow::Month).p99, 400.0); // floor(0.99 * 2) = 1
    EXPECT_LT(thresholds.latency_ms.at(TimeWindow::Month).three_sigma, 5000.0);
}

TEST(AnomalyDetectorTest, ScoreInterpolatesBetweenBaseAndExtreme) {
    WindowThresholds w;
    w.p95 = 10.0;
    w.two_sigma = 12.0;
    w.p99 = 20.0;
    w.three_sigma = 16.0;

    EXPECT_DOUBLE_EQ(AnomalyDetector::scoreValue(11.0, w), 0.0);
    EXPECT_DOUBLE_EQ(AnomalyDetector::scoreValue(12.0, w), 0.0);
    EXPECT_DOUBLE_EQ(AnomalyDetector::scoreValue(16.0, w), 0.5);
    EXPECT_DOUBLE_EQ(AnomalyDetector::scoreValue(20.0, w), 1.0);
    EXPECT_DOUBLE_EQ(AnomalyDetector::scoreValue(1e9, w), 1.0);
    EXPECT_DOUBLE_EQ(AnomalyDetector::scoreValue(1e9, WindowThresholds{}), 0.0);
}

TEST(AnomalyDetectorTest, ValueFarBeyondEveryWindowIsAnomalous) {
    std::vector<MetricSample> samples;
    for (int i = 0; i < 20; ++i) {
        samples.push_back(sampleAt(NOW - 60 * i, 100.0 + i, 0.01, 50.0));
    }
    MetricThresholds thresholds = AnomalyDetector::computeThresholds(samples, NOW);

    AnomalyResult result = AnomalyDetector::detectAnomaly(10000.0, 0.01, 50.0, thresholds);
    EXPECT_DOUBLE_EQ(result.anomaly_score, 1.0);
    EXPECT_TRUE(result.is_anomalous);
    EXPECT_DOUBLE_EQ(result.metric_scores.at(MetricName::Latency), 1.0);
}

TEST(AnomalyDetectorTest, SteadyRecentTrafficIsNotAnomalous) {
    std::vector<MetricSample> samples = {
        sampleAt(NOW - 240, 100.0, 0.010, 50.0),
        sampleAt(NOW - 180, 102.0, 0.020, 52.0),
        sampleAt(NOW - 120, 98.0, 0.015, 49.0),
        sampleAt(NOW - 60, 101.0, 0.012, 51.0)
    };
    MetricThresholds thresholds = AnomalyDetector::computeThresholds(samples, NOW);
    EXPECT_GT(thresholds.latency_ms.at(TimeWindow::Day).p95, 0.0);
    EXPECT_GT(thresholds.error_rate.at(TimeWindow::Day).p95, 0.0);
    EXPECT_GT(thresholds.throughput.at(TimeWindow::Day).p95, 0.0);

    AnomalyResult result = AnomalyDetector::detectAnomaly(100.25, 0.01425, 50.5, thresholds);
    EXPECT_LT(result.anomaly_score, 0.7);
    EXPECT_FALSE(result.is_anomalous);
}

TEST(AnomalyDetectorTest, ScoresAreRoundedToFourDecimals) {
    WindowThresholds w;
    w.p95 = 0.0;
    w.two_sigma = 0.0;
    w.p99 = 3.0;
    w.three_sigma = 0.0;
    MetricThresholds thresholds;
    for (TimeWindow window : {TimeWindow::Day, TimeWindow::Week, TimeWindow::Month}) {
        thresholds.latency_ms[window] = w;
        thresholds.error_rate[window] = WindowThresholds{};
        thresholds.throughput[window] = WindowThresholds{};
    }

    AnomalyResult result = AnomalyDetector::detectAnomaly(1.0, 0.0, 0.0, thresholds);
    EXPECT_DOUBLE_EQ(result.anomaly_score, 0.3333);
}
