#include "RecalibrationController.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"

using json = nlohmann::json;

namespace {
    constexpr double MIN_BASE_COOLDOWN = 30.0;
    constexpr double MAX_BASE_COOLDOWN = 900.0;
    constexpr double DAMPENED_COOLDOWN_CAP = 1200.0;
    constexpr double SEVERE_ANOMALY_SCORE = 0.9;
}

RecalibrationController::RecalibrationController(std::shared_ptr<IMetricsSource> metrics_source,
                                                 std::shared_ptr<ProxyPoolManager> pool,
                                                 std::shared_ptr<IMetricsSink> metrics_sink,
                                                 std::shared_ptr<ILogger> logger,
                                                 std::shared_ptr<IClock> clock)
    : metrics_source_(metrics_source),
      pool_(pool),
      metrics_sink_(metrics_sink),
      logger_(logger),
      clock_(clock) {
    if (!metrics_source_) {
        throw std::invalid_argument("MetricsSource cannot be null for RecalibrationController");
    }
    if (!pool_) {
        throw std::invalid_argument("ProxyPoolManager cannot be null for RecalibrationController");
    }
    if (!metrics_sink_) {
        throw std::invalid_argument("MetricsSink cannot be null for RecalibrationController");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RecalibrationController");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for RecalibrationController");
    }
}

MetricSample RecalibrationController::averageOf(const std::vector<MetricSample>& samples) {
    MetricSample mean;
    for (const auto& sample : samples) {
        mean.latency_ms += sample.latency_ms;
        mean.error_rate += sample.error_rate;
        mean.throughput += sample.throughput;
    }
    const double count = static_cast<double>(samples.size());
    mean.latency_ms /= count;
    mean.error_rate /= count;
    mean.throughput /= count;
    return mean;
}

RecalibrationPolicies RecalibrationController::derivePolicies(const MetricThresholds& thresholds, double anomaly_score) {
    const WindowThresholds& latency = thresholds.latency_ms.at(TimeWindow::Day);
    const WindowThresholds& errors = thresholds.error_rate.at(TimeWindow::Day);

    RecalibrationPolicies policies;
    int base_cooldown = static_cast<int>(std::max(MIN_BASE_COOLDOWN, std::min(MAX_BASE_COOLDOWN, latency.p95 / 5.0)));
    policies.max_cooldown = static_cast<int>(std::max(base_cooldown * 5.0, latency.p99 / 3.0));

    if (errors.p99 >= 0.20) {
        policies.max_failures = 1;
        policies.retry_attempts = 2;
        policies.timeout_seconds = 15;
    } else if (errors.p99 >= 0.10) {
        policies.max_failures = 2;
        policies.retry_attempts = 3;
        policies.timeout_seconds = 12;
    } else {
        policies.max_failures = 3;
        policies.retry_attempts = 4;
        policies.timeout_seconds = 10;
    }

    if (anomaly_score >= SEVERE_ANOMALY_SCORE) {
        base_cooldown = static_cast<int>(std::min(DAMPENED_COOLDOWN_CAP, base_cooldown * 2.0));
        policies.max_failures = std::max(1, policies.max_failures - 1);
    } else if (anomaly_score >= AnomalyDetector::ANOMALY_THRESHOLD) {
        base_cooldown = static_cast<int>(std::min(DAMPENED_COOLDOWN_CAP, base_cooldown * 1.5));
    }
    policies.base_cooldown = base_cooldown;
    return policies;
}

RecalibrationPolicies RecalibrationController::run() {
    std::lock_guard<std::mutex> lock(run_mutex_);
    auto start = std::chrono::steady_clock::now();
    const double now = clock_->now();

    std::vector<MetricSample> samples = metrics_source_->fetchSamples(Constants::RECALIBRATION_HISTORY_SECONDS, now);
    if (samples.empty()) {
        logger_->warn("No metric history available; keeping default recalibration policies");
        return RecalibrationPolicies{};
    }

    const MetricSample current = averageOf(samples);
    const MetricThresholds thresholds = AnomalyDetector::computeThresholds(samples, now);
    const AnomalyResult anomaly = AnomalyDetector::detectAnomaly(current.latency_ms, current.error_rate,
                                                                 current.throughput, thresholds);

    RecalibrationPolicies policies = derivePolicies(thresholds, anomaly.anomaly_score);
    pool_->setPolicies(policies.max_failures, static_cast<double>(policies.base_cooldown));

    const double duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    std::stringstream ss;
    ss << "Recalibrated from " << samples.size() << " sample(s): anomaly_score=" << anomaly.anomaly_score
       << " max_failures=" << policies.max_failures << " base_cooldown=" << policies.base_cooldown;
    logger_->info(ss.str());

    try {
        metrics_sink_->emit(MetricsDefinitions::RECALIBRATION_UPDATE, json{
            {"anomaly_score", anomaly.anomaly_score},
            {"policies", policies.toJson()},
            {"duration_ms", duration_ms}
        });
    } catch (const std::exception& e) {
        logger_->error("Failed to emit '" + MetricsDefinitions::RECALIBRATION_UPDATE + "' telemetry: " + e.what());
    }
    return policies;
}
