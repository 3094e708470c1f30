#include "AnomalyDetector.hpp"

#include <algorithm>
#include <cmath>

namespace {
    const TimeWindow ALL_WINDOWS[] = {TimeWindow::Day, TimeWindow::Week, TimeWindow::Month};
    const MetricName ALL_METRICS[] = {MetricName::Latency, MetricName::ErrorRate, MetricName::Throughput};

    double percentile(const std::vector<double>& sorted_values, double q) {
        if (sorted_values.empty()) {
            return 0.0;
        }
        const size_t index = static_cast<size_t>(std::floor(q * static_cast<double>(sorted_values.size() - 1)));
        return sorted_values[std::min(index, sorted_values.size() - 1)];
    }

    double roundTo4(double value) {
        return std::round(value * 10000.0) / 10000.0;
    }
}

WindowThresholds AnomalyDetector::thresholdsFor(std::vector<double> values) {
    WindowThresholds result;
    if (values.empty()) {
        return result;
    }
    std::sort(values.begin(), values.end());
    result.p95 = percentile(values, 0.95);
    result.p99 = percentile(values, 0.99);

    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    const double mean = sum / static_cast<double>(values.size());
    double squared = 0.0;
    for (double v : values) {
        squared += (v - mean) * (v - mean);
    }
    // Population standard deviation.
    const double sigma = std::sqrt(squared / static_cast<double>(values.size()));
    result.two_sigma = mean + 2.0 * sigma;
    result.three_sigma = mean + 3.0 * sigma;
    return result;
}

MetricThresholds AnomalyDetector::computeThresholds(const std::vector<MetricSample>& samples, double now) {
    MetricThresholds thresholds;
    for (TimeWindow window : ALL_WINDOWS) {
        const double cutoff = now - static_cast<double>(windowSeconds(window));
        std::vector<double> latency;
        std::vector<double> errors;
        std::vector<double> throughput;
        for (const auto& sample : samples) {
            if (sample.timestamp >= cutoff) {
                latency.push_back(sample.latency_ms);
                errors.push_back(sample.error_rate);
                throughput.push_back(sample.throughput);
            }
        }
        thresholds.latency_ms[window] = thresholdsFor(std::move(latency));
        thresholds.error_rate[window] = thresholdsFor(std::move(errors));
        thresholds.throughput[window] = thresholdsFor(std::move(throughput));
    }
    return thresholds;
}

double AnomalyDetector::scoreValue(double value, const WindowThresholds& window) {
    if (window.p95 == 0.0 && window.p99 == 0.0 && window.two_sigma == 0.0 && window.three_sigma == 0.0) {
        return 0.0;
    }
    const double base = std::max(window.p95, window.two_sigma);
    const double extreme = std::max(window.p99, window.three_sigma);
    if (value <= base) {
        return 0.0;
    }
    if (value >= extreme) {
        return 1.0;
    }
    return (value - base) / (extreme - base);
}

AnomalyResult AnomalyDetector::detectAnomaly(double latency_ms,
                                             double error_rate,
                                             double throughput,
                                             const MetricThresholds& thresholds) {
    AnomalyResult result;
    for (MetricName metric : ALL_METRICS) {
        double value = latency_ms;
        if (metric == MetricName::ErrorRate) {
            value = error_rate;
        } else if (metric == MetricName::Throughput) {
            value = throughput;
        }

        double metric_score = 0.0;
        const auto& windows = thresholds.forMetric(metric);
        for (TimeWindow window : ALL_WINDOWS) {
            auto it = windows.find(window);
            if (it != windows.end()) {
                metric_score = std::max(metric_score, scoreValue(value, it->second));
            }
        }
        result.metric_scores[metric] = roundTo4(metric_score);
        result.anomaly_score = std::max(result.anomaly_score, metric_score);
    }
    result.anomaly_score = roundTo4(result.anomaly_score);
    result.is_anomalous = result.anomaly_score >= ANOMALY_THRESHOLD;
    return result;
}
