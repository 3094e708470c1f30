#ifndef METRICSAMPLE_HPP
#define METRICSAMPLE_HPP

#include <map>

struct MetricSample {
    double timestamp = 0.0;
    double latency_ms = 0.0;
    double error_rate = 0.0;
    double throughput = 0.0;
};

enum class MetricName {
    Latency,
    ErrorRate,
    Throughput
};

enum class TimeWindow {
    Day,
    Week,
    Month
};

struct WindowThresholds {
    double p95 = 0.0;
    double p99 = 0.0;
    double two_sigma = 0.0;
    double three_sigma = 0.0;
};

struct MetricThresholds {
    std::map<TimeWindow, WindowThresholds> latency_ms;
    std::map<TimeWindow, WindowThresholds> error_rate;
    std::map<TimeWindow, WindowThresholds> throughput;

    const std::map<TimeWindow, WindowThresholds>& forMetric(MetricName metric) const {
        switch (metric) {
        case MetricName::Latency: return latency_ms;
        case MetricName::ErrorRate: return error_rate;
        case MetricName::Throughput: return throughput;
        }
        return latency_ms;
    }
};

struct AnomalyResult {
    double anomaly_score = 0.0;
    bool is_anomalous = false;
    std::map<MetricName, double> metric_scores;
};

inline int windowSeconds(TimeWindow window) {
    switch (window) {
    case TimeWindow::Day: return 24 * 60 * 60;
    case TimeWindow::Week: return 7 * 24 * 60 * 60;
    case TimeWindow::Month: return 30 * 24 * 60 * 60;
    }
    return 0;
}

inline const char* windowToString(TimeWindow window) {
    switch (window) {
    case TimeWindow::Day: return "24h";
    case TimeWindow::Week: return "7d";
    case TimeWindow::Month: return "30d";
    }
    return "24h";
}

inline const char* metricToString(MetricName metric) {
    switch (metric) {
    case MetricName::Latency: return "latency_ms";
    case MetricName::ErrorRate: return "error_rate";
    case MetricName::Throughput: return "throughput";
    }
    return "latency_ms";
}

#endif // METRICSAMPLE_HPP
