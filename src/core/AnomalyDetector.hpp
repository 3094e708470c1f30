#ifndef ANOMALYDETECTOR_HPP
#define ANOMALYDETECTOR_HPP

#include <vector>

#include "../models/MetricSample.hpp"

// Stateless threshold computation and scoring over historical samples.
class AnomalyDetector {
public:
    static constexpr double ANOMALY_THRESHOLD = 0.7;

    // Percentile and sigma thresholds for every metric over the 24h, 7d and
    // 30d windows ending at now. Empty windows produce all-zero thresholds.
    static MetricThresholds computeThresholds(const std::vector<MetricSample>& samples, double now);

    static AnomalyResult detectAnomaly(double latency_ms,
                                       double error_rate,
                                       double throughput,
                                       const MetricThresholds& thresholds);

    // 0 at or below max(p95, 2 sigma), 1 at or above max(p99, 3 sigma),
    // linear in between.
    static double scoreValue(double value, const WindowThresholds& window);

    static WindowThresholds thresholdsFor(std::vector<double> values);
};

#endif // ANOMALYDETECTOR_HPP
