#ifndef RECALIBRATIONCONTROLLER_HPP
#define RECALIBRATIONCONTROLLER_HPP

#include <memory>
#include <mutex>
#include <vector>

#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IMetricsSink.hpp"
#include "../interfaces/IMetricsSource.hpp"
#include "../models/MetricSample.hpp"
#include "../models/RecalibrationPolicies.hpp"
#include "AnomalyDetector.hpp"
#include "ProxyPoolManager.hpp"

// Retunes the pool policy from up to 30 days of metric history.
//
// run() is serialized: a timer tick and a manual trigger that overlap execute
// one after the other.
class RecalibrationController {
public:
    RecalibrationController(std::shared_ptr<IMetricsSource> metrics_source,
                            std::shared_ptr<ProxyPoolManager> pool,
                            std::shared_ptr<IMetricsSink> metrics_sink,
                            std::shared_ptr<ILogger> logger,
                            std::shared_ptr<IClock> clock);

    RecalibrationPolicies run();

    // Pure policy derivation from 24h thresholds and the anomaly score.
    static RecalibrationPolicies derivePolicies(const MetricThresholds& thresholds, double anomaly_score);

private:
    static MetricSample averageOf(const std::vector<MetricSample>& samples);

    std::shared_ptr<IMetricsSource> metrics_source_;
    std::shared_ptr<ProxyPoolManager> pool_;
    std::shared_ptr<IMetricsSink> metrics_sink_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IClock> clock_;
    std::mutex run_mutex_;
};

#endif // RECALIBRATIONCONTROLLER_HPP
