#pragma once

#include <mutex>
#include <utility>
#include <vector>

#include "../interfaces/IMetricsSource.hpp"

// Holds samples in memory; used by tests and local runs.
class InMemoryMetricsSource : public IMetricsSource {
public:
    InMemoryMetricsSource() = default;
    explicit InMemoryMetricsSource(std::vector<MetricSample> samples) : samples_(std::move(samples)) {}

    void add(const MetricSample& sample) {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.push_back(sample);
    }

    std::vector<MetricSample> fetchSamples(int since_seconds, double now) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const double cutoff = now - static_cast<double>(since_seconds);
        std::vector<MetricSample> result;
        for (const auto& sample : samples_) {
            if (sample.timestamp >= cutoff) {
                result.push_back(sample);
            }
        }
        return result;
    }

private:
    std::mutex mutex_;
    std::vector<MetricSample> samples_;
};
