#pragma once

#include <vector>

#include "../models/MetricSample.hpp"

class IMetricsSource {
public:
    virtual ~IMetricsSource() = default;

    // Samples with timestamp in [now - since_seconds, now]. Order is unspecified.
    virtual std::vector<MetricSample> fetchSamples(int since_seconds, double now) = 0;
};
