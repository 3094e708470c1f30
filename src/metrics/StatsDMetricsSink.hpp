#ifndef STATSDMETRICSSINK_HPP
#define STATSDMETRICSSINK_HPP

#include <memory>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IMetricsSink.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Maps structured events onto StatsD: one counter per event plus a gauge for
// every numeric or boolean payload field. Nested objects are flattened one
// level ("policies.max_failures"); strings and arrays are skipped.
class StatsDMetricsSink : public IMetricsSink {
public:
    StatsDMetricsSink(std::shared_ptr<IStatsDClient> statsd_client, std::shared_ptr<ILogger> logger);

    void emit(const std::string& event, const nlohmann::json& payload) override;

private:
    void publishField(const std::string& key, const nlohmann::json& value);

    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<ILogger> logger_;
};

#endif // STATSDMETRICSSINK_HPP
