#ifndef FILEMETRICSSOURCE_HPP
#define FILEMETRICSSOURCE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IMetricsSource.hpp"

// Reads samples from a JSON-lines file, one object per line:
//   {"ts": 1700000000.5, "latency_ms": 120.0, "error_rate": 0.02, "throughput": 0.9}
// The file is re-read on every fetch so an external exporter can append to it.
class FileMetricsSource : public IMetricsSource {
public:
    FileMetricsSource(std::string path, std::shared_ptr<ILogger> logger);

    std::vector<MetricSample> fetchSamples(int since_seconds, double now) override;

    // Returns nullopt for lines that are not a sample object.
    static std::optional<MetricSample> parseLine(const std::string& line);

private:
    std::string path_;
    std::shared_ptr<ILogger> logger_;
};

#endif // FILEMETRICSSOURCE_HPP
