#include "FileMetricsSource.hpp"

#include <fstream>
#include <stdexcept>

FileMetricsSource::FileMetricsSource(std::string path, std::shared_ptr<ILogger> logger)
    : path_(std::move(path)), logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for FileMetricsSource");
    }
}

std::optional<MetricSample> FileMetricsSource::parseLine(const std::string& line) {
    nlohmann::json parsed = nlohmann::json::parse(line, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    auto ts = parsed.find("ts");
    if (ts == parsed.end() || !ts->is_number()) {
        return std::nullopt;
    }

    MetricSample sample;
    sample.timestamp = ts->get<double>();
    sample.latency_ms = parsed.value("latency_ms", 0.0);
    sample.error_rate = parsed.value("error_rate", 0.0);
    sample.throughput = parsed.value("throughput", 0.0);
    return sample;
}

std::vector<MetricSample> FileMetricsSource::fetchSamples(int since_seconds, double now) {
    std::vector<MetricSample> samples;
    std::ifstream file(path_);
    if (!file.is_open()) {
        logger_->warn("FileMetricsSource: cannot open " + path_ + ", no samples available");
        return samples;
    }

    const double cutoff = now - static_cast<double>(since_seconds);
    std::string line;
    size_t line_number = 0;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        std::optional<MetricSample> sample;
        try {
            sample = parseLine(line);
        } catch (const nlohmann::json::exception& e) {
            logger_->debug("FileMetricsSource: " + path_ + ":" + std::to_string(line_number) + ": " + e.what());
        }
        if (!sample) {
            ++skipped;
            continue;
        }
        if (sample->timestamp >= cutoff && sample->timestamp <= now) {
            samples.push_back(*sample);
        }
    }
    if (skipped > 0) {
        logger_->warn("FileMetricsSource: skipped " + std::to_string(skipped) + " malformed line(s) in " + path_);
    }
    return samples;
}
