#include "ProxyPoolManager.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "../config/AppConfig.hpp"
#include "../utils/Utils.hpp"

namespace {
    constexpr double PRUNE_COOLDOWN_MULTIPLIER = 10.0;

    nlohmann::json optionalToJson(const std::optional<double>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }
}

ProxyPoolManager::ProxyPoolManager(const std::vector<std::string>& addresses,
                                   ProxyPoolOptions options,
                                   std::shared_ptr<IMetricsSink> metrics_sink,
                                   std::shared_ptr<ILogger> logger,
                                   std::shared_ptr<IClock> clock)
    : policy_(options.policy),
      health_check_(std::move(options.health_check)),
      health_check_interval_seconds_(options.health_check_interval_seconds),
      metrics_sink_(metrics_sink),
      logger_(logger),
      clock_(clock) {
    if (!metrics_sink_) {
        throw std::invalid_argument("MetricsSink cannot be null for ProxyPoolManager");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for ProxyPoolManager");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for ProxyPoolManager");
    }
    for (const auto& address : addresses) {
        if (!address.empty() && records_.find(address) == records_.end()) {
            ensureRecordLocked(address);
        }
    }
    logger_->debug("ProxyPoolManager initialized with " + std::to_string(addresses_.size()) + " address(es)");
}

std::shared_ptr<ProxyPoolManager> ProxyPoolManager::fromFile(const std::string& path,
                                                             ProxyPoolOptions options,
                                                             std::shared_ptr<IMetricsSink> metrics_sink,
                                                             std::shared_ptr<ILogger> logger,
                                                             std::shared_ptr<IClock> clock) {
    std::vector<std::string> addresses = Utils::loadProxyList(path);
    if (addresses.empty() && logger) {
        logger->warn("No proxies loaded from '" + path + "'");
    }
    return std::make_shared<ProxyPoolManager>(addresses, std::move(options), metrics_sink, logger, clock);
}

std::optional<std::string> ProxyPoolManager::selectNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    const double now = clock_->now();

    maybeRunHealthChecksLocked(now);
    pruneLocked(now);

    const size_t total = addresses_.size();
    for (size_t attempt = 0; attempt < total; ++attempt) {
        const size_t index = cursor_ % total;
        cursor_ = (index + 1) % total;

        ProxyRecord& record = records_.at(addresses_[index]);
        if (record.active) {
            return record.address;
        }
        if (cooldownElapsedLocked(record, now)) {
            reactivateLocked(record);
            logger_->info("Proxy " + record.address + " reactivated after cooldown");
            return record.address;
        }
    }
    return std::nullopt;
}

void ProxyPoolManager::reportSuccess(const std::string& address, std::optional<double> duration_ms) {
    if (address.empty()) {
        return;
    }
    PendingEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const double now = clock_->now();
        ProxyRecord& record = ensureRecordLocked(address);
        record.successes += 1;
        record.requests += 1;
        record.consecutive_failures = 0;
        record.last_success_at = now;
        if (!record.active) {
            logger_->info("Proxy " + address + " reactivated by successful call");
        }
        reactivateLocked(record);
        if (duration_ms) {
            record.total_duration_ms += *duration_ms;
        }
        event = PendingEvent{MetricsDefinitions::PROXY_SUCCESS, {
            {"address", address},
            {"duration_ms", optionalToJson(duration_ms)},
            {"successes", record.successes},
            {"requests", record.requests}
        }};
    }
    emit(event);
}

void ProxyPoolManager::reportFailure(const std::string& address, std::optional<double> duration_ms) {
    if (address.empty()) {
        return;
    }
    PendingEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const double now = clock_->now();
        ProxyRecord& record = ensureRecordLocked(address);
        record.requests += 1;
        if (duration_ms) {
            record.total_duration_ms += *duration_ms;
        }
        recordFailureLocked(record, now);
        event = PendingEvent{MetricsDefinitions::PROXY_FAILURE, {
            {"address", address},
            {"duration_ms", optionalToJson(duration_ms)},
            {"failures", record.failures},
            {"consecutive_failures", record.consecutive_failures},
            {"active", record.active}
        }};
    }
    emit(event);
}

void ProxyPoolManager::setPolicies(int max_consecutive_failures, double failure_cooldown_seconds) {
    if (max_consecutive_failures < 1) {
        throw std::invalid_argument("max_consecutive_failures must be at least 1");
    }
    if (failure_cooldown_seconds < 0.0) {
        throw std::invalid_argument("failure_cooldown_seconds cannot be negative");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    policy_.max_consecutive_failures = max_consecutive_failures;
    policy_.failure_cooldown_seconds = failure_cooldown_seconds;
    logger_->info("Pool policy updated: max_consecutive_failures=" + std::to_string(max_consecutive_failures) +
                  " failure_cooldown_seconds=" + std::to_string(failure_cooldown_seconds));
}

PoolPolicy ProxyPoolManager::policy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_;
}

bool ProxyPoolManager::addAddress(const std::string& address) {
    if (address.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.find(address) != records_.end()) {
        return false;
    }
    ensureRecordLocked(address);
    return true;
}

void ProxyPoolManager::runHealthChecks() {
    std::lock_guard<std::mutex> lock(mutex_);
    runHealthChecksLocked(clock_->now());
}

std::map<std::string, ProxyRecord> ProxyPoolManager::snapshotMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::map<std::string, ProxyRecord>(records_.begin(), records_.end());
}

std::map<std::string, ProxyDiagnostic> ProxyPoolManager::diagnosticSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ProxyDiagnostic> result;
    for (const auto& [address, record] : records_) {
        const double requests = static_cast<double>(std::max(1L, record.requests));
        ProxyDiagnostic diagnostic;
        diagnostic.address = address;
        diagnostic.successes = record.successes;
        diagnostic.failures = record.failures;
        diagnostic.consecutive_failures = record.consecutive_failures;
        diagnostic.requests = record.requests;
        diagnostic.avg_latency_ms = record.total_duration_ms / requests;
        diagnostic.error_rate = static_cast<double>(record.failures) / requests;
        diagnostic.availability = record.active ? 1.0 : 0.0;
        diagnostic.active = record.active;
        diagnostic.last_success_at = record.last_success_at;
        diagnostic.last_failure_at = record.last_failure_at;
        result.emplace(address, diagnostic);
    }
    return result;
}

nlohmann::json ProxyPoolManager::diagnosticJson() const {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& [address, diagnostic] : diagnosticSnapshot()) {
        result[address] = {
            {"successes", diagnostic.successes},
            {"failures", diagnostic.failures},
            {"consecutive_failures", diagnostic.consecutive_failures},
            {"requests", diagnostic.requests},
            {"avg_latency_ms", diagnostic.avg_latency_ms},
            {"error_rate", diagnostic.error_rate},
            {"availability", diagnostic.availability},
            {"active", diagnostic.active},
            {"last_success_at", optionalToJson(diagnostic.last_success_at)},
            {"last_failure_at", optionalToJson(diagnostic.last_failure_at)}
        };
    }
    return result;
}

size_t ProxyPoolManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return addresses_.size();
}

// --- Private helpers. All of them expect mutex_ to be held. ---

ProxyRecord& ProxyPoolManager::ensureRecordLocked(const std::string& address) {
    auto it = records_.find(address);
    if (it != records_.end()) {
        return it->second;
    }
    ProxyRecord record;
    record.address = address;
    addresses_.push_back(address);
    return records_.emplace(address, std::move(record)).first->second;
}

bool ProxyPoolManager::cooldownElapsedLocked(const ProxyRecord& record, double now) const {
    if (!record.last_failure_at) {
        return true;
    }
    return now - *record.last_failure_at >= policy_.failure_cooldown_seconds;
}

void ProxyPoolManager::deactivateLocked(ProxyRecord& record, double now) {
    if (record.active) {
        logger_->warn("Proxy " + record.address + " deactivated after " +
                      std::to_string(record.consecutive_failures) + " consecutive failure(s)");
        record.inactive_since = now;
    }
    record.active = false;
}

void ProxyPoolManager::reactivateLocked(ProxyRecord& record) {
    record.active = true;
    record.consecutive_failures = 0;
    record.inactive_since.reset();
}

void ProxyPoolManager::recordFailureLocked(ProxyRecord& record, double now) {
    record.failures += 1;
    record.consecutive_failures += 1;
    record.last_failure_at = now;
    if (record.consecutive_failures >= policy_.max_consecutive_failures) {
        deactivateLocked(record, now);
    }
}

void ProxyPoolManager::maybeRunHealthChecksLocked(double now) {
    if (!health_check_) {
        return;
    }
    if (last_health_check_at_ && now - *last_health_check_at_ < health_check_interval_seconds_) {
        return;
    }
    runHealthChecksLocked(now);
}

void ProxyPoolManager::runHealthChecksLocked(double now) {
    if (!health_check_) {
        return;
    }
    last_health_check_at_ = now;
    for (const auto& address : addresses_) {
        bool healthy = false;
        try {
            healthy = health_check_->probe(address);
        } catch (const std::exception& e) {
            logger_->warn("Health check for " + address + " threw: " + e.what());
        } catch (...) {
            logger_->warn("Health check for " + address + " threw a non-standard exception");
        }

        ProxyRecord& record = records_.at(address);
        if (healthy) {
            if (!record.active) {
                logger_->info("Proxy " + address + " reactivated by health check");
            }
            reactivateLocked(record);
            record.last_success_at = now;
        } else {
            recordFailureLocked(record, now);
        }
    }
}

void ProxyPoolManager::pruneLocked(double now) {
    const double cooldown = policy_.failure_cooldown_seconds;
    if (cooldown <= 0.0) {
        return;
    }
    const double prune_after = PRUNE_COOLDOWN_MULTIPLIER * cooldown;

    size_t index = 0;
    while (index < addresses_.size()) {
        const ProxyRecord& record = records_.at(addresses_[index]);
        const bool expired = !record.active && record.inactive_since &&
                             now - *record.inactive_since >= prune_after;
        if (!expired) {
            ++index;
            continue;
        }
        logger_->info("Proxy " + record.address + " pruned after staying inactive for " +
                      std::to_string(prune_after) + "s");
        records_.erase(addresses_[index]);
        addresses_.erase(addresses_.begin() + static_cast<std::ptrdiff_t>(index));
        if (index < cursor_) {
            --cursor_;
        }
    }
    if (!addresses_.empty()) {
        cursor_ %= addresses_.size();
    } else {
        cursor_ = 0;
    }
}

void ProxyPoolManager::emit(const PendingEvent& event) {
    try {
        metrics_sink_->emit(event.name, event.payload);
    } catch (const std::exception& e) {
        logger_->error("Failed to emit '" + event.name + "' telemetry: " + e.what());
    }
}
