#ifndef PROXYPOOLMANAGER_HPP
#define PROXYPOOLMANAGER_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "../interfaces/IClock.hpp"
#include "../interfaces/IHealthCheck.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IMetricsSink.hpp"
#include "../models/ProxyRecord.hpp"

struct ProxyPoolOptions {
    PoolPolicy policy;
    std::shared_ptr<IHealthCheck> health_check; // optional
    double health_check_interval_seconds = 30.0;
};

// Owns the upstream addresses and their health statistics.
//
// Selection is a health-aware round robin: the cursor always moves past every
// address it inspects, inactive addresses are skipped until their cooldown has
// elapsed, and an address that stays inactive for ten cooldowns is pruned.
// Every public operation runs under one mutex per instance.
class ProxyPoolManager {
public:
    ProxyPoolManager(const std::vector<std::string>& addresses,
                     ProxyPoolOptions options,
                     std::shared_ptr<IMetricsSink> metrics_sink,
                     std::shared_ptr<ILogger> logger,
                     std::shared_ptr<IClock> clock);

    // Loads one address per line; blank lines and '#' comments are skipped.
    static std::shared_ptr<ProxyPoolManager> fromFile(const std::string& path,
                                                      ProxyPoolOptions options,
                                                      std::shared_ptr<IMetricsSink> metrics_sink,
                                                      std::shared_ptr<ILogger> logger,
                                                      std::shared_ptr<IClock> clock);

    ProxyPoolManager(const ProxyPoolManager&) = delete;
    ProxyPoolManager& operator=(const ProxyPoolManager&) = delete;

    // Next eligible address, or nullopt when the pool is empty or every
    // address is cooling down.
    std::optional<std::string> selectNext();

    void reportSuccess(const std::string& address, std::optional<double> duration_ms = std::nullopt);
    void reportFailure(const std::string& address, std::optional<double> duration_ms = std::nullopt);

    void setPolicies(int max_consecutive_failures, double failure_cooldown_seconds);
    PoolPolicy policy() const;

    // Returns false if the address is already tracked.
    bool addAddress(const std::string& address);

    // Probes every address now, regardless of the configured interval.
    void runHealthChecks();

    // Deep copies; mutating them never touches live state.
    std::map<std::string, ProxyRecord> snapshotMetrics() const;
    std::map<std::string, ProxyDiagnostic> diagnosticSnapshot() const;
    nlohmann::json diagnosticJson() const;

    size_t size() const;

private:
    struct PendingEvent {
        std::string name;
        nlohmann::json payload;
    };

    ProxyRecord& ensureRecordLocked(const std::string& address);
    bool cooldownElapsedLocked(const ProxyRecord& record, double now) const;
    void deactivateLocked(ProxyRecord& record, double now);
    void reactivateLocked(ProxyRecord& record);
    void recordFailureLocked(ProxyRecord& record, double now);
    void maybeRunHealthChecksLocked(double now);
    void runHealthChecksLocked(double now);
    void pruneLocked(double now);
    void emit(const PendingEvent& event);

    std::vector<std::string> addresses_;
    std::unordered_map<std::string, ProxyRecord> records_;
    size_t cursor_ = 0;
    PoolPolicy policy_;
    std::shared_ptr<IHealthCheck> health_check_;
    double health_check_interval_seconds_;
    std::optional<double> last_health_check_at_;

    std::shared_ptr<IMetricsSink> metrics_sink_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IClock> clock_;
    mutable std::mutex mutex_;
};

#endif // PROXYPOOLMANAGER_HPP
