#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/signal_set.hpp> // For graceful shutdown
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp> // For make_work_guard

#include "config/AppConfig.hpp"
#include "core/CircuitBreaker.hpp"
#include "core/ProxyPoolManager.hpp"
#include "core/RateLimiter.hpp"
#include "core/RecalibrationController.hpp"
#include "core/RecalibrationScheduler.hpp"
#include "core/SystemClock.hpp"
#include "core/TcpHealthCheck.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/FileMetricsSource.hpp"
#include "metrics/LoggingMetricsSink.hpp"
#include "metrics/StatsDClient.hpp"
#include "metrics/StatsDMetricsSink.hpp"
#include "storage/InMemoryRateLimitStorage.hpp"
#include "storage/RedisRateLimitStorage.hpp"
#include "utils/Utils.hpp"

using namespace std;

namespace {
    constexpr auto HEALTH_PROBE_TIMEOUT = std::chrono::milliseconds(2000);
}

// --- Helper Function to Initialize Rate Limit Storage ---
std::shared_ptr<RateLimitStorage> initializeStorage(const AppConfig& config_, std::shared_ptr<ILogger> logger_) {
    if (config_.use_redis) {
        auto redis_storage = std::make_shared<RedisRateLimitStorage>(config_.redis_host, config_.redis_port, logger_);
        if (redis_storage->isConnected()) {
            logger_->setup("Redis rate limit storage connected successfully.");
            return redis_storage;
        }
        logger_->error("Redis unavailable at " + config_.redis_host + ":" + std::to_string(config_.redis_port) +
                       ". Falling back to in-memory storage.");
    }
    logger_->setup("Creating InMemoryRateLimitStorage.");
    return std::make_shared<InMemoryRateLimitStorage>(static_cast<size_t>(config_.in_memory_storage_max_size));
}

// --- Helper Function to Initialize the Metrics Sink ---
std::shared_ptr<IMetricsSink> initializeMetricsSink(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    if (config.metrics_backend == "statsd") {
        string statsd_server_endpoint;
        const char* statsd_server_value = std::getenv("STATSD_SERVER");
        if (statsd_server_value != nullptr) {
            statsd_server_endpoint = std::string(statsd_server_value);
        }
        logger_->setup("STATSD_SERVER endpoint : " + statsd_server_endpoint);

        try {
            if (!statsd_server_endpoint.empty()) {
                auto statsd_client = std::make_shared<StatsDClient>(config, logger_, statsd_server_endpoint);
                return std::make_shared<StatsDMetricsSink>(statsd_client, logger_);
            }
        } catch (const std::exception& e) {
            logger_->error("StatsDClient failed to get created: " + std::string(e.what()));
        }
        logger_->error("Falling back to logging metrics sink.");
    }
    return std::make_shared<LoggingMetricsSink>(logger_);
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        // Process command-line arguments.
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger(LogUtils::LogLevel::CERROR).error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        std::shared_ptr<ILogger> logger_ = std::make_shared<ConsoleLogger>(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IClock> clock = std::make_shared<SystemClock>();
        std::shared_ptr<IMetricsSink> metrics_sink = initializeMetricsSink(config_, logger_);
        std::shared_ptr<RateLimitStorage> storage = initializeStorage(config_, logger_);

        CircuitBreakerConfig breaker_config;
        breaker_config.max_failures = config_.circuit_max_failures;
        breaker_config.base_backoff_seconds = config_.circuit_base_backoff_seconds;
        breaker_config.max_backoff_seconds = config_.circuit_max_backoff_seconds;

        ProxyPoolOptions pool_options;
        pool_options.policy.max_consecutive_failures = config_.max_consecutive_failures;
        pool_options.policy.failure_cooldown_seconds = config_.failure_cooldown_seconds;
        pool_options.health_check = std::make_shared<TcpHealthCheck>(HEALTH_PROBE_TIMEOUT, breaker_config, logger_, clock);
        pool_options.health_check_interval_seconds = config_.health_check_interval_seconds;

        auto pool = ProxyPoolManager::fromFile(config_.proxy_list_path, pool_options, metrics_sink, logger_, clock);
        logger_->setup("ProxyPoolManager created with " + std::to_string(pool->size()) + " address(es).");

        auto rate_limiter = std::make_shared<RateLimiter>(storage, config_.endpoint_limits, config_.default_limit,
                                                          logger_, clock);
        LimitConfig anonymous_limit = rate_limiter->resolveLimit(Constants::WILDCARD_ENDPOINT, CallerClass::Anonymous);
        logger_->setup("RateLimiter ready. Anonymous limit: " + std::to_string(anonymous_limit.requests) + " request(s) / " +
                       std::to_string(anonymous_limit.window_seconds) + "s (" + strategyToString(anonymous_limit.strategy) + ").");

        auto metrics_source = std::make_shared<FileMetricsSource>(config_.metrics_samples_path, logger_);
        auto controller = std::make_shared<RecalibrationController>(metrics_source, pool, metrics_sink, logger_, clock);

        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc);

        RecalibrationScheduler scheduler(
            ioc, controller, std::chrono::seconds(config_.recalibration_interval_seconds), logger_,
            [pool, logger_](const RecalibrationPolicies& policies) {
                pool->runHealthChecks();
                logger_->info("recalibration_policies=" + policies.toJson().dump());
                logger_->info("pool_diagnostics=" + pool->diagnosticJson().dump());
            });
        scheduler.start();

        // SIGHUP asks for an immediate recalibration; SIGINT/SIGTERM shut down.
        boost::asio::signal_set reload_signals(ioc, SIGHUP);
        std::function<void(const boost::system::error_code&, int)> on_reload;
        on_reload = [&](const boost::system::error_code& ec, int) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            scheduler.triggerNow();
            reload_signals.async_wait(on_reload);
        };
        reload_signals.async_wait(on_reload);

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&](const boost::system::error_code&, int signal_number) {
                logger_->setup("Signal " + std::to_string(signal_number) + " received. Shutting down...");
                scheduler.stop();
                reload_signals.cancel();
                work_guard.reset();
                ioc.stop();
            });

        logger_->setup("egressguard running. Press Ctrl+C to exit.");
        ioc.run();
        logger_->setup("Main thread ioc.run() finished. Exiting.");
        return 0;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger(LogUtils::LogLevel::CERROR).error(ss.str());
        return 1;
    }
}
