#include "RecalibrationScheduler.hpp"

#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>

RecalibrationScheduler::RecalibrationScheduler(net::io_context& ioc,
                                               std::shared_ptr<RecalibrationController> controller,
                                               std::chrono::seconds interval,
                                               std::shared_ptr<ILogger> logger,
                                               CycleCallback on_cycle)
    : ioc_(ioc),
      timer_(ioc),
      controller_(controller),
      interval_(interval),
      logger_(logger),
      on_cycle_(std::move(on_cycle)) {
    if (!controller_) {
        throw std::invalid_argument("RecalibrationController cannot be null for RecalibrationScheduler");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RecalibrationScheduler");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Recalibration interval must be positive");
    }
}

void RecalibrationScheduler::start() {
    stopped_ = false;
    logger_->setup("Recalibration scheduled every " + std::to_string(interval_.count()) + "s");
    net::post(ioc_, [this]() {
        runOnce();
        arm();
    });
}

void RecalibrationScheduler::triggerNow() {
    net::post(ioc_, [this]() {
        logger_->info("On-demand recalibration triggered");
        runOnce();
    });
}

void RecalibrationScheduler::stop() {
    stopped_ = true;
    timer_.cancel();
}

void RecalibrationScheduler::arm() {
    if (stopped_) {
        return;
    }
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) {
            logger_->debug("Recalibration timer cancelled.");
            return;
        }
        if (ec) {
            logger_->error("Recalibration timer error: " + ec.message());
            return;
        }
        if (stopped_) {
            return;
        }
        runOnce();
        arm();
    });
}

void RecalibrationScheduler::runOnce() {
    try {
        RecalibrationPolicies policies = controller_->run();
        if (on_cycle_) {
            on_cycle_(policies);
        }
    } catch (const std::exception& e) {
        logger_->error("Recalibration run failed: " + std::string(e.what()));
    }
    ++cycles_completed_;
}
