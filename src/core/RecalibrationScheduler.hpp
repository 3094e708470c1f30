#ifndef RECALIBRATIONSCHEDULER_HPP
#define RECALIBRATIONSCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../interfaces/ILogger.hpp"
#include "../models/RecalibrationPolicies.hpp"
#include "RecalibrationController.hpp"

namespace net = boost::asio;

// Drives RecalibrationController on an io_context: once at start, then every
// interval. triggerNow() queues an extra run on the same executor. The
// scheduler must outlive the io_context's handlers (stop() and let run()
// return before destroying it).
class RecalibrationScheduler {
public:
    using CycleCallback = std::function<void(const RecalibrationPolicies&)>;

    RecalibrationScheduler(net::io_context& ioc,
                           std::shared_ptr<RecalibrationController> controller,
                           std::chrono::seconds interval,
                           std::shared_ptr<ILogger> logger,
                           CycleCallback on_cycle = nullptr);

    RecalibrationScheduler(const RecalibrationScheduler&) = delete;
    RecalibrationScheduler& operator=(const RecalibrationScheduler&) = delete;

    void start();
    void triggerNow();
    void stop();

    // Completed runs, failed ones included.
    int cyclesCompleted() const { return cycles_completed_.load(); }

private:
    void arm();
    void runOnce();

    net::io_context& ioc_;
    net::steady_timer timer_;
    std::shared_ptr<RecalibrationController> controller_;
    std::chrono::seconds interval_;
    std::shared_ptr<ILogger> logger_;
    CycleCallback on_cycle_;
    std::atomic<bool> stopped_{true};
    std::atomic<int> cycles_completed_{0};
};

#endif // RECALIBRATIONSCHEDULER_HPP
