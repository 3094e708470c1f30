#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <string>

#include "ConsoleLogger.hpp"

namespace {
    std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::time_t t = system_clock::to_time_t(now);
        std::tm tm_buf{};
        gmtime_r(&t, &tm_buf);
        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
        return oss.str();
    }
}

void ConsoleLogger::write(std::ostream& stream, const std::string& prefix, const std::string& message) {
    std::lock_guard<std::mutex> lock(cout_mutex_);
    stream << timestamp() << ' ' << prefix << message << std::endl;
}

void ConsoleLogger::info(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::INFO) {
        write(out_, LogUtils::INFO_LOG_PREFIX, message);
    }
}

void ConsoleLogger::debug(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::DEBUG) {
        write(out_, LogUtils::DEBUG_LOG_PREFIX, message);
    }
}

void ConsoleLogger::warn(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::WARN) {
        write(out_, LogUtils::WARN_LOG_PREFIX, message);
    }
}

void ConsoleLogger::error(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::CERROR) {
        write(err_, LogUtils::CERROR_LOG_PREFIX, message);
    }
}

void ConsoleLogger::setup(const std::string& message) {
    write(out_, LogUtils::SETUP_LOG_PREFIX, message);
}

void ConsoleLogger::event(const std::string& name, const nlohmann::json& payload) {
    if (logLevel <= LogUtils::LogLevel::INFO) {
        // Non-finite numbers are serialized as null by nlohmann::json.
        write(out_, LogUtils::INFO_LOG_PREFIX, name + "=" + payload.dump());
    }
}
