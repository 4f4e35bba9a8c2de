#ifndef S3BMS_LOGGING_HPP
#define S3BMS_LOGGING_HPP

#include "s3bms_interfaces.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace s3bms {

// ============================================================================
// CONSOLE LOGGER
// ============================================================================
//
// Timestamped lines on an ostream (std::cerr by default). Safe to share
// between legs running on different threads.

class ConsoleLogger final : public ILogger {
    std::ostream& out_;
    std::string tag_;
    std::mutex mutex_;

public:
    explicit ConsoleLogger(std::ostream& out = std::cerr, std::string tag = "s3bms")
        : out_(out), tag_(std::move(tag)) {}

    void log_event(const std::string& message) override {
        std::string line = "[" + tag_ + " " + timestamp() + "] " + message + "\n";
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << line << std::flush;
    }

private:
    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&t, &local);

        std::ostringstream ss;
        ss << std::put_time(&local, "%H:%M:%S") << "."
           << std::setw(3) << std::setfill('0') << ms.count();
        return ss.str();
    }
};

// Null-safe helper; a missing logger disables logging
inline void log_event(const std::shared_ptr<ILogger>& logger, const std::string& message) {
    if (logger) logger->log_event(message);
}

} // namespace s3bms

#endif // S3BMS_LOGGING_HPP
