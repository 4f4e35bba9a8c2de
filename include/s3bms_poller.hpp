/*
 * ============================================================================
 * S3 BMS DASHBOARD POLLER
 * ============================================================================
 *
 * The polling collaborator that drives the acquisition core from a UI or
 * CLI loop. Call tick() as often as convenient (every frame is fine):
 *
 *   - a finished request is joined; success replaces the snapshot and
 *     clears the fault, failure records the fault and keeps the previous
 *     snapshot on display
 *   - a request in flight longer than abandon_after_ms is dropped (its
 *     legs run to completion in the background) and recorded as ABANDONED
 *   - when nothing is in flight and poll_rate_ms has elapsed since the
 *     last start, a new cycle begins
 *
 * At most one request is in flight at a time.
 *
 * LICENSE: MIT
 *
 * ============================================================================
 */

#ifndef S3BMS_POLLER_HPP
#define S3BMS_POLLER_HPP

#include "s3bms_acquisition.hpp"
#include "s3bms_errors.hpp"
#include "s3bms_firmware_profile.hpp"
#include "s3bms_interfaces.hpp"
#include "s3bms_logging.hpp"
#include "s3bms_snapshot.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace s3bms {

// ============================================================================
// SETTINGS
// ============================================================================

struct PollerSettings {
    static constexpr int MIN_POLL_RATE_MS = 100;
    static constexpr int MAX_POLL_RATE_MS = 10000;

    std::string address = "192.168.0.200";
    int poll_rate_ms = 2000;
    bool sanitize = true;
    std::string profile = "standard";
    int abandon_after_ms = 0;  // 0 = wait for every cycle indefinitely

    bool validate() const {
        if (address.empty()) return false;
        if (poll_rate_ms < MIN_POLL_RATE_MS || poll_rate_ms > MAX_POLL_RATE_MS) return false;
        if (abandon_after_ms < 0) return false;
        return true;
    }

    // Brings an operator-entered rate back into range
    // Clamp in the wide type so out-of-range input never wraps
    static int clamp_poll_rate(long long ms) {
        return static_cast<int>(std::clamp<long long>(ms, MIN_POLL_RATE_MS, MAX_POLL_RATE_MS));
    }

    static int clamp_abandon_after(long long ms) {
        return static_cast<int>(
            std::clamp<long long>(ms, 0, std::numeric_limits<int>::max()));
    }

    void clamp() {
        poll_rate_ms = clamp_poll_rate(poll_rate_ms);
        abandon_after_ms = clamp_abandon_after(abandon_after_ms);
    }
};

// ============================================================================
// TIME SOURCE
// ============================================================================

class SteadyTimeSource final : public ITimeSource {
public:
    long long now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now().time_since_epoch())
            .count();
    }
};

// ============================================================================
// POLL FAULT
// ============================================================================

struct PollFault {
    enum class Kind { FETCH_FAILED, UNEXPECTED, ABANDONED };

    Kind kind = Kind::FETCH_FAILED;
    std::string message;
    long long at_ms = 0;
};

inline const char* to_string(PollFault::Kind kind) {
    switch (kind) {
        case PollFault::Kind::FETCH_FAILED: return "FETCH_FAILED";
        case PollFault::Kind::UNEXPECTED: return "UNEXPECTED";
        case PollFault::Kind::ABANDONED: return "ABANDONED";
    }
    return "UNKNOWN";
}

// ============================================================================
// POLLER
// ============================================================================

class DashboardPoller {
public:
    enum class TickResult { IDLE, STARTED, WAITING, UPDATED, FAILED, ABANDONED };

private:
    PollerSettings settings_;
    std::shared_ptr<IHttpTransport> transport_;
    std::shared_ptr<const ITimeSource> clock_;
    std::shared_ptr<ILogger> logger_;

    std::optional<FetchRequest> request_;
    long long request_started_ms_ = 0;
    long long last_poll_ms_ = 0;
    bool has_polled_ = false;

    std::shared_ptr<const Snapshot> snapshot_;
    std::optional<PollFault> fault_;
    unsigned long cycles_completed_ = 0;
    unsigned long cycles_failed_ = 0;

public:
    DashboardPoller(PollerSettings settings,
                    std::shared_ptr<IHttpTransport> transport,
                    std::shared_ptr<const ITimeSource> clock = std::make_shared<SteadyTimeSource>(),
                    std::shared_ptr<ILogger> logger = nullptr)
        : settings_(std::move(settings)),
          transport_(std::move(transport)),
          clock_(std::move(clock)),
          logger_(std::move(logger))
    {
        if (!settings_.validate()) {
            throw std::invalid_argument("Invalid PollerSettings parameters");
        }
        if (!transport_ || !clock_) {
            throw std::invalid_argument("DashboardPoller requires a transport and a clock");
        }
        profile_by_name(settings_.profile);  // reject unknown profiles up front
    }

    // Settings take effect from the next cycle
    void update_settings(PollerSettings settings) {
        settings.clamp();
        if (!settings.validate()) {
            throw std::invalid_argument("Invalid PollerSettings parameters");
        }
        profile_by_name(settings.profile);
        settings_ = std::move(settings);
    }

    TickResult tick() {
        const long long now = clock_->now_ms();

        if (request_) {
            if (request_->is_finished()) {
                return finish(now);
            }
            if (settings_.abandon_after_ms > 0 &&
                now - request_started_ms_ >= settings_.abandon_after_ms) {
                return abandon(now);
            }
            return TickResult::WAITING;
        }

        if (!has_polled_ || last_poll_ms_ + settings_.poll_rate_ms < now) {
            start(now);
            return TickResult::STARTED;
        }
        return TickResult::IDLE;
    }

    bool in_flight() const { return request_.has_value(); }

    const PollerSettings& settings() const { return settings_; }
    std::shared_ptr<const Snapshot> snapshot() const { return snapshot_; }
    const std::optional<PollFault>& fault() const { return fault_; }
    unsigned long cycles_completed() const { return cycles_completed_; }
    unsigned long cycles_failed() const { return cycles_failed_; }

private:
    void start(long long now) {
        AcquisitionOptions options;
        options.sanitize = settings_.sanitize;
        options.profile = profile_by_name(settings_.profile);
        options.logger = logger_;

        request_.emplace(fetch(transport_, settings_.address, options));
        request_started_ms_ = now;
        last_poll_ms_ = now;
        has_polled_ = true;
    }

    TickResult finish(long long now) {
        FetchRequest request = std::move(*request_);
        request_.reset();

        try {
            snapshot_ = std::make_shared<Snapshot>(request.join());
            fault_.reset();
            ++cycles_completed_;
            log_event(logger_, "poll cycle completed in " +
                                   std::to_string(now - request_started_ms_) + " ms");
            return TickResult::UPDATED;
        } catch (const FetchFailed& e) {
            record(PollFault::Kind::FETCH_FAILED, e.what(), now);
        } catch (const UnexpectedFailure& e) {
            record(PollFault::Kind::UNEXPECTED, e.what(), now);
        }
        return TickResult::FAILED;
    }

    TickResult abandon(long long now) {
        request_.reset();
        record(PollFault::Kind::ABANDONED,
               "no response from " + settings_.address + " within " +
                   std::to_string(settings_.abandon_after_ms) + " ms",
               now);
        return TickResult::ABANDONED;
    }

    void record(PollFault::Kind kind, const std::string& message, long long now) {
        PollFault fault;
        fault.kind = kind;
        fault.message = message;
        fault.at_ms = now;
        fault_ = std::move(fault);
        ++cycles_failed_;
        log_event(logger_, std::string("poll cycle ") + to_string(kind) + ": " + message);
    }
};

} // namespace s3bms

#endif // S3BMS_POLLER_HPP
