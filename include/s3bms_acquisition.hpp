/*
 * ============================================================================
 * S3 BMS ACQUISITION ORCHESTRATOR v1.0
 * ============================================================================
 *
 * Runs the three legs of a poll cycle concurrently and joins them into one
 * immutable Snapshot.
 *
 * STATE MACHINE:
 *   Idle --fetch()--> FetchesInFlight --join()--> Complete | Failed
 *
 * THREAD MODEL:
 *   - one detached std::thread per leg, wrapped in a std::packaged_task
 *   - legs share nothing mutable; each owns its address and plan copies
 *     and holds its own reference to the transport
 *   - is_finished() only inspects the legs' futures
 *   - destroying an un-joined FetchRequest abandons the legs without
 *     blocking; there is no cancellation signal
 *
 * INTEGRATION:
 *   auto transport = std::make_shared<s3bms::net::PosixHttpTransport>();
 *   auto request = s3bms::fetch(transport, "192.168.0.200", true);
 *   // ... keep the UI responsive ...
 *   if (request.is_finished()) {
 *       s3bms::Snapshot snapshot = request.join();
 *   }
 *
 * LICENSE: MIT
 * VERSION: 1.0.0
 *
 * ============================================================================
 */

#ifndef S3BMS_ACQUISITION_HPP
#define S3BMS_ACQUISITION_HPP

#include "s3bms_errors.hpp"
#include "s3bms_firmware_profile.hpp"
#include "s3bms_interfaces.hpp"
#include "s3bms_legs.hpp"
#include "s3bms_logging.hpp"
#include "s3bms_snapshot.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace s3bms {

// ============================================================================
// VERSION INFORMATION
// ============================================================================

constexpr int S3BMS_VERSION_MAJOR = 1;
constexpr int S3BMS_VERSION_MINOR = 0;
constexpr int S3BMS_VERSION_PATCH = 0;

inline std::string get_version_string() {
    return std::to_string(S3BMS_VERSION_MAJOR) + "." +
           std::to_string(S3BMS_VERSION_MINOR) + "." +
           std::to_string(S3BMS_VERSION_PATCH);
}

// ============================================================================
// OPTIONS
// ============================================================================

struct AcquisitionOptions {
    bool sanitize = true;
    FirmwareProfile profile = FirmwareProfile::standard();
    std::shared_ptr<ILogger> logger;  // optional
};

// ============================================================================
// FETCH REQUEST
// ============================================================================

class FetchRequest {
    std::future<MainReading> main_;
    std::future<CellVoltageReport> cells_;
    std::future<CellTemperatureReport> temperatures_;
    std::shared_ptr<ILogger> logger_;
    std::string address_;
    bool joined_ = false;

    friend FetchRequest fetch(std::shared_ptr<IHttpTransport> transport,
                              const std::string& address,
                              const AcquisitionOptions& options);

    FetchRequest(std::future<MainReading> main,
                 std::future<CellVoltageReport> cells,
                 std::future<CellTemperatureReport> temperatures,
                 std::shared_ptr<ILogger> logger,
                 std::string address)
        : main_(std::move(main)),
          cells_(std::move(cells)),
          temperatures_(std::move(temperatures)),
          logger_(std::move(logger)),
          address_(std::move(address)) {}

public:
    // A moved-from request reports finished and refuses join()
    FetchRequest(FetchRequest&& other) noexcept
        : main_(std::move(other.main_)),
          cells_(std::move(other.cells_)),
          temperatures_(std::move(other.temperatures_)),
          logger_(std::move(other.logger_)),
          address_(std::move(other.address_)),
          joined_(other.joined_) {
        other.joined_ = true;
    }

    FetchRequest& operator=(FetchRequest&& other) noexcept {
        if (this != &other) {
            main_ = std::move(other.main_);
            cells_ = std::move(other.cells_);
            temperatures_ = std::move(other.temperatures_);
            logger_ = std::move(other.logger_);
            address_ = std::move(other.address_);
            joined_ = other.joined_;
            other.joined_ = true;
        }
        return *this;
    }

    FetchRequest(const FetchRequest&) = delete;
    FetchRequest& operator=(const FetchRequest&) = delete;

    // Non-blocking. True once every leg has completed, successfully or not.
    bool is_finished() const {
        if (joined_) return true;
        return is_ready(main_) && is_ready(cells_) && is_ready(temperatures_);
    }

    bool joined() const { return joined_; }

    // Blocks until every leg has completed, then returns the snapshot.
    // Throws FetchFailed for the first failing leg (main, cell-voltage,
    // cell-temperature order) when it raised a BmsError, UnexpectedFailure
    // when it raised anything else. May be called only once.
    Snapshot join() {
        if (joined_) throw std::logic_error("FetchRequest already joined");
        joined_ = true;

        main_.wait();
        cells_.wait();
        temperatures_.wait();

        std::exception_ptr failure;
        std::optional<MainReading> main = take(main_, Leg::MAIN, failure);
        std::optional<CellVoltageReport> cells = take(cells_, Leg::CELL_VOLTAGE, failure);
        std::optional<CellTemperatureReport> temperatures =
            take(temperatures_, Leg::CELL_TEMPERATURE, failure);

        if (failure) std::rethrow_exception(failure);

        return Snapshot(std::move(*main), std::move(*cells), std::move(*temperatures));
    }

private:
    template <typename R>
    static bool is_ready(const std::future<R>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    template <typename R>
    std::optional<R> take(std::future<R>& f, Leg leg, std::exception_ptr& first_failure) {
        try {
            return f.get();
        } catch (const BmsError& e) {
            log_event(logger_, std::string(to_string(leg)) + " leg failed for " +
                                   address_ + ": " + e.what());
            if (!first_failure) first_failure = std::make_exception_ptr(FetchFailed(leg, e));
        } catch (const std::exception& e) {
            log_event(logger_, std::string(to_string(leg)) + " leg terminated abnormally: " +
                                   e.what());
            if (!first_failure) {
                first_failure = std::make_exception_ptr(UnexpectedFailure(leg, e.what()));
            }
        } catch (...) {
            log_event(logger_, std::string(to_string(leg)) +
                                   " leg terminated with a non-standard exception");
            if (!first_failure) {
                first_failure = std::make_exception_ptr(
                    UnexpectedFailure(leg, "non-standard exception"));
            }
        }
        return std::nullopt;
    }
};

// ============================================================================
// ENTRY POINTS
// ============================================================================

namespace detail {

template <typename R, typename F>
std::future<R> spawn_leg(F&& body) {
    std::packaged_task<R()> task(std::forward<F>(body));
    std::future<R> result = task.get_future();
    std::thread(std::move(task)).detach();
    return result;
}

} // namespace detail

// Starts a poll cycle and returns immediately.
// Throws std::invalid_argument on a null transport, an empty address or an
// invalid profile; std::system_error if a leg thread cannot be started.
inline FetchRequest fetch(std::shared_ptr<IHttpTransport> transport,
                          const std::string& address,
                          const AcquisitionOptions& options) {
    if (!transport) throw std::invalid_argument("fetch() requires a transport");
    if (address.empty()) throw std::invalid_argument("fetch() requires a controller address");
    if (!options.profile.validate()) {
        throw std::invalid_argument("Invalid FirmwareProfile: " + options.profile.name);
    }

    const bool sanitize = options.sanitize;
    log_event(options.logger, "poll cycle started for " + address + " (profile " +
                                  options.profile.name +
                                  (sanitize ? ", sanitized)" : ", raw)"));

    // Legs resolve their extractors here, before any thread starts
    MainLeg main_leg(options.profile.main);
    CellVoltageLeg cell_leg(options.profile.cell_voltage, sanitize);
    CellTemperatureLeg temperature_leg(options.profile.cell_temperature, sanitize);

    auto main = detail::spawn_leg<MainReading>(
        [transport, address, leg = std::move(main_leg)]() {
            return leg.run(*transport, address);
        });
    auto cells = detail::spawn_leg<CellVoltageReport>(
        [transport, address, leg = std::move(cell_leg)]() {
            return leg.run(*transport, address);
        });
    auto temperatures = detail::spawn_leg<CellTemperatureReport>(
        [transport, address, leg = std::move(temperature_leg)]() {
            return leg.run(*transport, address);
        });

    return FetchRequest(std::move(main), std::move(cells), std::move(temperatures),
                        options.logger, address);
}

inline FetchRequest fetch(std::shared_ptr<IHttpTransport> transport,
                          const std::string& address, bool sanitize) {
    AcquisitionOptions options;
    options.sanitize = sanitize;
    return fetch(std::move(transport), address, options);
}

} // namespace s3bms

#endif // S3BMS_ACQUISITION_HPP
