/*
 * ============================================================================
 * S3 BMS ACQUISITION - TEST SUPPORT
 * ============================================================================
 *
 * Canned controller pages, substitute transports with per-resource
 * completion gates, a manual clock and a capturing logger.
 *
 * ============================================================================
 */

#ifndef S3BMS_TEST_SUPPORT_HPP
#define S3BMS_TEST_SUPPORT_HPP

#include "s3bms_controller_simulator.hpp"
#include "s3bms_errors.hpp"
#include "s3bms_interfaces.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace s3bms_test {

// ============================================================================
// ASSERTION HELPERS
// ============================================================================

template <typename E, typename F>
bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

// Polls `pred` until it holds or `timeout_ms` passes
template <typename P>
bool wait_until(P&& pred, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

// ============================================================================
// CANNED PAGES
// ============================================================================

const char* const MAIN_PAYLOAD = "0,48500,0,0,1500,0,0,650,0,0,250,0,0,210,0,0,320,0,0,400";

inline std::string main_page(const std::string& payload = MAIN_PAYLOAD) {
    return s3bms::net::make_assignment_page("Main", {{"Parametersatz", payload}});
}

// 144 cells: right string 3700 + i, left string 3800 + i
inline std::vector<long long> pack_cell_voltages() {
    std::vector<long long> cells;
    for (int i = 0; i < 72; ++i) cells.push_back(3700 + i);
    for (int i = 0; i < 72; ++i) cells.push_back(3800 + i);
    return cells;
}

inline std::string ucell_page(const std::vector<long long>& cells = pack_cell_voltages(),
                              const std::string& topology = "2,144,72,16,2") {
    std::vector<long long> payload = {0, 0};
    payload.insert(payload.end(), cells.begin(), cells.end());
    return s3bms::net::make_assignment_page(
        "Cell Voltages",
        {{"PSet0", topology}, {"PSet", s3bms::net::join_values(payload)}});
}

// 16 sensors in tenths of a degree: 20.0 .. 27.5 in 0.5 steps
inline std::vector<long long> pack_temperatures_tenths() {
    std::vector<long long> tenths;
    for (int i = 0; i < 16; ++i) tenths.push_back(200 + 5 * i);
    return tenths;
}

inline std::string tcell_page(const std::vector<long long>& tenths = pack_temperatures_tenths()) {
    std::vector<long long> payload = {0};
    payload.insert(payload.end(), tenths.begin(), tenths.end());
    return s3bms::net::make_assignment_page(
        "Cell Temperatures", {{"PSet", s3bms::net::join_values(payload)}});
}

// ============================================================================
// SUBSTITUTE TRANSPORTS
// ============================================================================

// Serves fixed bodies per resource. Resources can instead raise a
// TransportError or an exception outside the acquisition taxonomy.
class CannedTransport : public s3bms::IHttpTransport {
protected:
    enum class Mode { BODY, TRANSPORT_ERROR, FOREIGN_EXCEPTION };

    struct Entry {
        Mode mode = Mode::BODY;
        std::string text;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::atomic<int> requests_{0};

public:
    CannedTransport() {
        set_body("main_data.shtml", main_page());
        set_body("ucell.shtml", ucell_page());
        set_body("tcell.shtml", tcell_page());
    }

    void set_body(const std::string& resource, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[resource] = Entry{Mode::BODY, body};
    }

    void fail_with_transport_error(const std::string& resource, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[resource] = Entry{Mode::TRANSPORT_ERROR, message};
    }

    void fail_with_foreign_exception(const std::string& resource, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[resource] = Entry{Mode::FOREIGN_EXCEPTION, message};
    }

    int requests() const { return requests_.load(); }

    std::string get(const std::string& address, const std::string& resource) override {
        before_response(resource);
        requests_++;

        Entry entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(resource);
            if (it == entries_.end()) {
                throw s3bms::TransportError("GET " + address + "/" + resource + " returned HTTP 404");
            }
            entry = it->second;
        }

        switch (entry.mode) {
            case Mode::TRANSPORT_ERROR: throw s3bms::TransportError(entry.text);
            case Mode::FOREIGN_EXCEPTION: throw std::logic_error(entry.text);
            case Mode::BODY: break;
        }
        return entry.text;
    }

protected:
    virtual void before_response(const std::string&) {}
};

// Holds each resource's response until its gate is opened, so tests can
// complete legs one at a time.
class GatedTransport : public CannedTransport {
    std::map<std::string, std::promise<void>> gates_;
    std::map<std::string, std::shared_future<void>> waits_;

public:
    GatedTransport() {
        for (const char* r : {"main_data.shtml", "ucell.shtml", "tcell.shtml"}) {
            waits_[r] = gates_[r].get_future().share();
        }
    }

    ~GatedTransport() override {
        for (auto& g : gates_) {
            open_quietly(g.second);
        }
    }

    void open(const std::string& resource) { gates_.at(resource).set_value(); }

    void open_all() {
        for (auto& g : gates_) open_quietly(g.second);
    }

protected:
    void before_response(const std::string& resource) override {
        auto it = waits_.find(resource);
        if (it != waits_.end()) it->second.wait();
    }

private:
    static void open_quietly(std::promise<void>& gate) {
        try {
            gate.set_value();
        } catch (const std::future_error&) {
            // already open
        }
    }
};

// ============================================================================
// CLOCK AND LOGGER
// ============================================================================

class ManualClock : public s3bms::ITimeSource {
    std::atomic<long long> now_{1000};

public:
    long long now_ms() const override { return now_.load(); }
    void advance(long long ms) { now_ += ms; }
};

class CapturingLogger : public s3bms::ILogger {
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;

public:
    void log_event(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(message);
    }

    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& l : lines_) {
            if (l.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

} // namespace s3bms_test

#endif // S3BMS_TEST_SUPPORT_HPP
