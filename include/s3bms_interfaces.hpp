#ifndef S3BMS_INTERFACES_HPP
#define S3BMS_INTERFACES_HPP

#include <string>

namespace s3bms {

/*
 * ============================================================================
 * COLLABORATOR INTERFACES
 * ============================================================================
 * These interfaces decouple the acquisition pipeline from:
 *  - the HTTP stack (POSIX sockets, canned test documents)
 *  - the wall clock (steady clock, manual test clocks)
 *  - the log sink
 *
 * NO LOGIC. CONTRACTS ONLY.
 * ============================================================================
 */

/* ================= HTTP TRANSPORT ================= */

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    // One blocking GET of `resource` on the controller at `address`
    // (host or host:port). Returns the raw body bytes.
    // Throws TransportError on resolve/connect/IO/status failure.
    virtual std::string get(const std::string& address, const std::string& resource) = 0;
};

/* ================= TIME SOURCE ================= */

class ITimeSource {
public:
    virtual ~ITimeSource() = default;
    virtual long long now_ms() const = 0;
};

/* ================= OPTIONAL LOGGER ================= */

class ILogger {
public:
    virtual ~ILogger() = default;

    // Must be callable from any thread
    virtual void log_event(const std::string& message) = 0;
};

} // namespace s3bms

#endif // S3BMS_INTERFACES_HPP
