/*
 * ============================================================================
 * S3 BMS ACQUISITION LIBRARY
 * ============================================================================
 *
 * Single include for applications: acquisition core, dashboard poller,
 * console logging and the POSIX HTTP transport.
 *
 * QUICK START:
 *   #include "s3bms.hpp"
 *
 *   auto request = s3bms::fetch("192.168.0.200", true);
 *   s3bms::Snapshot snapshot = request.join();
 *   std::cout << snapshot.main().voltage << " V\n";
 *
 * LICENSE: MIT
 *
 * ============================================================================
 */

#ifndef S3BMS_HPP
#define S3BMS_HPP

#include "s3bms_acquisition.hpp"
#include "s3bms_errors.hpp"
#include "s3bms_firmware_profile.hpp"
#include "s3bms_logging.hpp"
#include "s3bms_poller.hpp"
#include "s3bms_snapshot.hpp"

#include "s3bms_http_transport.hpp"

#include <memory>
#include <string>

namespace s3bms {

// fetch() over a fresh POSIX transport
inline FetchRequest fetch(const std::string& address, bool sanitize) {
    return fetch(std::make_shared<net::PosixHttpTransport>(), address, sanitize);
}

} // namespace s3bms

#endif // S3BMS_HPP
