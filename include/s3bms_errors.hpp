/*
 * ============================================================================
 * S3 BMS ACQUISITION - ERROR TAXONOMY
 * ============================================================================
 *
 * Two layers:
 *   - BmsError and its subclasses are raised inside a single leg
 *     (transport, extraction, decoding, aggregation).
 *   - AcquisitionError and its subclasses are raised by FetchRequest::join()
 *     and name the leg that failed.
 *
 * Callers must tell FetchFailed (controller or network misbehaved) apart
 * from UnexpectedFailure (the acquisition code itself misbehaved).
 *
 * LICENSE: MIT
 *
 * ============================================================================
 */

#ifndef S3BMS_ERRORS_HPP
#define S3BMS_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace s3bms {

// ============================================================================
// LEG-LEVEL ERRORS
// ============================================================================

enum class ErrorKind {
    TRANSPORT,
    BODY_DECODE,
    MALFORMED_DOCUMENT,
    FIELD_MISSING,
    FIELD_UNPARSEABLE,
    EMPTY_SERIES
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TRANSPORT: return "transport error";
        case ErrorKind::BODY_DECODE: return "body decode error";
        case ErrorKind::MALFORMED_DOCUMENT: return "malformed document";
        case ErrorKind::FIELD_MISSING: return "field missing";
        case ErrorKind::FIELD_UNPARSEABLE: return "field unparseable";
        case ErrorKind::EMPTY_SERIES: return "empty series";
    }
    return "unknown error";
}

class BmsError : public std::runtime_error {
    ErrorKind kind_;

public:
    BmsError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message),
          kind_(kind) {}

    ErrorKind kind() const { return kind_; }
};

// Connection, DNS or HTTP status failure
class TransportError : public BmsError {
public:
    explicit TransportError(const std::string& message)
        : BmsError(ErrorKind::TRANSPORT, message) {}
};

// Response body is not valid text
class BodyDecodeError : public BmsError {
public:
    explicit BodyDecodeError(const std::string& message)
        : BmsError(ErrorKind::BODY_DECODE, message) {}
};

// Expected assignment not found: firmware mismatch, captive portal,
// truncated page.
class MalformedDocument : public BmsError {
    std::string key_;

public:
    MalformedDocument(const std::string& key, const std::string& message)
        : BmsError(ErrorKind::MALFORMED_DOCUMENT, message), key_(key) {}

    const std::string& key() const { return key_; }
};

class FieldError : public BmsError {
    std::size_t index_;
    std::string name_;

protected:
    FieldError(ErrorKind kind, std::size_t index, const std::string& name,
               const std::string& detail)
        : BmsError(kind, "field '" + name + "' at position " +
                             std::to_string(index) + detail),
          index_(index),
          name_(name) {}

public:
    // Zero-based position inside the comma-separated payload
    std::size_t field_index() const { return index_; }
    const std::string& field_name() const { return name_; }
};

class FieldMissing : public FieldError {
public:
    FieldMissing(std::size_t index, const std::string& name)
        : FieldError(ErrorKind::FIELD_MISSING, index, name,
                     " is beyond the end of the payload") {}
};

class FieldUnparseable : public FieldError {
public:
    FieldUnparseable(std::size_t index, const std::string& name, const std::string& text)
        : FieldError(ErrorKind::FIELD_UNPARSEABLE, index, name,
                     " has unparseable value '" + text + "'") {}
};

class EmptySeries : public BmsError {
public:
    explicit EmptySeries(const std::string& message)
        : BmsError(ErrorKind::EMPTY_SERIES, message) {}
};

// ============================================================================
// ORCHESTRATOR-LEVEL ERRORS
// ============================================================================

enum class Leg {
    MAIN,
    CELL_VOLTAGE,
    CELL_TEMPERATURE
};

inline const char* to_string(Leg leg) {
    switch (leg) {
        case Leg::MAIN: return "main";
        case Leg::CELL_VOLTAGE: return "cell-voltage";
        case Leg::CELL_TEMPERATURE: return "cell-temperature";
    }
    return "unknown";
}

class AcquisitionError : public std::runtime_error {
    Leg leg_;

public:
    AcquisitionError(Leg leg, const std::string& message)
        : std::runtime_error(std::string(to_string(leg)) + " leg: " + message),
          leg_(leg) {}

    Leg leg() const { return leg_; }
};

// A leg returned a typed error from the taxonomy above
class FetchFailed : public AcquisitionError {
    ErrorKind cause_;

public:
    FetchFailed(Leg leg, const BmsError& cause)
        : AcquisitionError(leg, cause.what()), cause_(cause.kind()) {}

    ErrorKind cause() const { return cause_; }
};

// A leg terminated abnormally rather than returning a typed error
class UnexpectedFailure : public AcquisitionError {
public:
    UnexpectedFailure(Leg leg, const std::string& detail)
        : AcquisitionError(leg, "unexpected failure: " + detail) {}
};

} // namespace s3bms

#endif // S3BMS_ERRORS_HPP
