#ifndef S3BMS_ENDPOINT_FETCHER_HPP
#define S3BMS_ENDPOINT_FETCHER_HPP

#include "s3bms_errors.hpp"
#include "s3bms_interfaces.hpp"

#include <cstddef>
#include <string>

namespace s3bms {

// ============================================================================
// ENDPOINT FETCHER
// ============================================================================
//
// The only I/O boundary of a leg: one blocking GET, no retry, no internal
// timeout. Transport failures propagate as TransportError; a body that is
// not valid UTF-8 text raises BodyDecodeError.

// Returns the byte offset of the first invalid sequence, or npos
inline std::size_t find_invalid_utf8(const std::string& text) {
    const std::size_t n = text.size();
    auto byte_at = [&text](std::size_t at) { return static_cast<unsigned char>(text[at]); };

    std::size_t i = 0;
    while (i < n) {
        const unsigned char c = byte_at(i);
        std::size_t len = 0;
        unsigned int cp = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return i;
        }

        if (i + len > n) return i;
        for (std::size_t k = 1; k < len; ++k) {
            if ((byte_at(i + k) & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (byte_at(i + k) & 0x3Fu);
        }

        // Overlong forms, surrogates, beyond U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return i;
        }
        i += len;
    }
    return std::string::npos;
}

inline std::string fetch_endpoint(IHttpTransport& transport,
                                  const std::string& address,
                                  const std::string& resource) {
    std::string body = transport.get(address, resource);

    const std::size_t bad = find_invalid_utf8(body);
    if (bad != std::string::npos) {
        throw BodyDecodeError("response from " + address + "/" + resource +
                              " is not valid UTF-8 (offset " + std::to_string(bad) + ")");
    }
    return body;
}

} // namespace s3bms

#endif // S3BMS_ENDPOINT_FETCHER_HPP
