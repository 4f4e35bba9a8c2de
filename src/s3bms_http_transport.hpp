#pragma once
/*
 * ============================================================================
 * S3 BMS POSIX HTTP Transport
 * ============================================================================
 *
 * PURPOSE:
 *   Blocking HTTP/1.1 GET over POSIX sockets, implementing IHttpTransport
 *   for the acquisition legs.
 *
 * WHAT THIS IS:
 *   - Enough HTTP for the controller's embedded web server: one request per
 *     connection, Connection: close, Content-Length or chunked bodies.
 *
 * WHAT THIS IS NOT:
 *   - A general HTTP client. No TLS, no redirects, no keep-alive, no retry.
 *
 * ADDRESS FORMS:
 *   192.168.0.200         host, port 80
 *   192.168.0.200:8080    host and port
 *   http://bms.local/     scheme prefix and trailing slash are accepted
 *   [fe80::1]:8080        bracketed IPv6 literal
 *
 * Every failure raises s3bms::TransportError.
 *
 * ============================================================================
 */

#include "s3bms_errors.hpp"
#include "s3bms_interfaces.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace s3bms {
namespace net {

/* ============================================================================
 * ADDRESS PARSING
 * ============================================================================
 */

struct HttpEndpoint {
    std::string host;
    int port = 80;
};

inline HttpEndpoint parse_address(const std::string& address) {
    std::string rest = address;

    const std::string http = "http://";
    if (rest.compare(0, http.size(), http) == 0) {
        rest = rest.substr(http.size());
    } else if (rest.find("://") != std::string::npos) {
        throw TransportError("unsupported scheme in address '" + address + "'");
    }

    while (!rest.empty() && rest.back() == '/') rest.pop_back();
    if (rest.find('/') != std::string::npos) {
        throw TransportError("address '" + address + "' must not contain a path");
    }
    if (rest.find('@') != std::string::npos) {
        throw TransportError("address '" + address + "' must not embed credentials");
    }

    HttpEndpoint ep;
    std::string port_text;

    if (!rest.empty() && rest.front() == '[') {
        auto bracket = rest.find(']');
        if (bracket == std::string::npos) {
            throw TransportError("unterminated IPv6 literal in '" + address + "'");
        }
        ep.host = rest.substr(1, bracket - 1);
        if (bracket + 1 < rest.size()) {
            if (rest[bracket + 1] != ':') {
                throw TransportError("unexpected text after IPv6 literal in '" + address + "'");
            }
            port_text = rest.substr(bracket + 2);
        }
    } else {
        auto colon = rest.rfind(':');
        if (colon != std::string::npos) {
            ep.host = rest.substr(0, colon);
            port_text = rest.substr(colon + 1);
        } else {
            ep.host = rest;
        }
    }

    if (ep.host.empty()) throw TransportError("no host in address '" + address + "'");

    if (!port_text.empty() || rest.back() == ':') {
        char* end = nullptr;
        errno = 0;
        long port = std::strtol(port_text.c_str(), &end, 10);
        if (port_text.empty() || *end != '\0' || errno == ERANGE || port < 1 || port > 65535) {
            throw TransportError("invalid port in address '" + address + "'");
        }
        ep.port = static_cast<int>(port);
    }
    return ep;
}

/* ============================================================================
 * RESPONSE PARSING
 * ============================================================================
 */

struct HttpResponse {
    int status_code = 0;
    std::string status_message;
    std::string headers;  // raw header block, lower-cased
    std::string body;
};

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string decode_chunked(const std::string& raw) {
    std::string body;
    std::size_t pos = 0;

    while (true) {
        auto line_end = raw.find("\r\n", pos);
        if (line_end == std::string::npos) {
            throw TransportError("truncated chunked body");
        }

        // Chunk extensions after ';' are ignored
        std::string size_line = raw.substr(pos, line_end - pos);
        auto semi = size_line.find(';');
        if (semi != std::string::npos) size_line.resize(semi);

        char* end = nullptr;
        unsigned long size = std::strtoul(size_line.c_str(), &end, 16);
        if (size_line.empty() || end == size_line.c_str()) {
            throw TransportError("invalid chunk size '" + size_line + "'");
        }

        pos = line_end + 2;
        if (size == 0) break;
        if (pos + size > raw.size()) {
            throw TransportError("truncated chunked body");
        }
        body.append(raw, pos, size);
        pos += size + 2;  // chunk data is followed by CRLF
    }
    return body;
}

inline HttpResponse parse_response(const std::string& raw) {
    auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        throw TransportError("truncated HTTP response (" + std::to_string(raw.size()) + " bytes)");
    }

    HttpResponse response;

    auto status_end = raw.find("\r\n");
    std::istringstream status_line(raw.substr(0, status_end));
    std::string version;
    status_line >> version >> response.status_code;
    std::getline(status_line, response.status_message);
    if (!response.status_message.empty() && response.status_message.front() == ' ') {
        response.status_message.erase(0, 1);
    }

    if (version.compare(0, 5, "HTTP/") != 0 || response.status_code == 0) {
        throw TransportError("malformed HTTP status line");
    }

    response.headers = to_lower(raw.substr(status_end, header_end - status_end));
    std::string payload = raw.substr(header_end + 4);

    if (response.headers.find("transfer-encoding: chunked") != std::string::npos) {
        response.body = decode_chunked(payload);
    } else {
        response.body = std::move(payload);
    }
    return response;
}

/* ============================================================================
 * SOCKET HANDLE
 * ============================================================================
 */

class ScopedSocket {
    int fd_ = -1;

public:
    explicit ScopedSocket(int fd) : fd_(fd) {}
    ~ScopedSocket() {
        if (fd_ >= 0) close(fd_);
    }

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    int get() const { return fd_; }
};

/* ============================================================================
 * PosixHttpTransport
 * ============================================================================
 */

struct HttpTransportConfig {
    // 0 keeps the OS default (no deadline)
    int receive_timeout_s = 0;
    std::string user_agent = "s3bms/1.0";

    bool validate() const { return receive_timeout_s >= 0; }
};

class PosixHttpTransport final : public IHttpTransport {
    HttpTransportConfig config_;

public:
    explicit PosixHttpTransport(HttpTransportConfig config = {}) : config_(std::move(config)) {
        if (!config_.validate()) {
            throw std::invalid_argument("Invalid HttpTransportConfig parameters");
        }
    }

    std::string get(const std::string& address, const std::string& resource) override {
        const HttpEndpoint ep = parse_address(address);
        const std::string path = "/" + resource;

        ScopedSocket sock(connect_to(ep));
        send_request(sock.get(), ep, path);

        HttpResponse response = parse_response(read_all(sock.get()));
        if (response.status_code < 200 || response.status_code > 299) {
            throw TransportError("GET " + ep.host + path + " returned HTTP " +
                                 std::to_string(response.status_code) + " " +
                                 response.status_message);
        }
        return std::move(response.body);
    }

private:
    int connect_to(const HttpEndpoint& ep) const {
        addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* found = nullptr;
        const std::string port = std::to_string(ep.port);
        int rc = getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &found);
        if (rc != 0) {
            throw TransportError("cannot resolve '" + ep.host + "': " + gai_strerror(rc));
        }

        std::string last_error = "no usable address";
        int fd = -1;
        for (addrinfo* ai = found; ai != nullptr; ai = ai->ai_next) {
            fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) {
                last_error = std::strerror(errno);
                continue;
            }
            if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;

            last_error = std::strerror(errno);
            close(fd);
            fd = -1;
        }
        freeaddrinfo(found);

        if (fd < 0) {
            throw TransportError("cannot connect to " + ep.host + ":" + port + ": " + last_error);
        }

        if (config_.receive_timeout_s > 0) {
            struct timeval tv;
            tv.tv_sec = config_.receive_timeout_s;
            tv.tv_usec = 0;
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        }
        return fd;
    }

    void send_request(int fd, const HttpEndpoint& ep, const std::string& path) const {
        std::ostringstream request;
        request << "GET " << path << " HTTP/1.1\r\n";
        request << "Host: ";
        if (ep.host.find(':') != std::string::npos) {
            request << "[" << ep.host << "]";
        } else {
            request << ep.host;
        }
        if (ep.port != 80) request << ":" << ep.port;
        request << "\r\n";
        request << "User-Agent: " << config_.user_agent << "\r\n";
        request << "Accept: text/html, */*\r\n";
        request << "Connection: close\r\n";
        request << "\r\n";

        const std::string data = request.str();
        std::size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw TransportError("send to " + ep.host + " failed: " + std::strerror(errno));
            }
            sent += static_cast<std::size_t>(n);
        }
    }

    static std::string read_all(int fd) {
        std::string response;
        char buffer[4096];

        while (true) {
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n > 0) {
                response.append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0) {
                break;
            } else if (errno == EINTR) {
                continue;
            } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw TransportError("receive timed out");
            } else {
                throw TransportError(std::string("receive failed: ") + std::strerror(errno));
            }
        }
        return response;
    }
};

} // namespace net
} // namespace s3bms
