#pragma once
/*
 * ============================================================================
 * S3 BMS Controller Simulator
 * ============================================================================
 *
 * PURPOSE:
 *   Stand-in for the BMS controller's embedded web server. Serves canned
 *   status pages so the transport and the full acquisition pipeline can be
 *   exercised without hardware.
 *
 * FEATURES:
 *   - Lightweight POSIX sockets HTTP server on a background thread
 *   - GET only; unknown resources answer 404
 *   - Pages and per-resource status codes can be swapped while running
 *   - Port 0 binds an ephemeral port (see port())
 *
 * INTEGRATION:
 *   s3bms::net::ControllerSimulator sim("127.0.0.1", 0);
 *   sim.set_page("main_data.shtml", make_assignment_page(...));
 *   sim.start();
 *   // fetch from "127.0.0.1:" + std::to_string(sim.port())
 *   sim.stop();
 *
 * ============================================================================
 */

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <cstring>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace s3bms {
namespace net {

/* ============================================================================
 * PAGE RENDERING
 * ============================================================================
 */

inline std::string join_values(const std::vector<long long>& values) {
    std::ostringstream ss;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i) ss << ",";
        ss << values[i];
    }
    return ss.str();
}

// HTML page carrying one `key = "payload";` script assignment per entry,
// in the shape the controller firmware produces
inline std::string make_assignment_page(
    const std::string& title,
    const std::vector<std::pair<std::string, std::string>>& assignments)
{
    std::ostringstream ss;
    ss << "<!DOCTYPE html>\n<html>\n<head>\n<title>" << title << "</title>\n";
    ss << "<script type=\"text/javascript\">\n";
    for (const auto& a : assignments) {
        ss << "var " << a.first << " = \"" << a.second << "\";\n";
    }
    ss << "</script>\n</head>\n<body onload=\"init()\">\n";
    ss << "<div id=\"content\"></div>\n</body>\n</html>\n";
    return ss.str();
}

/* ============================================================================
 * ControllerSimulator
 * ============================================================================
 */

struct PageResponse {
    int status_code = 200;
    std::string status_message = "OK";
    std::string content_type = "text/html";
    std::string body;

    std::string to_string() const {
        std::ostringstream ss;
        ss << "HTTP/1.1 " << status_code << " " << status_message << "\r\n";
        ss << "Content-Type: " << content_type << "\r\n";
        ss << "Content-Length: " << body.length() << "\r\n";
        ss << "Connection: close\r\n";
        ss << "\r\n";
        ss << body;
        return ss.str();
    }
};

class ControllerSimulator {
    std::string bind_address_;
    int bind_port_;

    std::atomic<bool> running_{false};
    std::atomic<int> bound_port_{0};
    std::thread server_thread_;
    int server_socket_ = -1;

    mutable std::mutex pages_mutex_;
    std::map<std::string, PageResponse> pages_;

    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> successful_requests_{0};
    std::atomic<std::uint64_t> failed_requests_{0};

public:
    explicit ControllerSimulator(const std::string& address = "127.0.0.1", int port = 0)
        : bind_address_(address), bind_port_(port) {}

    ~ControllerSimulator() {
        stop();
    }

    ControllerSimulator(const ControllerSimulator&) = delete;
    ControllerSimulator& operator=(const ControllerSimulator&) = delete;

    // Binds, listens and starts serving on a background thread
    bool start() {
        if (running_.load()) {
            return false;
        }

        server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
        if (server_socket_ < 0) {
            return false;
        }

        int opt = 1;
        setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        struct sockaddr_in server_addr;
        std::memset(&server_addr, 0, sizeof(server_addr));
        server_addr.sin_family = AF_INET;
        server_addr.sin_port = htons(static_cast<uint16_t>(bind_port_));
        if (inet_pton(AF_INET, bind_address_.c_str(), &server_addr.sin_addr) <= 0 ||
            bind(server_socket_, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0 ||
            listen(server_socket_, 16) < 0) {
            close(server_socket_);
            server_socket_ = -1;
            return false;
        }

        socklen_t len = sizeof(server_addr);
        if (getsockname(server_socket_, (struct sockaddr*)&server_addr, &len) == 0) {
            bound_port_.store(ntohs(server_addr.sin_port));
        }

        running_.store(true);
        server_thread_ = std::thread(&ControllerSimulator::server_loop, this);
        return true;
    }

    void stop() {
        if (!running_.load()) {
            return;
        }

        running_.store(false);

        // Closing the listening socket unblocks accept()
        if (server_socket_ >= 0) {
            shutdown(server_socket_, SHUT_RDWR);
            close(server_socket_);
            server_socket_ = -1;
        }

        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

    bool running() const { return running_.load(); }

    // Actual listening port, valid after start()
    int port() const { return bound_port_.load(); }

    std::string address() const {
        return bind_address_ + ":" + std::to_string(port());
    }

    void set_page(const std::string& resource, const std::string& body) {
        std::lock_guard<std::mutex> lock(pages_mutex_);
        PageResponse& page = pages_[resource];
        page.status_code = 200;
        page.status_message = "OK";
        page.body = body;
    }

    // Answer `resource` with an error status instead of its page
    void set_status(const std::string& resource, int status_code, const std::string& message) {
        std::lock_guard<std::mutex> lock(pages_mutex_);
        PageResponse& page = pages_[resource];
        page.status_code = status_code;
        page.status_message = message;
        page.body = "<html><body><h1>" + std::to_string(status_code) + " " + message +
                    "</h1></body></html>";
    }

    void remove_page(const std::string& resource) {
        std::lock_guard<std::mutex> lock(pages_mutex_);
        pages_.erase(resource);
    }

    struct Stats {
        std::uint64_t total_requests;
        std::uint64_t successful_requests;
        std::uint64_t failed_requests;
    };

    Stats get_stats() const {
        return {total_requests_.load(), successful_requests_.load(), failed_requests_.load()};
    }

private:
    void server_loop() {
        while (running_.load()) {
            struct sockaddr_in client_addr;
            socklen_t client_len = sizeof(client_addr);
            int client_socket = accept(server_socket_, (struct sockaddr*)&client_addr, &client_len);

            if (client_socket < 0) {
                if (running_.load()) {
                    continue;
                }
                break;
            }

            struct timeval tv;
            tv.tv_sec = 5;
            tv.tv_usec = 0;
            setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            handle_client(client_socket);
            close(client_socket);
        }
    }

    void handle_client(int client_socket) {
        total_requests_++;

        // Read up to the end of the request headers
        std::string request;
        char buffer[4096];
        while (request.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = recv(client_socket, buffer, sizeof(buffer), 0);
            if (n <= 0) break;
            request.append(buffer, static_cast<std::size_t>(n));
        }

        if (request.empty()) {
            failed_requests_++;
            return;
        }

        std::istringstream ss(request);
        std::string method, path, version;
        ss >> method >> path >> version;

        PageResponse response = route_request(method, path);

        std::string response_str = response.to_string();
        std::size_t sent = 0;
        while (sent < response_str.size()) {
            ssize_t n = send(client_socket, response_str.data() + sent,
                             response_str.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) break;
            sent += static_cast<std::size_t>(n);
        }

        if (response.status_code == 200) {
            successful_requests_++;
        } else {
            failed_requests_++;
        }
    }

    PageResponse route_request(const std::string& method, const std::string& path) const {
        if (method != "GET") {
            return error_response(405, "Method Not Allowed");
        }

        std::string resource = path;
        if (!resource.empty() && resource.front() == '/') resource.erase(0, 1);

        std::lock_guard<std::mutex> lock(pages_mutex_);
        auto it = pages_.find(resource);
        if (it == pages_.end()) {
            return error_response(404, "Not Found");
        }
        return it->second;
    }

    static PageResponse error_response(int status_code, const std::string& message) {
        PageResponse response;
        response.status_code = status_code;
        response.status_message = message;
        response.body = "<html><body><h1>" + std::to_string(status_code) + " " + message +
                        "</h1></body></html>";
        return response;
    }
};

} // namespace net
} // namespace s3bms
