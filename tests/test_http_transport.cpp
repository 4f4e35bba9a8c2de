/*
 * ============================================================================
 * S3 BMS ACQUISITION - HTTP TRANSPORT TESTS
 * ============================================================================
 *
 * Address and response parsing, plus the POSIX transport and the whole
 * pipeline against the loopback controller simulator.
 *
 * ============================================================================
 */

#include "s3bms_acquisition.hpp"
#include "s3bms_controller_simulator.hpp"
#include "s3bms_http_transport.hpp"
#include "test_support.hpp"

#include <iostream>
#include <cassert>

using namespace s3bms;
using namespace s3bms::net;
using s3bms_test::throws;

bool test_parse_address() {
    std::cout << "Testing controller address parsing..." << std::flush;

    HttpEndpoint a = parse_address("192.168.0.200");
    assert(a.host == "192.168.0.200" && a.port == 80);

    HttpEndpoint b = parse_address("http://bms.local:8080/");
    assert(b.host == "bms.local" && b.port == 8080);

    HttpEndpoint c = parse_address("[::1]:8081");
    assert(c.host == "::1" && c.port == 8081);

    HttpEndpoint d = parse_address("[fe80::1]");
    assert(d.host == "fe80::1" && d.port == 80);

    assert(throws<TransportError>([] { parse_address("https://192.168.0.200"); }));
    assert(throws<TransportError>([] { parse_address("192.168.0.200/main_data.shtml"); }));
    assert(throws<TransportError>([] { parse_address("admin@192.168.0.200"); }));
    assert(throws<TransportError>([] { parse_address("192.168.0.200:"); }));
    assert(throws<TransportError>([] { parse_address("192.168.0.200:0"); }));
    assert(throws<TransportError>([] { parse_address("192.168.0.200:70000"); }));
    assert(throws<TransportError>([] { parse_address("192.168.0.200:http"); }));
    assert(throws<TransportError>([] { parse_address(":8080"); }));
    assert(throws<TransportError>([] { parse_address("[::1"); }));

    std::cout << " PASS\n";
    return true;
}

bool test_parse_response() {
    std::cout << "Testing HTTP response parsing..." << std::flush;

    HttpResponse ok = parse_response(
        "HTTP/1.1 200 OK\r\nContent-Type: text/html\r\nContent-Length: 4\r\n\r\nbody");
    assert(ok.status_code == 200);
    assert(ok.status_message == "OK");
    assert(ok.headers.find("content-type: text/html") != std::string::npos);
    assert(ok.body == "body");

    HttpResponse missing = parse_response("HTTP/1.0 404 Not Found\r\n\r\n");
    assert(missing.status_code == 404);
    assert(missing.status_message == "Not Found");
    assert(missing.body.empty());

    assert(throws<TransportError>([] { parse_response("HTTP/1.1 200 OK\r\nContent-Le"); }));
    assert(throws<TransportError>([] { parse_response("SSH-2.0-dropbear\r\n\r\n"); }));

    std::cout << " PASS\n";
    return true;
}

bool test_chunked_body() {
    std::cout << "Testing chunked transfer decoding..." << std::flush;

    HttpResponse r = parse_response(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: Chunked\r\n\r\n"
        "4\r\nPSet\r\n"
        "9;ext=1\r\n = \"1,2,3\r\n"
        "2\r\n\";\r\n"
        "0\r\n\r\n");
    assert(r.body == "PSet = \"1,2,3\";");

    assert(decode_chunked("0\r\n\r\n").empty());
    assert(throws<TransportError>([] { decode_chunked("10\r\nshort\r\n"); }));
    assert(throws<TransportError>([] { decode_chunked("zz\r\n"); }));
    assert(throws<TransportError>([] { decode_chunked("5\r\nhello"); }));

    std::cout << " PASS\n";
    return true;
}

bool test_transport_config() {
    std::cout << "Testing transport configuration validation..." << std::flush;

    HttpTransportConfig config;
    assert(config.validate());
    config.receive_timeout_s = -1;
    assert(!config.validate());
    assert(throws<std::invalid_argument>([&] { PosixHttpTransport t(config); }));

    std::cout << " PASS\n";
    return true;
}

bool test_get_against_simulator() {
    std::cout << "Testing GET against the loopback controller..." << std::flush;

    ControllerSimulator sim;
    sim.set_page("main_data.shtml", s3bms_test::main_page());
    sim.set_status("ucell.shtml", 503, "Service Unavailable");
    assert(sim.start());
    assert(sim.running());
    assert(sim.port() > 0);

    HttpTransportConfig config;
    config.receive_timeout_s = 5;
    PosixHttpTransport transport(config);

    assert(transport.get(sim.address(), "main_data.shtml") == s3bms_test::main_page());
    assert(transport.get("http://" + sim.address() + "/", "main_data.shtml") ==
           s3bms_test::main_page());

    bool raised = false;
    try {
        transport.get(sim.address(), "tcell.shtml");
    } catch (const TransportError& e) {
        raised = true;
        assert(std::string(e.what()).find("HTTP 404") != std::string::npos);
    }
    assert(raised);

    raised = false;
    try {
        transport.get(sim.address(), "ucell.shtml");
    } catch (const TransportError& e) {
        raised = true;
        assert(std::string(e.what()).find("HTTP 503") != std::string::npos);
    }
    assert(raised);

    ControllerSimulator::Stats stats = sim.get_stats();
    assert(stats.total_requests == 4);
    assert(stats.successful_requests == 2);
    assert(stats.failed_requests == 2);

    const std::string address = sim.address();
    sim.stop();
    assert(!sim.running());
    assert(throws<TransportError>([&] { transport.get(address, "main_data.shtml"); }));

    std::cout << " PASS\n";
    return true;
}

bool test_unresolvable_host() {
    std::cout << "Testing an unresolvable host is a transport error..." << std::flush;

    PosixHttpTransport transport;
    assert(throws<TransportError>([&] { transport.get("no-such-host.invalid", "main_data.shtml"); }));

    std::cout << " PASS\n";
    return true;
}

bool test_full_pipeline() {
    std::cout << "Testing a full poll cycle over HTTP..." << std::flush;

    ControllerSimulator sim;
    sim.set_page("main_data.shtml", s3bms_test::main_page());
    sim.set_page("ucell.shtml", s3bms_test::ucell_page());
    sim.set_page("tcell.shtml", s3bms_test::tcell_page());
    assert(sim.start());

    auto transport = std::make_shared<PosixHttpTransport>();
    Snapshot snapshot = fetch(transport, sim.address(), true).join();

    assert(snapshot.main().voltage == 48.5);
    assert(snapshot.cells().cell_voltage.size() == 144);
    assert(snapshot.cells().overall.min == 3700);
    assert(snapshot.cells().overall.max == 3871);
    assert(snapshot.temperatures().left->min == 24.0);

    // The controller dropping a page fails that leg only
    sim.remove_page("tcell.shtml");
    bool raised = false;
    try {
        fetch(transport, sim.address(), true).join();
    } catch (const FetchFailed& e) {
        raised = true;
        assert(e.leg() == Leg::CELL_TEMPERATURE);
        assert(e.cause() == ErrorKind::TRANSPORT);
    }
    assert(raised);

    sim.stop();

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "S3 BMS HTTP TRANSPORT TESTS\n";
    std::cout << "============================================================================\n\n";

    try {
        bool all_passed = true;

        all_passed &= test_parse_address();
        all_passed &= test_parse_response();
        all_passed &= test_chunked_body();
        all_passed &= test_transport_config();
        all_passed &= test_get_against_simulator();
        all_passed &= test_unresolvable_host();
        all_passed &= test_full_pipeline();

        std::cout << "\n============================================================================\n";
        if (all_passed) {
            std::cout << "✓ All HTTP transport tests PASSED\n";
        } else {
            std::cout << "✗ Some tests FAILED\n";
            return 1;
        }
        std::cout << "============================================================================\n";

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
