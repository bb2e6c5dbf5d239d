#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/UdpScanner.hpp"

#include <array>
#include <future>
#include <thread>

using namespace portprobe::infra;
using namespace portprobe::core;
using namespace std::chrono_literals;

namespace {

// Loopback UDP socket on an ephemeral port
class LoopbackUdpPeer {
public:
    LoopbackUdpPeer()
        : socket_(io_, asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

    uint16_t port() const { return socket_.local_endpoint().port(); }

    // Answers exactly one datagram
    void echoOnce() {
        std::array<char, 512> buffer{};
        asio::ip::udp::endpoint sender;
        size_t length = socket_.receive_from(asio::buffer(buffer), sender);
        std::string reply = "pong:" + std::to_string(length);
        socket_.send_to(asio::buffer(reply), sender);
    }

    void close() { socket_.close(); }

private:
    asio::io_context io_;
    asio::ip::udp::socket socket_;
};

// Classifies one port on a private single-worker pool and waits for the outcome
PortState classifyPort(const std::string& address, uint16_t port,
                       std::chrono::milliseconds timeout) {
    std::promise<PortState> outcome;
    auto future = outcome.get_future();

    ScanWorkerPool workers(1);
    workers.start();
    UdpScanner::probePortAsync(workers.io(), address, port, timeout,
                               [&outcome](PortState state) { outcome.set_value(state); });
    return future.get();
}

uint16_t unusedUdpPort() {
    LoopbackUdpPeer peer;
    auto port = peer.port();
    peer.close();
    return port;
}

} // namespace

TEST_CASE("udpProbePayload", "[UdpScanner]") {
    SECTION("DNS query for google.com") {
        auto payload = udpProbePayload(53);
        REQUIRE(payload.size() == 28);
        REQUIRE(payload[0] == 0x12);
        REQUIRE(payload[1] == 0x34);
        REQUIRE(payload[5] == 0x01);
        REQUIRE(payload[12] == 0x06);
        REQUIRE(std::string(payload.begin() + 13, payload.begin() + 19) == "google");
    }

    SECTION("SNMP GetRequest with the public community") {
        auto payload = udpProbePayload(161);
        REQUIRE(payload.size() == 40);
        REQUIRE(payload[0] == 0x30);
        // Outer sequence length covers the rest of the message
        REQUIRE(payload[1] == payload.size() - 2);
        REQUIRE(std::string(payload.begin() + 7, payload.begin() + 13) == "public");
        REQUIRE(payload[13] == 0xa0);
    }

    SECTION("NTP client request") {
        auto payload = udpProbePayload(123);
        REQUIRE(payload.size() == 48);
        REQUIRE(payload[0] == 0x1b);
        REQUIRE(payload[47] == 0x00);
    }

    SECTION("Other ports get an empty datagram") {
        REQUIRE(udpProbePayload(9999).empty());
        REQUIRE(udpProbePayload(0).empty());
    }
}

TEST_CASE("UdpScanner probePortAsync on loopback", "[UdpScanner][network]") {
    SECTION("Reply marks the port open") {
        LoopbackUdpPeer peer;
        std::thread responder([&peer]() { peer.echoOnce(); });

        auto state = classifyPort("127.0.0.1", peer.port(), 2000ms);
        responder.join();

        REQUIRE(state == PortState::Open);
    }

    SECTION("Silence until the timeout is reported open") {
        LoopbackUdpPeer peer;

        auto start = std::chrono::steady_clock::now();
        auto state = classifyPort("127.0.0.1", peer.port(), 200ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(state == PortState::Open);
        REQUIRE(elapsed >= 150ms);
    }

    SECTION("Port unreachable marks the port closed") {
        auto state = classifyPort("127.0.0.1", unusedUdpPort(), 2000ms);
        REQUIRE(state == PortState::Closed);
    }

    SECTION("Invalid address is closed") {
        REQUIRE(classifyPort("not-an-address", 53, 100ms) == PortState::Closed);
    }
}

TEST_CASE("UdpScanner scanAsync", "[UdpScanner][network]") {
    ScanWorkerPool workers(2);
    workers.start();
    UdpScanner scanner(workers, 200ms);

    SECTION("One result per port in request order") {
        LoopbackUdpPeer silent;
        auto closedPort = unusedUdpPort();
        ScanTarget target{"127.0.0.1", "localhost"};

        std::vector<PortScanProgress> updates;
        auto future = scanner.scanAsync(target, {silent.port(), closedPort},
                                        [&updates](const PortScanProgress& progress) {
                                            updates.push_back(progress);
                                        });
        auto results = future.get();

        REQUIRE(results.size() == 2);
        REQUIRE(results[0].port == silent.port());
        REQUIRE(results[0].protocol == Protocol::Udp);
        REQUIRE(results[0].targetAddress == "127.0.0.1");
        REQUIRE(results[0].state == PortState::Open);
        REQUIRE(results[1].port == closedPort);
        REQUIRE(results[1].state == PortState::Closed);

        REQUIRE(updates.size() == 2);
        REQUIRE(updates.back().scannedPorts == 2);
        REQUIRE(updates.back().totalPorts == 2);
        REQUIRE(updates.back().openPorts == 1);
    }

    SECTION("No ports yields an empty result immediately") {
        auto results = scanner.scanAsync({"127.0.0.1", "127.0.0.1"}, {}, {}).get();
        REQUIRE(results.empty());
    }

    SECTION("Many unusable ports complete without recursion") {
        std::vector<uint16_t> ports(5000);
        for (size_t i = 0; i < ports.size(); ++i) {
            ports[i] = static_cast<uint16_t>(i + 1);
        }

        auto results = scanner.scanAsync({"not-an-ip", "not-an-ip"}, ports, {}).get();

        REQUIRE(results.size() == ports.size());
        REQUIRE(results.front().state == PortState::Closed);
        REQUIRE(results.back().port == 5000);
    }

    workers.stop();
}

TEST_CASE("UdpScanner leaves the worker free while waiting", "[UdpScanner][network]") {
    // A single worker: any blocking wait inside the scan would starve other tasks
    ScanWorkerPool workers(1);
    workers.start();
    UdpScanner scanner(workers, 1000ms);

    LoopbackUdpPeer silent;
    auto scan = scanner.scanAsync({"127.0.0.1", "localhost"}, {silent.port()}, {});

    // Let the exchange reach its receive wait
    std::this_thread::sleep_for(50ms);

    std::promise<void> ran;
    auto ranFuture = ran.get_future();
    auto posted = std::chrono::steady_clock::now();
    asio::post(workers.io(), [&ran]() { ran.set_value(); });

    REQUIRE(ranFuture.wait_for(500ms) == std::future_status::ready);
    REQUIRE(std::chrono::steady_clock::now() - posted < 500ms);
    REQUIRE(scan.wait_for(0ms) == std::future_status::timeout);

    auto results = scan.get();
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].state == PortState::Open);
    workers.stop();
}
