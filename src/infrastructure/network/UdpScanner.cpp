#include "infrastructure/network/UdpScanner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <memory>

namespace portprobe::infra {

namespace {

constexpr uint16_t DnsPort = 53;
constexpr uint16_t NtpPort = 123;
constexpr uint16_t SnmpPort = 161;
constexpr size_t NtpPacketSize = 48;

} // namespace

std::vector<uint8_t> udpProbePayload(uint16_t port) {
    switch (port) {
    case DnsPort:
        // Standard query, one question: google.com IN A
        return {
            0x12, 0x34,                                // Transaction ID
            0x01, 0x00,                                // Flags: recursion desired
            0x00, 0x01,                                // Questions
            0x00, 0x00,                                // Answer RRs
            0x00, 0x00,                                // Authority RRs
            0x00, 0x00,                                // Additional RRs
            0x06, 'g', 'o', 'o', 'g', 'l', 'e',
            0x03, 'c', 'o', 'm',
            0x00,                                      // Root label
            0x00, 0x01,                                // Type A
            0x00, 0x01,                                // Class IN
        };
    case SnmpPort:
        // SNMPv1 GetRequest for 1.3.6.1.2.1.1.1.0 (sysDescr)
        return {
            0x30, 0x26,                                // SEQUENCE
            0x02, 0x01, 0x00,                          // version: 1
            0x04, 0x06, 'p', 'u', 'b', 'l', 'i', 'c',  // community
            0xa0, 0x19,                                // GetRequest PDU
            0x02, 0x01, 0x01,                          // request-id
            0x02, 0x01, 0x00,                          // error-status
            0x02, 0x01, 0x00,                          // error-index
            0x30, 0x0e,                                // varbind list
            0x30, 0x0c,                                // varbind
            0x06, 0x08, 0x2b, 0x06, 0x01, 0x02, 0x01, 0x01, 0x01, 0x00,
            0x05, 0x00,                                // NULL value
        };
    case NtpPort: {
        // Client request: LI 0, version 3, mode 3
        std::vector<uint8_t> packet(NtpPacketSize, 0x00);
        packet[0] = 0x1b;
        return packet;
    }
    default:
        return {};
    }
}

/// Shared state of one scanAsync() call; ports are visited in request order.
struct UdpScanner::ScanRun {
    explicit ScanRun(asio::io_context& context) : io(context) {}

    asio::io_context& io;
    std::chrono::milliseconds timeout{0};
    core::ScanTarget target;
    std::vector<uint16_t> ports;
    ProgressCallback onProgress;

    size_t next{0};
    std::vector<core::PortScanResult> results;
    core::PortScanProgress progress;
    std::promise<std::vector<core::PortScanResult>> promise;
};

/// One datagram exchange. Socket, timer and flag are only touched on the strand.
struct UdpScanner::Exchange : std::enable_shared_from_this<UdpScanner::Exchange> {
    explicit Exchange(asio::io_context& context)
        : strand(asio::make_strand(context)), socket(strand), timer(strand) {}

    asio::strand<asio::io_context::executor_type> strand;
    asio::ip::udp::socket socket;
    asio::steady_timer timer;
    std::vector<uint8_t> payload;
    std::array<uint8_t, 1024> buffer{};
    std::string address;
    uint16_t port{0};
    bool completed{false};
    StateHandler onDone;

    void start(std::chrono::milliseconds timeout);
    void awaitReply(std::chrono::milliseconds timeout);

    void finish(core::PortState state) {
        if (completed) {
            return;
        }
        completed = true;
        timer.cancel();
        asio::error_code ignored;
        socket.close(ignored);
        onDone(state);
    }
};

UdpScanner::UdpScanner(ScanWorkerPool& workers, std::chrono::milliseconds timeout)
    : workers_(workers), timeout_(timeout) {}

std::future<std::vector<core::PortScanResult>>
UdpScanner::scanAsync(const core::ScanTarget& target, const std::vector<uint16_t>& ports,
                      ProgressCallback onProgress) {
    auto run = std::make_shared<ScanRun>(workers_.io());
    run->timeout = timeout_;
    run->target = target;
    run->ports = ports;
    run->onProgress = std::move(onProgress);
    run->results.reserve(ports.size());
    run->progress.totalPorts = static_cast<int>(ports.size());

    auto future = run->promise.get_future();

    if (ports.empty()) {
        spdlog::warn("No ports to scan on {}", target.displayName);
        run->promise.set_value({});
        return future;
    }

    spdlog::info("Starting UDP scan of {} ({}) on {} ports", target.displayName, target.address,
                 ports.size());

    scanNext(run);
    return future;
}

void UdpScanner::scanNext(const std::shared_ptr<ScanRun>& run) {
    if (run->next == run->ports.size()) {
        spdlog::info("UDP scan of {} complete: {} open|filtered of {} ports",
                     run->target.displayName, run->progress.openPorts, run->results.size());
        run->promise.set_value(std::move(run->results));
        return;
    }

    const uint16_t port = run->ports[run->next++];
    probePortAsync(run->io, run->target.address, port, run->timeout,
                   [run, port](core::PortState state) {
                       core::PortScanResult result;
                       result.targetAddress = run->target.address;
                       result.port = port;
                       result.protocol = core::Protocol::Udp;
                       result.state = state;

                       if (state == core::PortState::Open) {
                           ++run->progress.openPorts;
                       }
                       ++run->progress.scannedPorts;
                       run->results.push_back(std::move(result));

                       if (run->onProgress) {
                           run->onProgress(run->progress);
                       }
                       scanNext(run);
                   });
}

void UdpScanner::probePortAsync(asio::io_context& io, const std::string& address, uint16_t port,
                                std::chrono::milliseconds timeout, StateHandler onDone) {
    auto exchange = std::make_shared<Exchange>(io);
    exchange->address = address;
    exchange->port = port;
    exchange->onDone = std::move(onDone);

    // Early failures complete from a posted handler, so a long run of
    // unusable ports never recurses through scanNext()
    asio::post(exchange->strand, [exchange, timeout]() { exchange->start(timeout); });
}

void UdpScanner::Exchange::start(std::chrono::milliseconds timeout) {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        spdlog::debug("UDP scan skipped, '{}' is not an IP address", address);
        finish(core::PortState::Closed);
        return;
    }

    // Ephemeral local endpoint, associated with the destination
    asio::ip::udp::endpoint destination(ip, port);
    socket.open(destination.protocol(), ec);
    if (!ec) {
        socket.bind(asio::ip::udp::endpoint(destination.protocol(), 0), ec);
    }
    if (!ec) {
        socket.connect(destination, ec);
    }
    if (ec) {
        spdlog::debug("UDP bind/connect for {}:{} failed: {}", address, port, ec.message());
        finish(core::PortState::Closed);
        return;
    }

    payload = udpProbePayload(port);
    auto self = shared_from_this();
    socket.async_send(asio::buffer(payload), [self, timeout](const asio::error_code& ec, size_t) {
        if (self->completed) {
            return;
        }
        if (ec) {
            spdlog::debug("UDP send to {}:{} failed: {}", self->address, self->port,
                          ec.message());
            self->finish(core::PortState::Closed);
            return;
        }
        self->awaitReply(timeout);
    });
}

void UdpScanner::Exchange::awaitReply(std::chrono::milliseconds timeout) {
    auto self = shared_from_this();

    // A single datagram, or an error such as port unreachable, ends the wait
    socket.async_receive(asio::buffer(buffer), [self](const asio::error_code& ec, size_t) {
        if (self->completed) {
            return;
        }
        if (ec) {
            spdlog::debug("UDP receive from {}:{} failed: {}", self->address, self->port,
                          ec.message());
            self->finish(core::PortState::Closed);
            return;
        }
        self->finish(core::PortState::Open);
    });

    timer.expires_after(timeout);
    timer.async_wait([self, timeout](const asio::error_code& ec) {
        if (ec || self->completed) {
            return;
        }
        spdlog::debug("UDP {}:{} silent for {}ms, reporting open|filtered", self->address,
                      self->port, timeout.count());
        self->finish(core::PortState::Open);
    });
}

} // namespace portprobe::infra
