#pragma once

#include "core/services/IPortScanner.hpp"
#include "infrastructure/network/ScanWorkerPool.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace portprobe::infra {

/**
 * @brief Returns the probe datagram sent to a UDP port.
 *
 * DNS (53) gets an A query, SNMP (161) a v1 GetRequest for sysDescr with
 * community "public", NTP (123) a client request. Any other port gets an
 * empty datagram.
 */
std::vector<uint8_t> udpProbePayload(uint16_t port);

/**
 * @brief UDP scanner.
 *
 * The ports of a target are probed one after the other. Each exchange is a
 * chain of asynchronous operations on the worker pool's I/O context: a send,
 * then a receive raced against a timer. No worker thread ever waits on a
 * single port, so several targets and TCP scans progress alongside.
 *
 * A reply marks the port Open. A bind or send failure, or a receive error
 * such as an ICMP port unreachable, marks it Closed. Silence until the
 * timeout also counts as Open, since an open service that ignores the
 * datagram cannot be told apart from a filtering firewall. Only Open and
 * Closed are ever reported.
 */
class UdpScanner : public core::IPortScanner {
public:
    using StateHandler = std::function<void(core::PortState)>;

    /**
     * @brief Constructs a UdpScanner.
     * @param workers Pool whose I/O context runs the exchanges.
     * @param timeout Receive deadline per port.
     */
    UdpScanner(ScanWorkerPool& workers, std::chrono::milliseconds timeout);

    std::future<std::vector<core::PortScanResult>>
    scanAsync(const core::ScanTarget& target, const std::vector<uint16_t>& ports,
              ProgressCallback onProgress) override;

    [[nodiscard]] core::Protocol protocol() const override { return core::Protocol::Udp; }

    /**
     * @brief Classifies a single UDP port without blocking.
     * @param io I/O context running the exchange.
     * @param address IP literal of the target.
     * @param port Destination port.
     * @param timeout Receive deadline.
     * @param onDone Invoked once on an I/O thread with Open or Closed.
     */
    static void probePortAsync(asio::io_context& io, const std::string& address, uint16_t port,
                               std::chrono::milliseconds timeout, StateHandler onDone);

private:
    struct ScanRun;
    struct Exchange;

    static void scanNext(const std::shared_ptr<ScanRun>& run);

    ScanWorkerPool& workers_;
    std::chrono::milliseconds timeout_;
};

} // namespace portprobe::infra
