#pragma once

#include "core/probe/ProbeDatabase.hpp"
#include "core/services/IPortScanner.hpp"
#include "infrastructure/network/ScanWorkerPool.hpp"
#include "infrastructure/network/PermitPool.hpp"

#include <asio.hpp>
#include <chrono>
#include <memory>

namespace portprobe::infra {

/**
 * @brief Per-run settings of the TCP connect scan.
 */
struct TcpScanOptions {
    std::chrono::milliseconds timeout{2000};         ///< Connect deadline per port
    bool serviceDetection{false};                    ///< Probe open ports for their service
    std::chrono::milliseconds serviceTimeout{5000};  ///< Deadline per probe attempt
};

/**
 * @brief Asynchronous TCP connect scanner.
 *
 * Issues one connection attempt per port. Each attempt holds a permit from
 * the shared PermitPool until its connect resolves, so the number of
 * simultaneous connection attempts never exceeds the pool capacity, even
 * across concurrent scans of several targets. Service detection on open
 * ports happens after the permit is returned.
 *
 * Each resolved attempt is mapped by classifyConnectOutcome().
 * Implements the core::IPortScanner interface.
 */
class TcpScanner : public core::IPortScanner {
public:
    /**
     * @brief Constructs a TcpScanner.
     * @param workers Pool whose I/O context runs the attempts.
     * @param permits Pool bounding in-flight connection attempts.
     * @param options Timeouts and service detection switch.
     * @param probes Probe database, or nullptr when none could be loaded.
     *               With detection enabled and no database, a banner grab is
     *               performed instead.
     */
    TcpScanner(ScanWorkerPool& workers, std::shared_ptr<PermitPool> permits, TcpScanOptions options,
               std::shared_ptr<const core::ProbeDatabase> probes = nullptr);

    std::future<std::vector<core::PortScanResult>>
    scanAsync(const core::ScanTarget& target, const std::vector<uint16_t>& ports,
              ProgressCallback onProgress) override;

    [[nodiscard]] core::Protocol protocol() const override { return core::Protocol::Tcp; }

    [[nodiscard]] const TcpScanOptions& options() const { return options_; }

private:
    struct ScanRun;
    struct ConnectAttempt;

    static void startAttempt(const std::shared_ptr<ScanRun>& run, uint16_t port,
                             PermitPool::Permit permit);
    static void settle(const std::shared_ptr<ScanRun>& run,
                       const std::shared_ptr<ConnectAttempt>& attempt, core::PortState state);
    static void finishPort(const std::shared_ptr<ScanRun>& run, core::PortScanResult result);

    ScanWorkerPool& workers_;
    std::shared_ptr<PermitPool> permits_;
    TcpScanOptions options_;
    std::shared_ptr<const core::ProbeDatabase> probes_;
};

} // namespace portprobe::infra
