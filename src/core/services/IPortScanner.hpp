/**
 * @file IPortScanner.hpp
 * @brief Interface for the port scanning services.
 *
 * This file defines the abstract interface shared by the TCP and UDP
 * scanners and the progress information they report.
 */

#pragma once

#include "core/types/PortScanResult.hpp"
#include "core/types/PortSpec.hpp"

#include <functional>
#include <future>
#include <string_view>
#include <vector>

namespace portprobe::core {

/**
 * @brief Progress information during a port scan operation.
 */
struct PortScanProgress {
    int totalPorts{0};    ///< Total number of ports to scan
    int scannedPorts{0};  ///< Number of ports scanned so far
    int openPorts{0};     ///< Number of open ports found

    /**
     * @brief Calculates the completion percentage.
     * @return Percentage of ports scanned (0-100).
     */
    [[nodiscard]] double percentComplete() const {
        return totalPorts > 0 ? (static_cast<double>(scannedPorts) / totalPorts) * 100.0 : 0.0;
    }
};

/**
 * @brief Interface for port scanning services.
 *
 * A scan produces one result per requested port once every port reached a
 * terminal state. Results are joined, not streamed, and carry no ordering
 * guarantee.
 */
class IPortScanner {
public:
    /**
     * @brief Callback function type for progress updates.
     * @param progress Current scan progress information.
     */
    using ProgressCallback = std::function<void(const PortScanProgress&)>;

    virtual ~IPortScanner() = default;

    /**
     * @brief Starts scanning the given ports of a target.
     * @param target Resolved target to scan.
     * @param ports Ports to scan; duplicates are scanned twice.
     * @param onProgress Optional callback for progress updates.
     * @return Future resolving to one result per requested port.
     */
    virtual std::future<std::vector<PortScanResult>> scanAsync(const ScanTarget& target,
                                                               const std::vector<uint16_t>& ports,
                                                               ProgressCallback onProgress) = 0;

    /**
     * @brief Protocol this scanner probes.
     */
    [[nodiscard]] virtual Protocol protocol() const = 0;

    /**
     * @brief Scans a textual port specification and waits for the results.
     * @param target Resolved target to scan.
     * @param portSpec Specification such as "22,80,1000-1010".
     * @return One result per parsed port, empty if the text has no valid port.
     */
    std::vector<PortScanResult> scan(const ScanTarget& target, std::string_view portSpec) {
        return scanAsync(target, parsePortSpec(portSpec), {}).get();
    }
};

} // namespace portprobe::core
