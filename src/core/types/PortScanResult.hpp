/**
 * @file PortScanResult.hpp
 * @brief Port scanning types, results, and target descriptions.
 *
 * This file defines the types produced by the TCP and UDP scanners: port
 * states, protocols, detected service information and per-port results.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace portprobe::core {

/**
 * @brief Possible states of a scanned port.
 *
 * UDP scans only produce Open and Closed; Open then means "open or filtered".
 */
enum class PortState : int {
    Unknown = 0,  ///< Port state could not be determined
    Open = 1,     ///< Port is accepting connections
    Closed = 2,   ///< Port is reachable but not accepting connections
    Filtered = 3  ///< Port is filtered by a firewall (no response)
};

/**
 * @brief Transport protocol a port was scanned over.
 */
enum class Protocol : int {
    Tcp = 0,
    Udp = 1
};

/**
 * @brief Service identification extracted from a probe response.
 *
 * Confidence is a policy constant: 90 for a hard match, 50 for a soft match.
 */
struct ServiceInfo {
    static constexpr int HardMatchConfidence = 90;
    static constexpr int SoftMatchConfidence = 50;

    std::string service;                    ///< Service name from the match rule
    std::optional<std::string> version;     ///< Version (v/ field)
    std::optional<std::string> product;     ///< Product name (p/ field)
    std::optional<std::string> extraInfo;   ///< Extra information (i/ field)
    std::optional<std::string> hostname;    ///< Hostname (h/ field)
    std::optional<std::string> osInfo;      ///< Operating system (o/ field)
    std::optional<std::string> deviceType;  ///< Device type (d/ field)
    std::optional<std::string> cpe;         ///< CPE identifier (cpe:/ field)
    int confidence{HardMatchConfidence};    ///< Match confidence (0-100)

    bool operator==(const ServiceInfo& other) const = default;
};

/**
 * @brief A resolved scan target.
 *
 * The display name is retained for output only and has no effect on the scan.
 */
struct ScanTarget {
    std::string address;      ///< Resolved IP literal
    std::string displayName;  ///< Identifier the user supplied (hostname or IP)
    std::optional<std::string> reverseName;  ///< PTR name, when reverse DNS was requested and found

    bool operator==(const ScanTarget& other) const = default;
};

/**
 * @brief Result of scanning a single port.
 *
 * Contains the state of the port and any detected service information.
 */
struct PortScanResult {
    std::string targetAddress;            ///< Address that was scanned
    uint16_t port{0};                     ///< Port number that was scanned
    Protocol protocol{Protocol::Tcp};     ///< Protocol used for the scan
    PortState state{PortState::Unknown};  ///< Terminal state of the port
    std::optional<ServiceInfo> service;   ///< Detected service (open TCP ports only)
    std::optional<std::string> banner;    ///< Raw banner when probe detection is unavailable

    /**
     * @brief Converts this result's port state to a string.
     * @return String representation of the state (e.g., "Open", "Closed").
     */
    [[nodiscard]] std::string stateToString() const;

    /**
     * @brief Converts a PortState enum to a string.
     * @param state The port state to convert.
     * @return String representation of the state.
     */
    static std::string portStateToString(PortState state);

    bool operator==(const PortScanResult& other) const = default;
};

/**
 * @brief Converts a Protocol to its display name ("TCP" or "UDP").
 */
std::string protocolToString(Protocol protocol);

/**
 * @brief Utility class for naming services by well-known port number.
 *
 * Used as a display fallback when no probe-based detection result exists.
 */
class ServiceDetector {
public:
    /**
     * @brief Detects the likely service running on a port.
     * @param port The port number to look up.
     * @return Service name if known, empty string otherwise.
     */
    static std::string detectService(uint16_t port);

    /**
     * @brief Gets the map of known port-to-service mappings.
     * @return Reference to the map of port numbers to service names.
     */
    static const std::unordered_map<uint16_t, std::string>& getKnownServices();
};

} // namespace portprobe::core
