/**
 * @file ProbeDatabase.hpp
 * @brief In-memory model of an nmap-style service probe database.
 *
 * A ProbeDatabase is built once at start-up, never modified afterwards and
 * shared read-only by every concurrent service detection attempt.
 */

#pragma once

#include "core/types/PortScanResult.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace portprobe::core {

/**
 * @brief Raised when the probe definition file is missing or unreadable.
 *
 * Callers may treat it as non-fatal and continue without service detection.
 */
class ProbeLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A match or softmatch rule of a probe.
 */
struct MatchEntry {
    std::string service;  ///< Service name reported on a match
    std::string pattern;  ///< Regular expression source text
    std::regex regex;     ///< Compiled pattern
    /// Version field templates keyed by tag (p, v, i, h, o, d, cpe).
    /// Templates may reference capture groups as $1..$9.
    std::map<std::string, std::string> versionInfo;
};

/**
 * @brief A single probe definition.
 *
 * The order of matches and softMatches is significant: the first rule that
 * matches a response wins.
 */
struct ProbeEntry {
    Protocol protocol{Protocol::Tcp};
    std::string name;
    std::string payload;                 ///< Fully decoded probe bytes
    bool noPayload{false};               ///< Probe line carried the no-payload option
    std::vector<MatchEntry> matches;
    std::vector<MatchEntry> softMatches;
    std::vector<std::string> ports;      ///< Raw "ports" specs, not expanded
    std::vector<std::string> sslPorts;   ///< Raw "sslports" specs, not expanded
    std::optional<uint32_t> totalWaitMs;
    std::optional<uint32_t> tcpWrappedMs;
    std::optional<uint8_t> rarity;
    std::optional<std::string> fallback; ///< Name of the fallback probe

    /**
     * @brief Checks whether this probe lists the port as a probable port.
     *
     * A port applies when any ports spec contains its decimal text or the
     * "T:<port>" token as a substring.
     */
    [[nodiscard]] bool appliesToPort(uint16_t port) const;

    /**
     * @brief Returns true for the banner-only probe named "NULL".
     */
    [[nodiscard]] bool isNullProbe() const { return name == "NULL"; }
};

/**
 * @brief All probes and excludes parsed from a probe definition file.
 */
struct ProbeDatabase {
    std::vector<std::string> excludes;  ///< Exclude specs, recorded only
    std::vector<ProbeEntry> probes;     ///< Probes in file order

    /**
     * @brief Finds a probe by name and protocol.
     * @return Pointer into this database, or nullptr if absent.
     */
    [[nodiscard]] const ProbeEntry* findProbe(std::string_view name, Protocol protocol) const;

    /**
     * @brief Probes of the protocol whose ports specs apply to the port.
     *
     * Falls back to the GetRequest and GenericLines probes when no probe
     * lists the port. The NULL probe is never part of the result.
     */
    [[nodiscard]] std::vector<const ProbeEntry*> relevantProbes(uint16_t port,
                                                                Protocol protocol) const;

    /**
     * @brief Ordered list of probes to try against a port.
     *
     * For TCP the NULL probe, when present, comes first regardless of the
     * port; the relevant probes follow in file order.
     */
    [[nodiscard]] std::vector<const ProbeEntry*> probePlan(uint16_t port,
                                                           Protocol protocol) const;

    /**
     * @brief Total number of match and softmatch rules across all probes.
     */
    [[nodiscard]] size_t ruleCount() const;
};

/**
 * @brief Serializes a database for inspection (--dump-probes).
 *
 * Payloads are re-escaped so binary probes stay readable.
 */
void to_json(nlohmann::json& j, const MatchEntry& entry);
void to_json(nlohmann::json& j, const ProbeEntry& probe);
void to_json(nlohmann::json& j, const ProbeDatabase& database);

} // namespace portprobe::core
