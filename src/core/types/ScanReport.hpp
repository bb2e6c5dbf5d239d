/**
 * @file ScanReport.hpp
 * @brief Joined results of a whole scan run, as handed to the renderers.
 */

#pragma once

#include "core/types/PortScanResult.hpp"
#include "core/types/ScriptResult.hpp"

#include <initializer_list>
#include <optional>
#include <vector>

namespace portprobe::core {

/**
 * @brief Everything learned about one target.
 *
 * A protocol's result list is nullopt when that protocol was not scanned.
 */
struct TargetReport {
    ScanTarget target;
    std::optional<std::vector<PortScanResult>> tcp;  ///< TCP results, sorted by port
    std::optional<std::vector<PortScanResult>> udp;  ///< UDP results, sorted by port
    std::vector<ScriptResult> scripts;               ///< Host-level run first, then per open port

    /**
     * @brief Returns the results of one protocol, or nullptr if it was not scanned.
     */
    [[nodiscard]] const std::vector<PortScanResult>* results(Protocol protocol) const {
        const auto& list = protocol == Protocol::Tcp ? tcp : udp;
        return list ? &*list : nullptr;
    }
};

/**
 * @brief Results of a scan run across all targets, in target order.
 */
struct ScanReport {
    std::vector<TargetReport> targets;
    bool portsExplicit{false};  ///< Show every classified state instead of Open only

    [[nodiscard]] size_t countPorts(PortState state) const {
        size_t count = 0;
        for (const auto& target : targets) {
            for (const auto* list : {target.results(Protocol::Tcp), target.results(Protocol::Udp)}) {
                if (!list) {
                    continue;
                }
                for (const auto& result : *list) {
                    if (result.state == state) {
                        ++count;
                    }
                }
            }
        }
        return count;
    }
};

} // namespace portprobe::core
