#pragma once

#include "core/probe/ProbeDatabase.hpp"
#include "core/services/IHostResolver.hpp"
#include "core/services/IPortScanner.hpp"
#include "core/services/IScriptRunner.hpp"
#include "core/types/ScanReport.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/ScanWorkerPool.hpp"
#include "infrastructure/network/PermitPool.hpp"

#include <memory>

namespace portprobe::app {

/**
 * @brief Runs a whole scan: resolution, TCP and UDP scans, and scripts.
 *
 * All targets are resolved before any packet is sent; a target that fails
 * to resolve aborts the run. TCP scans of all targets run concurrently and
 * share one permit pool sized by the concurrency limit.
 */
class Scanner {
public:
    /**
     * @brief Constructs a Scanner.
     * @param workers Started worker pool running the scans.
     * @param config Effective run configuration.
     * @param resolver Name resolution collaborator.
     * @param probes Probe database, or nullptr if unavailable.
     * @param scripts Script runner, or nullptr when no script is configured.
     */
    Scanner(infra::ScanWorkerPool& workers, infra::ScanConfig config,
            std::shared_ptr<core::IHostResolver> resolver,
            std::shared_ptr<const core::ProbeDatabase> probes = nullptr,
            std::shared_ptr<core::IScriptRunner> scripts = nullptr);

    /**
     * @brief Scans every configured target.
     * @return The joined results, in target order.
     * @throws core::ResolutionError if any target cannot be resolved.
     */
    core::ScanReport run();

    /**
     * @brief Pool gating connection attempts, exposed for instrumentation.
     */
    [[nodiscard]] const infra::PermitPool& permits() const { return *permits_; }

private:
    void scanTargets(core::IPortScanner& scanner, const std::vector<uint16_t>& ports,
                     core::ScanReport& report);
    void runScripts(core::TargetReport& report);

    infra::ScanWorkerPool& workers_;
    infra::ScanConfig config_;
    std::shared_ptr<core::IHostResolver> resolver_;
    std::shared_ptr<const core::ProbeDatabase> probes_;
    std::shared_ptr<core::IScriptRunner> scripts_;
    std::shared_ptr<infra::PermitPool> permits_;
};

} // namespace portprobe::app
