#include "app/Scanner.hpp"

#include "core/types/PortSpec.hpp"
#include "infrastructure/network/TcpScanner.hpp"
#include "infrastructure/network/UdpScanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

namespace portprobe::app {

namespace {

constexpr int ProgressLogStep = 100;

core::IPortScanner::ProgressCallback progressLogger(std::string host, core::Protocol protocol) {
    return [host = std::move(host), protocol](const core::PortScanProgress& progress) {
        if (progress.scannedPorts % ProgressLogStep == 0 ||
            progress.scannedPorts == progress.totalPorts) {
            spdlog::debug("{} {}: {}/{} ports scanned ({:.0f}%), {} open",
                          core::protocolToString(protocol), host, progress.scannedPorts,
                          progress.totalPorts, progress.percentComplete(), progress.openPorts);
        }
    };
}

} // namespace

Scanner::Scanner(infra::ScanWorkerPool& workers, infra::ScanConfig config,
                 std::shared_ptr<core::IHostResolver> resolver,
                 std::shared_ptr<const core::ProbeDatabase> probes,
                 std::shared_ptr<core::IScriptRunner> scripts)
    : workers_(workers), config_(std::move(config)), resolver_(std::move(resolver)),
      probes_(std::move(probes)), scripts_(std::move(scripts)),
      permits_(infra::PermitPool::create(workers_.io(),
                                         static_cast<size_t>(std::max(config_.concurrency, 1)))) {}

core::ScanReport Scanner::run() {
    core::ScanReport report;
    report.portsExplicit = config_.portsExplicit;

    auto ports = core::parsePortSpec(config_.ports);
    if (ports.empty()) {
        spdlog::warn("Port specification '{}' contains no valid port", config_.ports);
    }

    // Resolve everything first: a single failure aborts the run
    for (const auto& host : config_.targets) {
        core::TargetReport target;
        target.target = resolver_->resolve(host);
        report.targets.push_back(std::move(target));
    }

    if (config_.reverseDns) {
        for (auto& target : report.targets) {
            target.target.reverseName = resolver_->reverseResolve(target.target.address);
        }
    }

    if (config_.tcp) {
        infra::TcpScanOptions options;
        options.timeout = std::chrono::milliseconds(config_.timeoutMs);
        options.serviceDetection = config_.serviceDetection;
        options.serviceTimeout = std::chrono::milliseconds(config_.serviceTimeoutMs);

        if (config_.serviceDetection && !probes_) {
            spdlog::warn("No probe database available, falling back to banner grabbing");
        }

        infra::TcpScanner scanner(workers_, permits_, options, probes_);
        scanTargets(scanner, ports, report);

        spdlog::debug("Connection permits: capacity {}, peak in flight {}, {} acquired",
                      permits_->capacity(), permits_->peakInFlight(), permits_->totalAcquired());
    }

    if (config_.udp) {
        infra::UdpScanner scanner(workers_, std::chrono::milliseconds(config_.timeoutMs));
        scanTargets(scanner, ports, report);
    }

    if (config_.script && scripts_) {
        for (auto& target : report.targets) {
            runScripts(target);
        }
    }

    return report;
}

void Scanner::scanTargets(core::IPortScanner& scanner, const std::vector<uint16_t>& ports,
                          core::ScanReport& report) {
    const auto protocol = scanner.protocol();
    spdlog::debug("{} scan of {} target(s), {} ports each", core::protocolToString(protocol),
                  report.targets.size(), ports.size());

    // All targets are in flight at once; results are joined in target order
    std::vector<std::future<std::vector<core::PortScanResult>>> pending;
    pending.reserve(report.targets.size());
    for (const auto& target : report.targets) {
        pending.push_back(scanner.scanAsync(target.target, ports,
                                            progressLogger(target.target.displayName, protocol)));
    }

    for (size_t i = 0; i < pending.size(); ++i) {
        auto& slot = protocol == core::Protocol::Udp ? report.targets[i].udp
                                                     : report.targets[i].tcp;
        slot = pending[i].get();
    }
}

void Scanner::runScripts(core::TargetReport& report) {
    const auto& scriptId = *config_.script;
    const auto& host = report.target.displayName;

    std::vector<std::optional<uint16_t>> runs{std::nullopt};
    if (report.tcp) {
        for (const auto& result : *report.tcp) {
            if (result.state == core::PortState::Open) {
                runs.emplace_back(result.port);
            }
        }
    }

    for (const auto& port : runs) {
        try {
            report.scripts.push_back(scripts_->runScript(scriptId, host, port));
        } catch (const std::exception& e) {
            // The script cannot be loaded; report once and skip the remaining runs
            spdlog::warn("Script {} unavailable: {}", scriptId, e.what());
            core::ScriptResult failed;
            failed.scriptName = scriptId;
            failed.host = host;
            failed.port = port;
            failed.success = false;
            failed.error = e.what();
            report.scripts.push_back(std::move(failed));
            return;
        }
    }
}

} // namespace portprobe::app
