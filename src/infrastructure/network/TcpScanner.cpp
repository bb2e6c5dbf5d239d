#include "infrastructure/network/TcpScanner.hpp"

#include "infrastructure/network/ConnectClassifier.hpp"
#include "infrastructure/network/ServiceProber.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <mutex>

namespace portprobe::infra {

/// Shared state of one scanAsync() call. Results are joined here and the
/// promise is fulfilled once every port reached a terminal state.
struct TcpScanner::ScanRun {
    explicit ScanRun(asio::io_context& context) : io(context) {}

    asio::io_context& io;
    TcpScanOptions options;
    std::shared_ptr<const core::ProbeDatabase> probes;
    core::ScanTarget target;
    asio::ip::address address;
    ProgressCallback onProgress;
    size_t totalPorts{0};

    std::mutex mutex;
    std::vector<core::PortScanResult> results;
    core::PortScanProgress progress;
    std::promise<std::vector<core::PortScanResult>> promise;
};

/// One connection attempt. Socket and timer share a strand.
struct TcpScanner::ConnectAttempt {
    explicit ConnectAttempt(asio::io_context& context)
        : strand(asio::make_strand(context)), socket(strand), timer(strand) {}

    asio::strand<asio::io_context::executor_type> strand;
    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    PermitPool::Permit permit;
    core::PortScanResult result;
    std::atomic<bool> completed{false};
};

TcpScanner::TcpScanner(ScanWorkerPool& workers, std::shared_ptr<PermitPool> permits,
                       TcpScanOptions options, std::shared_ptr<const core::ProbeDatabase> probes)
    : workers_(workers), permits_(std::move(permits)), options_(options),
      probes_(std::move(probes)) {}

std::future<std::vector<core::PortScanResult>>
TcpScanner::scanAsync(const core::ScanTarget& target, const std::vector<uint16_t>& ports,
                      ProgressCallback onProgress) {
    auto run = std::make_shared<ScanRun>(workers_.io());
    run->options = options_;
    run->probes = probes_;
    run->target = target;
    run->onProgress = std::move(onProgress);
    run->totalPorts = ports.size();
    run->progress.totalPorts = static_cast<int>(ports.size());

    auto future = run->promise.get_future();

    if (ports.empty()) {
        spdlog::warn("No ports to scan on {}", target.displayName);
        run->promise.set_value({});
        return future;
    }

    asio::error_code ec;
    run->address = asio::ip::make_address(target.address, ec);
    if (ec) {
        spdlog::error("Cannot scan {}: '{}' is not an IP address", target.displayName,
                      target.address);
        for (uint16_t port : ports) {
            core::PortScanResult result;
            result.targetAddress = target.address;
            result.port = port;
            result.state = core::PortState::Closed;
            finishPort(run, std::move(result));
        }
        return future;
    }

    spdlog::info("Starting TCP scan of {} ({}) on {} ports", target.displayName, target.address,
                 ports.size());

    for (uint16_t port : ports) {
        permits_->acquire([run, port](PermitPool::Permit permit) {
            startAttempt(run, port, std::move(permit));
        });
    }

    return future;
}

void TcpScanner::startAttempt(const std::shared_ptr<ScanRun>& run, uint16_t port,
                              PermitPool::Permit permit) {
    auto attempt = std::make_shared<ConnectAttempt>(run->io);
    attempt->permit = std::move(permit);
    attempt->result.targetAddress = run->target.address;
    attempt->result.port = port;
    attempt->result.protocol = core::Protocol::Tcp;

    asio::ip::tcp::endpoint endpoint(run->address, port);

    asio::dispatch(attempt->strand, [run, attempt, endpoint]() {
        // Start timeout timer
        attempt->timer.expires_after(run->options.timeout);
        attempt->timer.async_wait([run, attempt](const asio::error_code& ec) {
            if (ec || attempt->completed.exchange(true)) {
                return; // Timer cancelled or already completed
            }

            asio::error_code ignored;
            attempt->socket.close(ignored);
            spdlog::debug("{}:{} timed out after {}ms", run->target.address,
                          attempt->result.port, run->options.timeout.count());
            settle(run, attempt, classifyConnectOutcome({}, true));
        });

        // Start async connect
        attempt->socket.async_connect(endpoint, [run, attempt](const asio::error_code& ec) {
            if (attempt->completed.exchange(true)) {
                return; // Already completed (timeout)
            }

            attempt->timer.cancel();

            auto state = classifyConnectOutcome(ec, false);

            asio::error_code ignored;
            attempt->socket.close(ignored);
            settle(run, attempt, state);
        });
    });
}

void TcpScanner::settle(const std::shared_ptr<ScanRun>& run,
                        const std::shared_ptr<ConnectAttempt>& attempt, core::PortState state) {
    // The connect resolved: the permit is returned before any service detection
    attempt->permit.reset();
    attempt->result.state = state;

    if (state != core::PortState::Open || !run->options.serviceDetection) {
        finishPort(run, attempt->result);
        return;
    }

    asio::ip::tcp::endpoint endpoint(run->address, attempt->result.port);

    if (run->probes) {
        ServiceProber::detectAsync(
            run->io, endpoint, run->probes, run->options.serviceTimeout,
            [run, result = attempt->result](std::optional<core::ServiceInfo> service) mutable {
                result.service = std::move(service);
                finishPort(run, std::move(result));
            });
    } else {
        ServiceProber::grabBannerAsync(
            run->io, endpoint, run->options.serviceTimeout,
            [run, result = attempt->result](std::optional<std::string> banner) mutable {
                result.banner = std::move(banner);
                finishPort(run, std::move(result));
            });
    }
}

void TcpScanner::finishPort(const std::shared_ptr<ScanRun>& run, core::PortScanResult result) {
    std::vector<core::PortScanResult> finished;
    bool complete = false;

    {
        std::lock_guard lock(run->mutex);
        if (result.state == core::PortState::Open) {
            ++run->progress.openPorts;
        }
        ++run->progress.scannedPorts;
        run->results.push_back(std::move(result));

        // Progress is reported under the lock so that no callback runs after the join
        if (run->onProgress) {
            run->onProgress(run->progress);
        }

        if (static_cast<size_t>(run->progress.scannedPorts) == run->totalPorts) {
            finished = std::move(run->results);
            complete = true;
        }
    }

    if (!complete) {
        return;
    }

    std::stable_sort(finished.begin(), finished.end(),
                     [](const core::PortScanResult& a, const core::PortScanResult& b) {
                         return a.port < b.port;
                     });

    auto openCount = std::count_if(finished.begin(), finished.end(), [](const auto& r) {
        return r.state == core::PortState::Open;
    });
    spdlog::info("TCP scan of {} complete: {} open of {} ports", run->target.displayName,
                 openCount, finished.size());

    run->promise.set_value(std::move(finished));
}

} // namespace portprobe::infra
