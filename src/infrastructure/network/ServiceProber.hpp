#pragma once

#include "core/probe/ProbeDatabase.hpp"
#include "core/types/PortScanResult.hpp"

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace portprobe::infra {

/**
 * @brief Identifies the service behind an open TCP port by sending probes.
 *
 * Every probe of the port's probe plan runs on a fresh connection with its
 * own deadline covering connect, write and read. A failed or silent attempt
 * moves on to the next probe; the first response matching a rule ends the
 * chain. Errors never leave this class, they only produce an empty result.
 */
class ServiceProber : public std::enable_shared_from_this<ServiceProber> {
public:
    using DetectHandler = std::function<void(std::optional<core::ServiceInfo>)>;
    using BannerHandler = std::function<void(std::optional<std::string>)>;

    static constexpr size_t ResponseBufferSize = 4096;  ///< Bytes read per probe
    static constexpr size_t BannerBufferSize = 1024;    ///< Bytes read by a banner grab

    /**
     * @brief Runs probe-based detection against an endpoint.
     * @param context I/O context to run the exchanges on.
     * @param endpoint Open TCP endpoint.
     * @param database Probe database; kept alive until the handler runs.
     * @param timeout Deadline applied to each probe attempt.
     * @param handler Invoked exactly once with the detected service or nullopt.
     */
    static void detectAsync(asio::io_context& context, const asio::ip::tcp::endpoint& endpoint,
                            std::shared_ptr<const core::ProbeDatabase> database,
                            std::chrono::milliseconds timeout, DetectHandler handler);

    /**
     * @brief Connects and reads whatever the service sends first.
     *
     * Used when service detection is requested but no probe database is
     * available. The banner is trimmed; an empty read yields nullopt.
     */
    static void grabBannerAsync(asio::io_context& context, const asio::ip::tcp::endpoint& endpoint,
                                std::chrono::milliseconds timeout, BannerHandler handler);

private:
    ServiceProber(asio::io_context& context, const asio::ip::tcp::endpoint& endpoint,
                  std::shared_ptr<const core::ProbeDatabase> database,
                  std::chrono::milliseconds timeout, DetectHandler handler);

    void tryNextProbe();

    asio::io_context& context_;
    asio::ip::tcp::endpoint endpoint_;
    std::shared_ptr<const core::ProbeDatabase> database_;
    std::vector<const core::ProbeEntry*> plan_;
    size_t nextProbe_{0};
    std::chrono::milliseconds timeout_;
    DetectHandler handler_;
};

} // namespace portprobe::infra
