#include "infrastructure/network/HostResolver.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace portprobe::infra {

bool HostResolver::isIpLiteral(const std::string& host) {
    asio::error_code ec;
    asio::ip::make_address(host, ec);
    return !ec;
}

std::vector<std::string> HostResolver::resolveAll(const std::string& host) {
    if (host.empty()) {
        throw core::ResolutionError("Empty target name");
    }

    if (isIpLiteral(host)) {
        return {host};
    }

    asio::io_context tempContext;
    asio::ip::tcp::resolver resolver(tempContext);

    asio::error_code ec;
    auto endpoints = resolver.resolve(host, "", ec);
    if (ec) {
        throw core::ResolutionError("Failed to resolve " + host + ": " + ec.message());
    }

    std::vector<std::string> addresses;
    for (const auto& entry : endpoints) {
        auto address = entry.endpoint().address().to_string();
        if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
            addresses.push_back(std::move(address));
        }
    }

    if (addresses.empty()) {
        throw core::ResolutionError("No address found for " + host);
    }

    spdlog::debug("Resolved {} to {} address(es), using {}", host, addresses.size(),
                  addresses.front());
    return addresses;
}

std::optional<std::string> HostResolver::reverseResolve(const std::string& address) {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        spdlog::debug("Reverse lookup skipped, '{}' is not an IP address", address);
        return std::nullopt;
    }

    asio::io_context tempContext;
    asio::ip::tcp::resolver resolver(tempContext);

    auto results = resolver.resolve(asio::ip::tcp::endpoint(ip, 0), ec);
    if (ec || results.empty()) {
        spdlog::debug("Reverse lookup of {} failed: {}", address, ec.message());
        return std::nullopt;
    }

    // Without a registered name the resolver echoes the numeric address
    auto name = results.begin()->host_name();
    if (name.empty() || isIpLiteral(name)) {
        spdlog::debug("No name registered for {}", address);
        return std::nullopt;
    }

    spdlog::debug("Reverse lookup of {} gave {}", address, name);
    return name;
}

} // namespace portprobe::infra
