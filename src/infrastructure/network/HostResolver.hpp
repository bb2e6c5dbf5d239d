#pragma once

#include "core/services/IHostResolver.hpp"

#include <optional>
#include <string>
#include <vector>

namespace portprobe::infra {

/**
 * @brief DNS resolution through the Asio resolver.
 *
 * IP literals are returned unchanged without a lookup. Names are resolved
 * synchronously; duplicate addresses are dropped, order is kept. Reverse
 * lookups go through getnameinfo.
 */
class HostResolver : public core::IHostResolver {
public:
    std::vector<std::string> resolveAll(const std::string& host) override;

    std::optional<std::string> reverseResolve(const std::string& address) override;

    /**
     * @brief Checks whether the text is an IPv4 or IPv6 literal.
     */
    static bool isIpLiteral(const std::string& host);
};

} // namespace portprobe::infra
