/**
 * @file IHostResolver.hpp
 * @brief Interface for turning user-supplied target names into scan targets.
 */

#pragma once

#include "core/types/PortScanResult.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace portprobe::core {

/**
 * @brief Raised when a target name resolves to no address.
 *
 * Resolution failures are fatal for the whole run.
 */
class ResolutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Name resolution collaborator of the scanner.
 */
class IHostResolver {
public:
    virtual ~IHostResolver() = default;

    /**
     * @brief Resolves a host name to its IP literals, in resolver order.
     * @param host Host name or IP literal.
     * @return At least one IP literal.
     * @throws ResolutionError if no address is found.
     */
    virtual std::vector<std::string> resolveAll(const std::string& host) = 0;

    /**
     * @brief Looks up the host name registered for an address.
     * @param address IP literal.
     * @return The name, or nullopt when the address has none.
     */
    virtual std::optional<std::string> reverseResolve(const std::string& address) = 0;

    /**
     * @brief Resolves a target, keeping only the first address.
     * @param host Identifier the user supplied.
     * @return Target with the first address and the original identifier.
     * @throws ResolutionError if no address is found.
     */
    ScanTarget resolve(const std::string& host) {
        auto addresses = resolveAll(host);
        if (addresses.empty()) {
            throw ResolutionError("No address found for " + host);
        }
        return ScanTarget{addresses.front(), host};
    }
};

} // namespace portprobe::core
