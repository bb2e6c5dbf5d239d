#pragma once

#include "core/types/PortScanResult.hpp"

#include <string_view>
#include <system_error>

namespace portprobe::infra {

/**
 * @brief Maps a failed TCP connect to a port state.
 *
 * Structured error categories are checked first: a refusal is Closed;
 * timed out, permission denied, network unreachable and host unreachable
 * are Filtered. Anything else falls through to classifyErrorMessage().
 *
 * @param error The error the connect attempt completed with (non-zero).
 */
core::PortState classifyConnectError(const std::error_code& error);

/**
 * @brief Maps how a connect attempt ended to a port state.
 *
 * An attempt cut short by its deadline is Filtered whatever the socket
 * reported. Otherwise a clean connect is Open and an error goes through
 * classifyConnectError().
 *
 * @param error Result of the connect, empty on success.
 * @param deadlineExpired True when the per-port timer fired first.
 */
core::PortState classifyConnectOutcome(const std::error_code& error, bool deadlineExpired);

/**
 * @brief Best-effort classification from an error's text.
 *
 * Case-insensitive: "refused" is Closed; "timeout", "unreachable" or
 * "filtered" is Filtered; anything else is Closed.
 */
core::PortState classifyErrorMessage(std::string_view message);

} // namespace portprobe::infra
