#include "infrastructure/network/ConnectClassifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace portprobe::infra {

core::PortState classifyConnectError(const std::error_code& error) {
    if (error == std::errc::connection_refused) {
        return core::PortState::Closed;
    }

    if (error == std::errc::timed_out || error == std::errc::permission_denied ||
        error == std::errc::operation_not_permitted || error == std::errc::network_unreachable ||
        error == std::errc::host_unreachable) {
        return core::PortState::Filtered;
    }

    auto state = classifyErrorMessage(error.message());
    spdlog::debug("Connect error '{}' ({}) classified as {} by message", error.message(),
                  error.value(), core::PortScanResult::portStateToString(state));
    return state;
}

core::PortState classifyConnectOutcome(const std::error_code& error, bool deadlineExpired) {
    if (deadlineExpired) {
        return core::PortState::Filtered;
    }
    return error ? classifyConnectError(error) : core::PortState::Open;
}

core::PortState classifyErrorMessage(std::string_view message) {
    std::string lower(message);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.find("refused") != std::string::npos) {
        return core::PortState::Closed;
    }

    if (lower.find("timeout") != std::string::npos ||
        lower.find("unreachable") != std::string::npos ||
        lower.find("filtered") != std::string::npos) {
        return core::PortState::Filtered;
    }

    return core::PortState::Closed;
}

} // namespace portprobe::infra
