/**
 * @file ScriptResult.hpp
 * @brief Outcome of running a post-scan script against a host or port.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace portprobe::core {

/**
 * @brief Result returned by a scan script.
 *
 * Script output is informational only and never feeds back into scan state.
 */
struct ScriptResult {
    std::string scriptName;               ///< Name reported by the script
    std::string host;                     ///< Host the script ran against
    std::optional<uint16_t> port;         ///< Port, or nullopt for the host-level run
    bool success{false};                  ///< Whether the script completed
    std::string output;                   ///< Free-form output text
    std::optional<std::string> error;     ///< Error message when success is false
    std::map<std::string, std::string> data; ///< Structured key/value output

    bool operator==(const ScriptResult& other) const = default;
};

} // namespace portprobe::core
