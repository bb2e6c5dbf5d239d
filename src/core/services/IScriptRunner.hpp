/**
 * @file IScriptRunner.hpp
 * @brief Interface for running post-scan scripts.
 */

#pragma once

#include "core/types/ScriptResult.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace portprobe::core {

/**
 * @brief Runs a script identified by name against a host and optional port.
 *
 * The scanner invokes it once per target with no port and once per open
 * port. Results are reported to the user only.
 */
class IScriptRunner {
public:
    virtual ~IScriptRunner() = default;

    /**
     * @brief Runs a script.
     * @param scriptId Script identifier (for plugins, the library path).
     * @param host Target host as displayed to the user.
     * @param port Open port, or nullopt for the host-level run.
     * @return The script outcome.
     * @throws std::runtime_error if the script cannot be loaded.
     */
    virtual ScriptResult runScript(const std::string& scriptId, const std::string& host,
                                   std::optional<uint16_t> port) = 0;
};

} // namespace portprobe::core
