/**
 * @file IScanScript.hpp
 * @brief Interface implemented by post-scan script plugins.
 *
 * A script plugin is a shared library exporting two C functions,
 * portprobe_create_script and portprobe_destroy_script, that create and
 * destroy an IScanScript instance.
 */

#pragma once

#include "core/types/ScriptResult.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace portprobe::core {

/**
 * @brief Metadata describing a script plugin.
 */
struct ScriptMetadata {
    std::string id;          ///< Unique script identifier
    std::string name;        ///< Human-readable script name
    std::string version;     ///< Script version string
    std::string description; ///< What the script reports

    /**
     * @brief Serializes the metadata to JSON.
     * @return JSON representation of the metadata.
     */
    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{
            {"id", id}, {"name", name}, {"version", version}, {"description", description}};
    }
};

/**
 * @brief A script run once per scanned host and once per open port.
 *
 * Implementations must be safe to call repeatedly from a single thread.
 */
class IScanScript {
public:
    virtual ~IScanScript() = default;

    /**
     * @brief Gets the script metadata.
     * @return Reference to the script's metadata.
     */
    [[nodiscard]] virtual const ScriptMetadata& metadata() const = 0;

    /**
     * @brief Runs the script.
     * @param host Display name of the target host.
     * @param port Open port, or nullopt for the host-level run.
     * @return Script outcome; failures are reported in the result.
     */
    virtual ScriptResult run(const std::string& host, std::optional<uint16_t> port) = 0;
};

using CreateScriptFunc = IScanScript* (*)();
using DestroyScriptFunc = void (*)(IScanScript*);

} // namespace portprobe::core
