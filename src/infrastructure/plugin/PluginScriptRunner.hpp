#pragma once

#include "core/plugin/IScanScript.hpp"
#include "core/services/IScriptRunner.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace portprobe::infra {

/**
 * @brief Raised when a script plugin cannot be loaded.
 */
class ScriptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief State of a loaded script plugin.
 */
struct LoadedScript {
    std::shared_ptr<core::IScanScript> instance; ///< Script instance.
    void* handle{nullptr};                       ///< Shared library handle.
    std::filesystem::path path;                  ///< Path to the plugin file.
};

/**
 * @brief A script library found in a directory, with its metadata.
 */
struct ScriptListing {
    std::filesystem::path path;
    core::ScriptMetadata metadata;
};

/**
 * @brief Runs scripts packaged as shared libraries.
 *
 * The script identifier is the path of a library exporting
 * portprobe_create_script and portprobe_destroy_script. A library is opened
 * on first use and stays loaded until the runner is destroyed.
 *
 * @note This class is non-copyable.
 */
class PluginScriptRunner : public core::IScriptRunner {
public:
    PluginScriptRunner() = default;

    /**
     * @brief Destructor. Destroys all script instances and closes their libraries.
     */
    ~PluginScriptRunner() override;

    PluginScriptRunner(const PluginScriptRunner&) = delete;
    PluginScriptRunner& operator=(const PluginScriptRunner&) = delete;

    /**
     * @brief Runs a script against a host and optional port.
     *
     * An exception thrown by the script is reported as an unsuccessful
     * result rather than propagated.
     *
     * @throws ScriptError if the library cannot be loaded.
     */
    core::ScriptResult runScript(const std::string& scriptId, const std::string& host,
                                 std::optional<uint16_t> port) override;

    /**
     * @brief Loads a script library, or returns the already loaded instance.
     * @param path Path to the script shared library.
     * @return Metadata of the loaded script.
     * @throws ScriptError if the file is missing, cannot be opened, or lacks
     *         the required symbols.
     */
    const core::ScriptMetadata& load(const std::filesystem::path& path);

    /**
     * @brief Loads every script library in a directory.
     *
     * Files with the platform's shared library extension are loaded in path
     * order. A library that fails to load is logged and left out.
     *
     * @param directory Directory to search (not recursive).
     * @return One entry per loaded script, sorted by path.
     * @throws ScriptError if the directory does not exist.
     */
    std::vector<ScriptListing> listScripts(const std::filesystem::path& directory);

    /**
     * @brief Destroys all script instances and closes their libraries.
     */
    void unloadAll();

private:
    std::shared_ptr<core::IScanScript> instanceFor(const std::string& scriptId);

    static void* openLibrary(const std::filesystem::path& path);
    static void closeLibrary(void* handle);
    static void* getSymbol(void* handle, const std::string& name);
    static std::string lastLibraryError();

    std::map<std::string, LoadedScript> loadedScripts_;
    mutable std::mutex mutex_;
};

} // namespace portprobe::infra
