#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace portprobe::infra {

/**
 * @brief Returns the default concurrency limit: the number of hardware threads, at least 1.
 */
int defaultConcurrency();

/**
 * @brief Scan run configuration.
 *
 * Contains every setting a run consumes: what to scan, how, and where to
 * report. Values come from the defaults below, then the configuration file,
 * then the command line.
 */
struct ScanConfig {
    // Targets and ports
    std::vector<std::string> targets;  ///< Host names or IP literals.
    std::string ports{"1-1024"};       ///< Port specification text.
    bool portsExplicit{false};         ///< Ports were given by the user; show every state.

    // Protocols
    bool tcp{true};   ///< Run the TCP connect scan.
    bool udp{false};  ///< Run the UDP scan.

    // Timing and concurrency
    int timeoutMs{2000};                  ///< Per-port connect/receive deadline in milliseconds.
    int concurrency{defaultConcurrency()}; ///< Maximum simultaneous connection attempts.
    int ioThreads{4};                     ///< Worker threads running the I/O context.

    // Service detection
    bool serviceDetection{false};                  ///< Probe open TCP ports.
    int serviceTimeoutMs{5000};                    ///< Deadline per probe attempt in milliseconds.
    std::string probesFile{"nmap-service-probes"}; ///< Probe database path.

    // Targets
    bool reverseDns{false};  ///< Look up the host name of every scanned address.

    // Output and extras
    std::optional<std::string> jsonOutput;  ///< Write a JSON report to this path.
    std::optional<std::string> script;      ///< Script plugin run after the scan.
    std::optional<std::string> logFile;     ///< Additional rotating log file.
    bool verbose{false};                    ///< Debug-level console logging.
};

/**
 * @brief Manages scan configuration persistence.
 *
 * Handles loading and saving of the scan configuration from a JSON file.
 * Keys missing from the file keep their current values; unknown keys are
 * ignored.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config file.
     * @param configPath Path to the JSON configuration file.
     */
    explicit ConfigManager(std::filesystem::path configPath);

    /**
     * @brief Loads configuration from disk into config().
     * @return True if loaded (or absent), false if the file is unreadable or malformed.
     */
    bool load();

    /**
     * @brief Saves config() to disk as pretty-printed JSON.
     * @return True if saved successfully, false otherwise.
     */
    bool save() const;

    /**
     * @brief Returns a mutable reference to the configuration.
     * @return Reference to ScanConfig.
     */
    ScanConfig& config() { return config_; }

    /**
     * @brief Returns a const reference to the configuration.
     * @return Const reference to ScanConfig.
     */
    const ScanConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     */
    const std::filesystem::path& configPath() const { return configPath_; }

    static nlohmann::json toJson(const ScanConfig& config);

    /**
     * @brief Applies the keys present in a JSON document on top of a configuration.
     * @throws nlohmann::json::exception if a key has the wrong type.
     */
    static void applyJson(const nlohmann::json& j, ScanConfig& config);

private:
    std::filesystem::path configPath_;
    ScanConfig config_;
};

} // namespace portprobe::infra
