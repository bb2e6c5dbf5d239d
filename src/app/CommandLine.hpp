#pragma once

#include "infrastructure/config/ConfigManager.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace portprobe::app {

/**
 * @brief Raised for malformed command lines. The process exits with status 2.
 */
class CommandLineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Settings given on the command line.
 *
 * Only the options actually present are set, so that they can be applied
 * on top of the defaults and the configuration file.
 */
struct CommandLineOptions {
    std::vector<std::string> targets;  ///< -t/--target and positional arguments
    std::optional<std::string> ports;
    std::optional<bool> tcp;
    std::optional<bool> udp;
    std::optional<int> timeoutMs;
    std::optional<bool> serviceDetection;
    std::optional<int> serviceTimeoutMs;
    std::optional<int> concurrency;
    std::optional<int> ioThreads;
    std::optional<std::string> probesFile;
    std::optional<bool> reverseDns;
    std::optional<std::string> jsonOutput;
    std::optional<std::string> script;
    std::optional<std::string> logFile;
    std::optional<bool> verbose;

    std::optional<std::string> configFile;      ///< --config
    std::optional<std::string> saveConfigFile;  ///< --save-config
    std::optional<std::string> dumpProbesFile;  ///< --dump-probes
    std::optional<std::string> listScriptsDir;  ///< --list-scripts
    bool showHelp{false};
    bool showVersion{false};

    /**
     * @brief Overrides the configuration with every option that was given.
     */
    void applyTo(infra::ScanConfig& config) const;
};

/**
 * @brief Parses argv with getopt_long.
 * @throws CommandLineError on unknown options, missing or invalid values.
 */
CommandLineOptions parseCommandLine(int argc, char* argv[]);

/**
 * @brief Checks the merged configuration for values a run cannot use.
 * @throws CommandLineError describing the first problem found.
 */
void validateConfig(const infra::ScanConfig& config);

/**
 * @brief Returns the usage text.
 */
std::string usage(const std::string& program);

} // namespace portprobe::app
