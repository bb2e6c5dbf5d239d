#pragma once

#include "app/Scanner.hpp"
#include "core/probe/ProbeDatabase.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/ScanWorkerPool.hpp"
#include "infrastructure/plugin/PluginScriptRunner.hpp"

#include <memory>
#include <optional>
#include <string>

namespace portprobe::app {

/**
 * @brief Command-line application: owns logging and the scan components.
 */
class Application {
public:
    explicit Application(infra::ScanConfig config);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs the scan, prints the report and writes the optional JSON file.
     * @return Process exit status.
     * @throws core::ResolutionError if a target cannot be resolved.
     */
    int run();

    /**
     * @brief Installs the "portprobe" logger: colored stderr sink plus an
     *        optional rotating file sink.
     */
    static void initializeLogging(bool verbose, const std::optional<std::string>& logFile);

    /**
     * @brief Loads the probe database, degrading to nullptr when it is unavailable.
     */
    static std::shared_ptr<const core::ProbeDatabase> loadProbes(const std::string& path);

    static constexpr const char* Version = "1.0.0";

private:
    void initializeComponents();

    infra::ScanConfig config_;
    std::unique_ptr<infra::ScanWorkerPool> workers_;
    std::shared_ptr<const core::ProbeDatabase> probes_;
    std::shared_ptr<infra::PluginScriptRunner> scriptRunner_;
    std::unique_ptr<Scanner> scanner_;
};

} // namespace portprobe::app
