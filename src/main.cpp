#include "app/Application.hpp"
#include "app/CommandLine.hpp"
#include "core/probe/ProbeParser.hpp"
#include "core/services/IHostResolver.hpp"
#include "infrastructure/plugin/PluginScriptRunner.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>

namespace {

constexpr int ExitUsage = 2;

int dumpProbes(const std::string& probesFile, const std::string& outputPath) {
    auto database = portprobe::core::loadProbeDatabase(probesFile);

    std::ofstream file(outputPath);
    if (!file) {
        spdlog::error("Failed to open {} for writing", outputPath);
        return 1;
    }

    nlohmann::json j = database;
    file << j.dump(2) << "\n";
    spdlog::info("Probe database written to {}", outputPath);
    return 0;
}

int listScripts(const std::string& directory) {
    portprobe::infra::PluginScriptRunner runner;
    auto listings = runner.listScripts(directory);

    if (listings.empty()) {
        std::cout << "No scripts found in " << directory << "\n";
        return 0;
    }

    for (const auto& listing : listings) {
        const auto& metadata = listing.metadata;
        std::cout << metadata.name << " " << metadata.version << "  " << metadata.id << "\n"
                  << "  " << listing.path.string() << "\n";
        if (!metadata.description.empty()) {
            std::cout << "  " << metadata.description << "\n";
        }
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace portprobe;

    const std::string program = argc > 0 ? argv[0] : "portprobe";

    app::CommandLineOptions options;
    try {
        options = app::parseCommandLine(argc, argv);
    } catch (const app::CommandLineError& e) {
        std::cerr << program << ": " << e.what() << "\n\n" << app::usage(program);
        return ExitUsage;
    }

    if (options.showHelp) {
        std::cout << app::usage(program);
        return 0;
    }
    if (options.showVersion) {
        std::cout << "portprobe " << app::Application::Version << "\n";
        return 0;
    }

    app::Application::initializeLogging(options.verbose.value_or(false), options.logFile);

    try {
        // Defaults, then the configuration file, then the command line
        infra::ScanConfig config;
        if (options.configFile) {
            infra::ConfigManager manager(*options.configFile);
            if (!manager.load()) {
                return 1;
            }
            config = manager.config();
        }
        options.applyTo(config);
        app::Application::initializeLogging(config.verbose, config.logFile);

        if (options.saveConfigFile) {
            infra::ConfigManager manager(*options.saveConfigFile);
            manager.config() = config;
            return manager.save() ? 0 : 1;
        }

        if (options.dumpProbesFile) {
            return dumpProbes(config.probesFile, *options.dumpProbesFile);
        }

        if (options.listScriptsDir) {
            return listScripts(*options.listScriptsDir);
        }

        try {
            app::validateConfig(config);
        } catch (const app::CommandLineError& e) {
            std::cerr << program << ": " << e.what() << "\n\n" << app::usage(program);
            return ExitUsage;
        }

        app::Application application(std::move(config));
        return application.run();
    } catch (const core::ResolutionError& e) {
        spdlog::critical("Target resolution failed: {}", e.what());
        return 1;
    } catch (const infra::ScriptError& e) {
        spdlog::critical("Script listing failed: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
