#include "app/Application.hpp"

#include "core/probe/ProbeParser.hpp"
#include "infrastructure/network/HostResolver.hpp"
#include "infrastructure/output/ResultPrinter.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

namespace portprobe::app {

Application::Application(infra::ScanConfig config) : config_(std::move(config)) {
    initializeComponents();
}

Application::~Application() {
    scanner_.reset();

    if (workers_) {
        workers_->stop();
    }
    spdlog::debug("Application shut down");
}

void Application::initializeLogging(bool verbose, const std::optional<std::string>& logFile) {
    // Results go to stdout; diagnostics stay on stderr
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    std::optional<std::string> fileError;

    if (logFile) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                *logFile, 5 * 1024 * 1024, 3);
            fileSink->set_level(spdlog::level::debug);
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("portprobe", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    if (fileError) {
        spdlog::warn("Cannot open log file {}: {}", *logFile, *fileError);
    }
}

std::shared_ptr<const core::ProbeDatabase> Application::loadProbes(const std::string& path) {
    try {
        return std::make_shared<const core::ProbeDatabase>(core::loadProbeDatabase(path));
    } catch (const core::ProbeLoadError& e) {
        spdlog::warn("Service detection degraded: {}", e.what());
        return nullptr;
    }
}

void Application::initializeComponents() {
    // Scan workers
    workers_ = std::make_unique<infra::ScanWorkerPool>(config_);
    workers_->start();

    // Probe database
    if (config_.serviceDetection) {
        probes_ = loadProbes(config_.probesFile);
    }

    // Script plugin
    if (config_.script) {
        scriptRunner_ = std::make_shared<infra::PluginScriptRunner>();
    }

    scanner_ = std::make_unique<Scanner>(*workers_, config_,
                                         std::make_shared<infra::HostResolver>(), probes_,
                                         scriptRunner_);

    spdlog::debug("Application components initialized");
}

int Application::run() {
    spdlog::info("PortProbe {} scanning {} target(s)", Version, config_.targets.size());

    auto report = scanner_->run();

    infra::ResultPrinter printer(std::cout);
    printer.print(report);

    if (config_.jsonOutput && !infra::ResultPrinter::writeJson(report, *config_.jsonOutput)) {
        return 1;
    }

    return 0;
}

} // namespace portprobe::app
