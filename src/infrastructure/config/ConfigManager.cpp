#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <thread>

namespace portprobe::infra {

namespace {

template <typename T>
void assignOptional(const nlohmann::json& j, const char* key, std::optional<T>& target) {
    if (!j.contains(key)) {
        return;
    }
    if (j[key].is_null()) {
        target.reset();
    } else {
        target = j[key].get<T>();
    }
}

template <typename T>
void storeOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

} // namespace

int defaultConcurrency() {
    auto cores = static_cast<int>(std::thread::hardware_concurrency());
    return cores > 0 ? cores : 1;
}

ConfigManager::ConfigManager(std::filesystem::path configPath)
    : configPath_(std::move(configPath)) {}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::warn("Config file {} not found, using defaults", configPath_.string());
        return true;
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            spdlog::error("Config file {} must contain a JSON object", configPath_.string());
            return false;
        }
        applyJson(j, config_);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() const {
    try {
        auto j = toJson(config_);

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson(const ScanConfig& config) {
    nlohmann::json j;

    j["targets"] = config.targets;
    // Written only when chosen by the user; its presence marks the ports as explicit
    if (config.portsExplicit) {
        j["ports"] = config.ports;
    }
    j["tcp"] = config.tcp;
    j["udp"] = config.udp;
    j["timeout_ms"] = config.timeoutMs;
    j["concurrency"] = config.concurrency;
    j["io_threads"] = config.ioThreads;
    j["service_detection"] = config.serviceDetection;
    j["service_timeout_ms"] = config.serviceTimeoutMs;
    j["probes_file"] = config.probesFile;
    j["reverse_dns"] = config.reverseDns;
    storeOptional(j, "json_output", config.jsonOutput);
    storeOptional(j, "script", config.script);
    storeOptional(j, "log_file", config.logFile);
    j["verbose"] = config.verbose;

    return j;
}

void ConfigManager::applyJson(const nlohmann::json& j, ScanConfig& config) {
    config.targets = j.value("targets", config.targets);

    if (j.contains("ports")) {
        config.ports = j["ports"].get<std::string>();
        config.portsExplicit = true;
    }

    config.tcp = j.value("tcp", config.tcp);
    config.udp = j.value("udp", config.udp);
    config.timeoutMs = j.value("timeout_ms", config.timeoutMs);
    config.concurrency = j.value("concurrency", config.concurrency);
    config.ioThreads = j.value("io_threads", config.ioThreads);
    config.serviceDetection = j.value("service_detection", config.serviceDetection);
    config.serviceTimeoutMs = j.value("service_timeout_ms", config.serviceTimeoutMs);
    config.probesFile = j.value("probes_file", config.probesFile);
    config.reverseDns = j.value("reverse_dns", config.reverseDns);
    assignOptional(j, "json_output", config.jsonOutput);
    assignOptional(j, "script", config.script);
    assignOptional(j, "log_file", config.logFile);
    config.verbose = j.value("verbose", config.verbose);
}

} // namespace portprobe::infra
