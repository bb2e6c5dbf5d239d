#include "ServiceNameScript.hpp"

#include "core/types/PortScanResult.hpp"

namespace portprobe::plugins {

ServiceNameScript::ServiceNameScript() {
    metadata_.id = "portprobe.example.service-name";
    metadata_.name = "service-name";
    metadata_.version = "1.0.0";
    metadata_.description = "Reports the well-known service name of open ports";
}

core::ScriptResult ServiceNameScript::run(const std::string& host, std::optional<uint16_t> port) {
    core::ScriptResult result;
    result.scriptName = metadata_.name;
    result.host = host;
    result.port = port;
    result.success = true;

    if (!port) {
        result.output = "Scanned host " + host;
        result.data["host"] = host;
        return result;
    }

    auto service = core::ServiceDetector::detectService(*port);
    if (service.empty()) {
        result.output = "Port " + std::to_string(*port) + ": no well-known service";
        service = "unknown";
    } else {
        result.output = "Port " + std::to_string(*port) + " is usually " + service;
    }
    result.data["port"] = std::to_string(*port);
    result.data["service"] = service;

    return result;
}

} // namespace portprobe::plugins

extern "C" {

portprobe::core::IScanScript* portprobe_create_script() {
    return new portprobe::plugins::ServiceNameScript();
}

void portprobe_destroy_script(portprobe::core::IScanScript* script) {
    delete script;
}

}
