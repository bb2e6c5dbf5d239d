#include "infrastructure/output/ResultPrinter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>

namespace portprobe::infra {

namespace {

constexpr int PortWidth = 10;
constexpr int StateWidth = 15;
constexpr int ServiceWidth = 16;
constexpr size_t MaxVersionLength = 60;

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<core::PortScanResult> sortedByPort(std::vector<core::PortScanResult> results) {
    std::stable_sort(results.begin(), results.end(),
                     [](const auto& a, const auto& b) { return a.port < b.port; });
    return results;
}

nlohmann::json serviceToJson(const core::ServiceInfo& service) {
    nlohmann::json j;
    j["name"] = service.service;
    if (service.product) j["product"] = *service.product;
    if (service.version) j["version"] = *service.version;
    if (service.extraInfo) j["extra_info"] = *service.extraInfo;
    if (service.hostname) j["hostname"] = *service.hostname;
    if (service.osInfo) j["os"] = *service.osInfo;
    if (service.deviceType) j["device_type"] = *service.deviceType;
    if (service.cpe) j["cpe"] = *service.cpe;
    j["confidence"] = service.confidence;
    return j;
}

nlohmann::json scriptToJson(const core::ScriptResult& result) {
    nlohmann::json j;
    j["script"] = result.scriptName;
    j["host"] = result.host;
    j["port"] = result.port ? nlohmann::json(*result.port) : nlohmann::json(nullptr);
    j["success"] = result.success;
    j["output"] = result.output;
    if (result.error) {
        j["error"] = *result.error;
    }
    j["data"] = result.data;
    return j;
}

nlohmann::json scanToJson(const std::vector<core::PortScanResult>& results,
                          core::Protocol protocol) {
    nlohmann::json ports = nlohmann::json::object();
    for (const auto& result : results) {
        nlohmann::json entry;
        entry["state"] = result.stateToString();
        if (result.service) {
            entry["service"] = serviceToJson(*result.service);
        }
        if (result.banner) {
            entry["banner"] = *result.banner;
        }
        ports[std::to_string(result.port)] = std::move(entry);
    }

    return nlohmann::json{{"protocol", core::protocolToString(protocol)}, {"ports", ports}};
}

} // namespace

ResultPrinter::ResultPrinter(std::ostream& out) : out_(out) {}

void ResultPrinter::print(const core::ScanReport& report) {
    for (const auto& target : report.targets) {
        out_ << "\nScan report for " << target.target.displayName;
        if (target.target.displayName != target.target.address) {
            out_ << " (" << target.target.address << ")";
        }
        out_ << "\n";
        if (target.target.reverseName) {
            out_ << "rDNS record for " << target.target.address << ": "
                 << *target.target.reverseName << "\n";
        }

        for (auto protocol : {core::Protocol::Tcp, core::Protocol::Udp}) {
            const auto* results = target.results(protocol);
            if (!results) {
                continue;
            }
            printTable(*results, protocol, report.portsExplicit);
            printServiceDetails(*results);
        }

        if (!target.scripts.empty()) {
            out_ << "\nScript Results:\n";
            for (const auto& script : target.scripts) {
                printScriptResult(script);
            }
        }
    }
    out_.flush();
}

void ResultPrinter::printTable(const std::vector<core::PortScanResult>& results,
                               core::Protocol protocol, bool showAll) {
    const auto protocolName = core::protocolToString(protocol);

    if (results.empty()) {
        out_ << "No ports found for " << protocolName << " scan\n";
        return;
    }

    auto sorted = sortedByPort(results);
    size_t open = 0;
    size_t closed = 0;
    size_t filtered = 0;
    size_t shown = 0;

    out_ << "\n" << protocolName << " Scan Results:\n";
    out_ << std::left << std::setw(PortWidth) << "PORT" << std::setw(StateWidth) << "STATE"
         << std::setw(ServiceWidth) << "SERVICE" << "VERSION\n";

    for (const auto& result : sorted) {
        switch (result.state) {
        case core::PortState::Open:
            ++open;
            break;
        case core::PortState::Closed:
            ++closed;
            break;
        case core::PortState::Filtered:
            ++filtered;
            break;
        case core::PortState::Unknown:
            break;
        }

        if (!showAll && result.state != core::PortState::Open) {
            continue;
        }
        ++shown;

        auto port = std::to_string(result.port) + "/" + toLower(protocolName);
        out_ << std::left << std::setw(PortWidth) << port << std::setw(StateWidth)
             << stateLabel(result) << std::setw(ServiceWidth) << serviceLabel(result)
             << versionLabel(result) << "\n";
    }

    if (shown == 0) {
        out_ << "(no open ports)\n";
    }

    out_ << "Summary: " << open << " open, " << closed << " closed, " << filtered
         << " filtered\n";
}

void ResultPrinter::printServiceDetails(const std::vector<core::PortScanResult>& results) {
    auto sorted = sortedByPort(results);
    bool headerPrinted = false;

    for (const auto& result : sorted) {
        if (!result.service) {
            continue;
        }
        if (!headerPrinted) {
            out_ << "\nService Detection Results:\n";
            out_ << std::string(60, '-') << "\n";
            headerPrinted = true;
        }

        const auto& service = *result.service;
        out_ << "Port " << result.port << ": " << service.service << "\n";
        if (service.product) out_ << "  Product: " << *service.product << "\n";
        if (service.version) out_ << "  Version: " << *service.version << "\n";
        if (service.extraInfo) out_ << "  Extra Info: " << *service.extraInfo << "\n";
        if (service.hostname) out_ << "  Hostname: " << *service.hostname << "\n";
        if (service.osInfo) out_ << "  OS: " << *service.osInfo << "\n";
        if (service.deviceType) out_ << "  Device Type: " << *service.deviceType << "\n";
        if (service.cpe) out_ << "  CPE: " << *service.cpe << "\n";
        out_ << "  Confidence: " << service.confidence << "\n";
    }
}

void ResultPrinter::printScriptResult(const core::ScriptResult& result) {
    out_ << "[" << result.scriptName << "] " << result.host;
    if (result.port) {
        out_ << ":" << *result.port;
    }
    out_ << "\n";

    if (!result.success) {
        out_ << "  Script failed: " << result.error.value_or("unknown error") << "\n";
        return;
    }

    if (!result.output.empty()) {
        out_ << "  Output: " << result.output << "\n";
    }
    if (!result.data.empty()) {
        out_ << "  Data:\n";
        for (const auto& [key, value] : result.data) {
            out_ << "    " << key << ": " << value << "\n";
        }
    }
    if (result.output.empty() && result.data.empty()) {
        out_ << "  Script executed successfully (no output)\n";
    }
}

nlohmann::json ResultPrinter::toJson(const core::ScanReport& report) {
    nlohmann::json targets = nlohmann::json::array();

    for (const auto& target : report.targets) {
        nlohmann::json entry;
        entry["host"] = target.target.displayName;
        entry["address"] = target.target.address;
        if (target.target.reverseName) {
            entry["reverse_dns"] = *target.target.reverseName;
        }

        nlohmann::json scans = nlohmann::json::array();
        for (auto protocol : {core::Protocol::Tcp, core::Protocol::Udp}) {
            if (const auto* results = target.results(protocol)) {
                scans.push_back(scanToJson(sortedByPort(*results), protocol));
            }
        }
        entry["scans"] = std::move(scans);

        nlohmann::json scripts = nlohmann::json::array();
        for (const auto& script : target.scripts) {
            scripts.push_back(scriptToJson(script));
        }
        entry["scripts"] = std::move(scripts);

        targets.push_back(std::move(entry));
    }

    return nlohmann::json{{"targets", targets}};
}

bool ResultPrinter::writeJson(const core::ScanReport& report, const std::filesystem::path& path) {
    try {
        auto j = toJson(report);

        std::ofstream file(path);
        if (!file) {
            spdlog::error("Failed to open JSON output file for writing: {}", path.string());
            return false;
        }

        file << j.dump(2) << "\n";
        spdlog::info("JSON output written to {}", path.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to write JSON output: {}", e.what());
        return false;
    }
}

std::string ResultPrinter::serviceLabel(const core::PortScanResult& result) {
    if (result.service && !result.service->service.empty()) {
        return result.service->service;
    }
    auto known = core::ServiceDetector::detectService(result.port);
    return known.empty() ? "unknown" : known;
}

std::string ResultPrinter::versionLabel(const core::PortScanResult& result) {
    std::string label;

    if (result.service) {
        const auto& service = *result.service;
        if (service.product) {
            label = *service.product;
        }
        if (service.version) {
            label += (label.empty() ? "" : " ") + *service.version;
        }
        if (service.extraInfo) {
            label += (label.empty() ? "(" : " (") + *service.extraInfo + ")";
        }
    } else if (result.banner) {
        label = result.banner->substr(0, result.banner->find_first_of("\r\n"));
    }

    if (label.size() > MaxVersionLength) {
        label = label.substr(0, MaxVersionLength - 3) + "...";
    }
    return label;
}

std::string ResultPrinter::stateLabel(const core::PortScanResult& result) {
    if (result.protocol == core::Protocol::Udp && result.state == core::PortState::Open) {
        return "open|filtered";
    }
    return toLower(result.stateToString());
}

} // namespace portprobe::infra
