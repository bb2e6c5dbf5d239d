#include "core/probe/ProbeDatabase.hpp"

#include <cstdio>

namespace portprobe::core {

namespace {

std::string escapePayload(const std::string& payload) {
    std::string out;
    out.reserve(payload.size());
    for (unsigned char c : payload) {
        switch (c) {
        case '\r':
            out += "\\r";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\\':
            out += "\\\\";
            break;
        default:
            if (c < 0x20 || c >= 0x7f) {
                char hex[5];
                std::snprintf(hex, sizeof(hex), "\\x%02x", c);
                out += hex;
            } else {
                out += static_cast<char>(c);
            }
        }
    }
    return out;
}

} // namespace

bool ProbeEntry::appliesToPort(uint16_t port) const {
    const auto portText = std::to_string(port);
    const auto tcpToken = "T:" + portText;

    for (const auto& spec : ports) {
        if (spec.find(portText) != std::string::npos ||
            spec.find(tcpToken) != std::string::npos) {
            return true;
        }
    }
    return false;
}

const ProbeEntry* ProbeDatabase::findProbe(std::string_view name, Protocol protocol) const {
    for (const auto& probe : probes) {
        if (probe.protocol == protocol && probe.name == name) {
            return &probe;
        }
    }
    return nullptr;
}

std::vector<const ProbeEntry*> ProbeDatabase::relevantProbes(uint16_t port,
                                                             Protocol protocol) const {
    std::vector<const ProbeEntry*> relevant;

    for (const auto& probe : probes) {
        if (probe.protocol != protocol || probe.isNullProbe()) {
            continue;
        }
        if (probe.appliesToPort(port)) {
            relevant.push_back(&probe);
        }
    }

    if (relevant.empty()) {
        for (const auto& probe : probes) {
            if (probe.protocol == protocol &&
                (probe.name == "GetRequest" || probe.name == "GenericLines")) {
                relevant.push_back(&probe);
            }
        }
    }

    return relevant;
}

std::vector<const ProbeEntry*> ProbeDatabase::probePlan(uint16_t port, Protocol protocol) const {
    std::vector<const ProbeEntry*> plan;

    if (protocol == Protocol::Tcp) {
        if (const auto* nullProbe = findProbe("NULL", Protocol::Tcp)) {
            plan.push_back(nullProbe);
        }
    }

    auto relevant = relevantProbes(port, protocol);
    plan.insert(plan.end(), relevant.begin(), relevant.end());
    return plan;
}

size_t ProbeDatabase::ruleCount() const {
    size_t count = 0;
    for (const auto& probe : probes) {
        count += probe.matches.size() + probe.softMatches.size();
    }
    return count;
}

void to_json(nlohmann::json& j, const MatchEntry& entry) {
    j = nlohmann::json{{"service", entry.service},
                       {"pattern", entry.pattern},
                       {"version_info", entry.versionInfo}};
}

void to_json(nlohmann::json& j, const ProbeEntry& probe) {
    j["protocol"] = protocolToString(probe.protocol);
    j["name"] = probe.name;
    j["probe_string"] = escapePayload(probe.payload);
    j["no_payload"] = probe.noPayload;
    j["matches"] = probe.matches;
    j["soft_matches"] = probe.softMatches;
    j["ports"] = probe.ports;
    j["ssl_ports"] = probe.sslPorts;
    j["total_wait_ms"] = probe.totalWaitMs ? nlohmann::json(*probe.totalWaitMs) : nlohmann::json(nullptr);
    j["tcp_wrapped_ms"] = probe.tcpWrappedMs ? nlohmann::json(*probe.tcpWrappedMs) : nlohmann::json(nullptr);
    j["rarity"] = probe.rarity ? nlohmann::json(*probe.rarity) : nlohmann::json(nullptr);
    j["fallback"] = probe.fallback ? nlohmann::json(*probe.fallback) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const ProbeDatabase& database) {
    j["excludes"] = database.excludes;
    j["probes"] = database.probes;
}

} // namespace portprobe::core
