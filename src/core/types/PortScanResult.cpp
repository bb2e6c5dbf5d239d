#include "core/types/PortScanResult.hpp"

namespace portprobe::core {

std::string PortScanResult::stateToString() const {
    return portStateToString(state);
}

std::string PortScanResult::portStateToString(PortState state) {
    switch (state) {
    case PortState::Unknown:
        return "Unknown";
    case PortState::Open:
        return "Open";
    case PortState::Closed:
        return "Closed";
    case PortState::Filtered:
        return "Filtered";
    }
    return "Unknown";
}

std::string protocolToString(Protocol protocol) {
    return protocol == Protocol::Udp ? "UDP" : "TCP";
}

const std::unordered_map<uint16_t, std::string>& ServiceDetector::getKnownServices() {
    static const std::unordered_map<uint16_t, std::string> services = {
        {21, "ftp"},          {22, "ssh"},           {23, "telnet"},        {25, "smtp"},
        {53, "dns"},          {80, "http"},          {110, "pop3"},         {115, "sftp"},
        {123, "ntp"},         {135, "rpc"},          {139, "netbios"},      {143, "imap"},
        {161, "snmp"},        {194, "irc"},          {443, "https"},        {445, "smb"},
        {993, "imaps"},       {995, "pop3s"},        {1433, "mssql"},       {1521, "oracle"},
        {2181, "zookeeper"},  {3000, "grafana"},     {3306, "mysql"},       {3389, "rdp"},
        {4444, "selenium"},   {5432, "postgresql"},  {5601, "kibana"},      {5632, "pcanywhere"},
        {5672, "rabbitmq"},   {5900, "vnc"},         {5984, "couchdb"},     {6379, "redis"},
        {7000, "cassandra"},  {8080, "http-proxy"},  {8081, "nexus"},       {8086, "influxdb"},
        {8443, "https-alt"},  {8888, "jupyter"},     {9000, "sonarqube"},   {9090, "prometheus"},
        {9092, "kafka"},      {9200, "elasticsearch"}, {9999, "abyss"},     {10000, "webmin"},
        {11211, "memcached"}, {25565, "minecraft"},  {27017, "mongodb"}};
    return services;
}

std::string ServiceDetector::detectService(uint16_t port) {
    const auto& services = getKnownServices();
    auto it = services.find(port);
    return it != services.end() ? it->second : "";
}

} // namespace portprobe::core
