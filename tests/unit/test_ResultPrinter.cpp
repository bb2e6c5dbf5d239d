#include <catch2/catch_test_macros.hpp>

#include "infrastructure/output/ResultPrinter.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace portprobe::infra;
using namespace portprobe::core;

namespace {

PortScanResult makeResult(uint16_t port, PortState state, Protocol protocol = Protocol::Tcp) {
    PortScanResult result;
    result.targetAddress = "10.0.0.5";
    result.port = port;
    result.protocol = protocol;
    result.state = state;
    return result;
}

ServiceInfo sshService() {
    ServiceInfo info;
    info.service = "ssh";
    info.product = "OpenSSH";
    info.version = "8.9p1";
    info.extraInfo = "Ubuntu Linux; protocol 2.0";
    info.cpe = "cpe:/a:openbsd:openssh:8.9p1";
    return info;
}

ScanReport sampleReport(bool portsExplicit) {
    TargetReport target;
    target.target = {"10.0.0.5", "server.lan"};

    auto ssh = makeResult(22, PortState::Open);
    ssh.service = sshService();
    auto http = makeResult(80, PortState::Open);
    http.banner = "HTTP/1.1 400 Bad Request\r\nServer: test\r\n";

    // Deliberately unsorted
    target.tcp = std::vector<PortScanResult>{makeResult(443, PortState::Filtered), http,
                                             makeResult(21, PortState::Closed), ssh};

    ScriptResult script;
    script.scriptName = "service-name";
    script.host = "server.lan";
    script.success = true;
    script.output = "Scanned host server.lan";
    script.data = {{"host", "server.lan"}};
    target.scripts.push_back(script);

    ScanReport report;
    report.portsExplicit = portsExplicit;
    report.targets.push_back(std::move(target));
    return report;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("ResultPrinter labels", "[ResultPrinter]") {
    SECTION("serviceLabel prefers the detected service") {
        auto result = makeResult(2222, PortState::Open);
        REQUIRE(ResultPrinter::serviceLabel(result) == "unknown");

        result.port = 22;
        REQUIRE(ResultPrinter::serviceLabel(result) == "ssh");

        result.port = 2222;
        result.service = sshService();
        REQUIRE(ResultPrinter::serviceLabel(result) == "ssh");
    }

    SECTION("versionLabel joins product, version and extra info") {
        auto result = makeResult(22, PortState::Open);
        result.service = sshService();
        REQUIRE(ResultPrinter::versionLabel(result) ==
                "OpenSSH 8.9p1 (Ubuntu Linux; protocol 2.0)");
    }

    SECTION("versionLabel uses the first banner line") {
        auto result = makeResult(25, PortState::Open);
        result.banner = "220 mail ESMTP\r\nmore";
        REQUIRE(ResultPrinter::versionLabel(result) == "220 mail ESMTP");
    }

    SECTION("versionLabel truncates long text") {
        auto result = makeResult(25, PortState::Open);
        result.banner = std::string(100, 'x');
        auto label = ResultPrinter::versionLabel(result);
        REQUIRE(label.size() == 60);
        REQUIRE(label.substr(57) == "...");
    }

    SECTION("versionLabel is empty without service or banner") {
        REQUIRE(ResultPrinter::versionLabel(makeResult(1, PortState::Open)).empty());
    }

    SECTION("stateLabel") {
        REQUIRE(ResultPrinter::stateLabel(makeResult(1, PortState::Open)) == "open");
        REQUIRE(ResultPrinter::stateLabel(makeResult(1, PortState::Filtered)) == "filtered");
        REQUIRE(ResultPrinter::stateLabel(makeResult(1, PortState::Open, Protocol::Udp)) ==
                "open|filtered");
        REQUIRE(ResultPrinter::stateLabel(makeResult(1, PortState::Closed, Protocol::Udp)) ==
                "closed");
    }
}

TEST_CASE("ResultPrinter table", "[ResultPrinter]") {
    std::ostringstream out;
    ResultPrinter printer(out);

    SECTION("Implicit ports show open ports only") {
        printer.print(sampleReport(false));
        auto text = out.str();

        REQUIRE(contains(text, "Scan report for server.lan (10.0.0.5)"));
        REQUIRE_FALSE(contains(text, "rDNS record"));
        REQUIRE(contains(text, "TCP Scan Results:"));
        REQUIRE(contains(text, "22/tcp"));
        REQUIRE(contains(text, "80/tcp"));
        REQUIRE_FALSE(contains(text, "21/tcp"));
        REQUIRE_FALSE(contains(text, "443/tcp"));
        REQUIRE(contains(text, "Summary: 2 open, 1 closed, 1 filtered"));
        // Rows are sorted by port
        REQUIRE(text.find("22/tcp") < text.find("80/tcp"));
    }

    SECTION("Explicit ports show every state") {
        printer.print(sampleReport(true));
        auto text = out.str();

        REQUIRE(contains(text, "21/tcp"));
        REQUIRE(contains(text, "443/tcp"));
        REQUIRE(contains(text, "filtered"));
        REQUIRE(text.find("21/tcp") < text.find("22/tcp"));
        REQUIRE(text.find("80/tcp") < text.find("443/tcp"));
    }

    SECTION("Service details and script output") {
        printer.print(sampleReport(false));
        auto text = out.str();

        REQUIRE(contains(text, "Service Detection Results:"));
        REQUIRE(contains(text, "Port 22: ssh"));
        REQUIRE(contains(text, "  Product: OpenSSH"));
        REQUIRE(contains(text, "  CPE: cpe:/a:openbsd:openssh:8.9p1"));
        REQUIRE(contains(text, "  Confidence: 90"));
        REQUIRE(contains(text, "Script Results:"));
        REQUIRE(contains(text, "[service-name] server.lan"));
        REQUIRE(contains(text, "  Output: Scanned host server.lan"));
    }

    SECTION("Reverse DNS name") {
        auto report = sampleReport(false);
        report.targets[0].target.reverseName = "host5.example.net";
        printer.print(report);
        REQUIRE(contains(out.str(), "rDNS record for 10.0.0.5: host5.example.net"));
    }

    SECTION("No open ports") {
        printer.printTable({makeResult(21, PortState::Closed)}, Protocol::Tcp, false);
        auto text = out.str();
        REQUIRE(contains(text, "(no open ports)"));
        REQUIRE(contains(text, "Summary: 0 open, 1 closed, 0 filtered"));
    }

    SECTION("Empty result list") {
        printer.printTable({}, Protocol::Udp, false);
        REQUIRE(contains(out.str(), "No ports found for UDP scan"));
    }

    SECTION("UDP rows") {
        printer.printTable({makeResult(53, PortState::Open, Protocol::Udp)}, Protocol::Udp,
                           false);
        auto text = out.str();
        REQUIRE(contains(text, "53/udp"));
        REQUIRE(contains(text, "open|filtered"));
        REQUIRE(contains(text, "dns"));
    }

    SECTION("Failed script") {
        ScriptResult failed;
        failed.scriptName = "broken";
        failed.host = "h";
        failed.port = 22;
        failed.error = "boom";
        printer.printScriptResult(failed);
        REQUIRE(contains(out.str(), "[broken] h:22"));
        REQUIRE(contains(out.str(), "Script failed: boom"));
    }
}

TEST_CASE("ResultPrinter JSON", "[ResultPrinter]") {
    auto j = ResultPrinter::toJson(sampleReport(false));

    REQUIRE(j["targets"].size() == 1);
    const auto& target = j["targets"][0];
    REQUIRE(target["host"] == "server.lan");
    REQUIRE(target["address"] == "10.0.0.5");
    REQUIRE_FALSE(target.contains("reverse_dns"));

    SECTION("Reverse DNS name") {
        auto report = sampleReport(false);
        report.targets[0].target.reverseName = "host5.example.net";
        auto j = ResultPrinter::toJson(report);
        REQUIRE(j["targets"][0]["reverse_dns"] == "host5.example.net");
    }

    SECTION("Every port is present regardless of display filtering") {
        REQUIRE(target["scans"].size() == 1);
        const auto& scan = target["scans"][0];
        REQUIRE(scan["protocol"] == "TCP");
        REQUIRE(scan["ports"].size() == 4);
        REQUIRE(scan["ports"]["21"]["state"] == "Closed");
        REQUIRE(scan["ports"]["443"]["state"] == "Filtered");
        REQUIRE(scan["ports"]["80"]["banner"] == "HTTP/1.1 400 Bad Request\r\nServer: test\r\n");
    }

    SECTION("Service fields") {
        const auto& service = target["scans"][0]["ports"]["22"]["service"];
        REQUIRE(service["name"] == "ssh");
        REQUIRE(service["product"] == "OpenSSH");
        REQUIRE(service["version"] == "8.9p1");
        REQUIRE(service["confidence"] == 90);
        REQUIRE_FALSE(service.contains("hostname"));
    }

    SECTION("Script results") {
        const auto& script = target["scripts"][0];
        REQUIRE(script["script"] == "service-name");
        REQUIRE(script["port"].is_null());
        REQUIRE(script["success"] == true);
        REQUIRE(script["data"]["host"] == "server.lan");
        REQUIRE_FALSE(script.contains("error"));
    }

    SECTION("Protocols that were not scanned are omitted") {
        ScanReport report;
        TargetReport onlyUdp;
        onlyUdp.target = {"127.0.0.1", "127.0.0.1"};
        onlyUdp.udp = std::vector<PortScanResult>{makeResult(53, PortState::Open, Protocol::Udp)};
        report.targets.push_back(onlyUdp);

        auto udpJson = ResultPrinter::toJson(report);
        REQUIRE(udpJson["targets"][0]["scans"].size() == 1);
        REQUIRE(udpJson["targets"][0]["scans"][0]["protocol"] == "UDP");
    }
}

TEST_CASE("ResultPrinter writeJson", "[ResultPrinter]") {
    auto dir = std::filesystem::temp_directory_path() / "portprobe_result_printer_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    SECTION("Writes a parseable document") {
        auto path = dir / "report.json";
        REQUIRE(ResultPrinter::writeJson(sampleReport(false), path));

        std::ifstream file(path);
        auto j = nlohmann::json::parse(file);
        REQUIRE(j == ResultPrinter::toJson(sampleReport(false)));
    }

    SECTION("Unwritable path") {
        REQUIRE_FALSE(ResultPrinter::writeJson(sampleReport(false), dir / "no" / "report.json"));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("ScanReport countPorts", "[ResultPrinter]") {
    auto report = sampleReport(false);
    REQUIRE(report.countPorts(PortState::Open) == 2);
    REQUIRE(report.countPorts(PortState::Closed) == 1);
    REQUIRE(report.countPorts(PortState::Unknown) == 0);
}
