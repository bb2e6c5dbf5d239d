#include <catch2/catch_test_macros.hpp>

#include "core/probe/ProbeParser.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace portprobe::core;

namespace {

class TestProbeDir {
public:
    TestProbeDir()
        : dir_(std::filesystem::temp_directory_path() / "portprobe_probe_parser_test") {
        cleanup();
        std::filesystem::create_directories(dir_);
    }

    ~TestProbeDir() { cleanup(); }

    std::filesystem::path path() const { return dir_; }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        auto file = dir_ / name;
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(dir_)) {
            std::filesystem::remove_all(dir_);
        }
    }

    std::filesystem::path dir_;
};

const char* const SampleProbes = R"PROBES(# Sample probe file
Exclude T:9100-9107

match ftp m|^220| p/orphan/

Probe TCP NULL q||
totalwaitms 6000
tcpwrappedms 3000
match ssh m|^SSH-([\d.]+)-OpenSSH_([\w.]+)| p/OpenSSH/ v/$2/ i/protocol $1/ cpe:/a:openbsd:openssh:$2/a
match ftp m|^220 ProFTPD (\S+) Server| p/ProFTPD/ v/$1/
softmatch ftp m|^220 |
match broken m|([unclosed| p/never/
someunknowndirective with arguments

Probe TCP GetRequest q|GET / HTTP/1.0\r\n\r\n|
rarity 1
ports 80,8000-8010,8080
sslports 443
fallback NULL
match http m|^HTTP/1\.[01] \d\d\d .*\r\nServer: nginx/([\d.]+)| p/nginx/ v/$1/
softmatch http m|^HTTP/1\.[01] \d\d\d|

Probe TCP GenericLines q|\r\n\r\n|
rarity 1
match smtp m|^220 .* ESMTP| p/generic smtp/

Probe UDP DNSStatusRequest q|\0\0\x10\0\0\0\0\0\0\0\0\0| no-payload
ports 53
rarity 300
match dns m|^\x12\x34| p/bind/

Probe SCTP Unsupported q|x|
match never m|.|
)PROBES";

} // namespace

TEST_CASE("decodeEscapes", "[ProbeParser]") {
    SECTION("Control escapes") {
        REQUIRE(decodeEscapes(R"(\r\n\t)") == "\r\n\t");
    }

    SECTION("Hex escape") {
        REQUIRE(decodeEscapes(R"(\x41\x42)") == "AB");
        REQUIRE(decodeEscapes(R"(\xff)") == std::string(1, '\xff'));
    }

    SECTION("Null escape produces a zero byte") {
        auto decoded = decodeEscapes(R"(a\0b)");
        REQUIRE(decoded.size() == 3);
        REQUIRE(decoded[1] == '\0');
    }

    SECTION("Escaped backslash") {
        REQUIRE(decodeEscapes(R"(\\)") == "\\");
    }

    SECTION("Unknown escape keeps the backslash") {
        REQUIRE(decodeEscapes(R"(\q)") == "\\q");
    }

    SECTION("Invalid hex digits produce no byte") {
        REQUIRE(decodeEscapes(R"(a\xZZb)") == "ab");
    }

    SECTION("Trailing backslash is literal") {
        REQUIRE(decodeEscapes("abc\\") == "abc\\");
    }
}

TEST_CASE("parseProbeString", "[ProbeParser]") {
    SECTION("HTTP GET request") {
        auto payload = parseProbeString(R"(q|GET / HTTP/1.0\r\n\r\n|)");
        REQUIRE(payload.size() == 18);
        REQUIRE(payload == "GET / HTTP/1.0\r\n\r\n");
    }

    SECTION("Empty payload") {
        REQUIRE(parseProbeString("q||").empty());
    }

    SECTION("Alternative delimiter and trailing options") {
        REQUIRE(parseProbeString(R"(q/\x41/ no-payload)") == "A");
    }
}

TEST_CASE("parseMatchDirective", "[ProbeParser]") {
    SECTION("Service, pattern and version fields") {
        auto entry = parseMatchDirective(R"(ssh m|^SSH-([\d.]+)-| p/OpenSSH/ v/$1/)");
        REQUIRE(entry.has_value());
        REQUIRE(entry->service == "ssh");
        REQUIRE(entry->pattern == R"(^SSH-([\d.]+)-)");
        REQUIRE(entry->versionInfo.size() == 2);
        REQUIRE(entry->versionInfo.at("p") == "OpenSSH");
        REQUIRE(entry->versionInfo.at("v") == "$1");
    }

    SECTION("CPE field with flag") {
        auto entry = parseMatchDirective("http m|^HTTP| p/Apache/ cpe:/a:apache:http_server/a");
        REQUIRE(entry.has_value());
        REQUIRE(entry->versionInfo.at("cpe") == "a:apache:http_server");
        REQUIRE(entry->versionInfo.at("p") == "Apache");
    }

    SECTION("Pattern options are tolerated") {
        auto entry = parseMatchDirective("http m|^server|i p/x/");
        REQUIRE(entry.has_value());
        REQUIRE(entry->pattern == "^server");
        REQUIRE(entry->versionInfo.at("p") == "x");
    }

    SECTION("Missing pattern clause") {
        REQUIRE_FALSE(parseMatchDirective("ssh").has_value());
        REQUIRE_FALSE(parseMatchDirective("ssh x|^SSH|").has_value());
    }

    SECTION("Unterminated pattern") {
        REQUIRE_FALSE(parseMatchDirective("ssh m|^SSH").has_value());
    }

    SECTION("Pattern rejected by the regex engine") {
        REQUIRE_FALSE(parseMatchDirective("ssh m|([unclosed| p/x/").has_value());
    }
}

TEST_CASE("parseProbeDatabase", "[ProbeParser]") {
    auto database = parseProbeDatabase(SampleProbes);

    SECTION("Excludes are recorded") {
        REQUIRE(database.excludes == std::vector<std::string>{"T:9100-9107"});
    }

    SECTION("Probes keep file order and unknown protocols are ignored") {
        REQUIRE(database.probes.size() == 4);
        REQUIRE(database.probes[0].name == "NULL");
        REQUIRE(database.probes[1].name == "GetRequest");
        REQUIRE(database.probes[2].name == "GenericLines");
        REQUIRE(database.probes[3].name == "DNSStatusRequest");
        REQUIRE(database.probes[3].protocol == Protocol::Udp);
    }

    SECTION("NULL probe directives") {
        const auto& probe = database.probes[0];
        REQUIRE(probe.isNullProbe());
        REQUIRE(probe.payload.empty());
        REQUIRE(probe.totalWaitMs == uint32_t{6000});
        REQUIRE(probe.tcpWrappedMs == uint32_t{3000});
        // The rule with a broken pattern is skipped
        REQUIRE(probe.matches.size() == 2);
        REQUIRE(probe.softMatches.size() == 1);
        REQUIRE(probe.matches[0].service == "ssh");
        REQUIRE(probe.matches[1].service == "ftp");
    }

    SECTION("GetRequest probe directives") {
        const auto& probe = database.probes[1];
        REQUIRE(probe.payload == "GET / HTTP/1.0\r\n\r\n");
        REQUIRE(probe.rarity == uint8_t{1});
        REQUIRE(probe.ports == std::vector<std::string>{"80,8000-8010,8080"});
        REQUIRE(probe.sslPorts == std::vector<std::string>{"443"});
        REQUIRE(probe.fallback == std::string("NULL"));
        REQUIRE(probe.matches.size() == 1);
        REQUIRE(probe.softMatches.size() == 1);
    }

    SECTION("Binary payload and no-payload option") {
        const auto& probe = database.probes[3];
        REQUIRE(probe.payload.size() == 12);
        REQUIRE(probe.payload[2] == '\x10');
        REQUIRE(probe.noPayload);
        REQUIRE_FALSE(database.probes[1].noPayload);
    }

    SECTION("Out of range numeric directive is skipped") {
        REQUIRE_FALSE(database.probes[3].rarity.has_value());
    }

    SECTION("Rule count") {
        REQUIRE(database.ruleCount() == 7);
    }
}

TEST_CASE("ProbeDatabase probe selection", "[ProbeParser]") {
    auto database = parseProbeDatabase(SampleProbes);

    SECTION("findProbe matches name and protocol") {
        REQUIRE(database.findProbe("GetRequest", Protocol::Tcp) == &database.probes[1]);
        REQUIRE(database.findProbe("GetRequest", Protocol::Udp) == nullptr);
        REQUIRE(database.findProbe("Missing", Protocol::Tcp) == nullptr);
    }

    SECTION("Port applicability is a substring test") {
        const auto& probe = database.probes[1];
        REQUIRE(probe.appliesToPort(80));
        REQUIRE(probe.appliesToPort(8080));
        REQUIRE(probe.appliesToPort(8000));
        REQUIRE_FALSE(probe.appliesToPort(22));
    }

    SECTION("Probes listing the port are relevant") {
        auto relevant = database.relevantProbes(80, Protocol::Tcp);
        REQUIRE(relevant.size() == 1);
        REQUIRE(relevant[0]->name == "GetRequest");
    }

    SECTION("Unlisted ports fall back to GetRequest and GenericLines") {
        auto relevant = database.relevantProbes(2222, Protocol::Tcp);
        REQUIRE(relevant.size() == 2);
        REQUIRE(relevant[0]->name == "GetRequest");
        REQUIRE(relevant[1]->name == "GenericLines");
    }

    SECTION("TCP plan starts with the NULL probe") {
        auto plan = database.probePlan(80, Protocol::Tcp);
        REQUIRE(plan.size() == 2);
        REQUIRE(plan[0]->name == "NULL");
        REQUIRE(plan[1]->name == "GetRequest");
    }

    SECTION("UDP plan has no NULL probe") {
        auto plan = database.probePlan(53, Protocol::Udp);
        REQUIRE(plan.size() == 1);
        REQUIRE(plan[0]->name == "DNSStatusRequest");
    }
}

TEST_CASE("loadProbeDatabase", "[ProbeParser]") {
    TestProbeDir dir;

    SECTION("Missing file raises ProbeLoadError") {
        REQUIRE_THROWS_AS(loadProbeDatabase(dir.path() / "does-not-exist"), ProbeLoadError);
    }

    SECTION("Directory raises ProbeLoadError") {
        REQUIRE_THROWS_AS(loadProbeDatabase(dir.path()), ProbeLoadError);
    }

    SECTION("Loads a probe file from disk") {
        auto file = dir.write("nmap-service-probes", SampleProbes);
        auto database = loadProbeDatabase(file);
        REQUIRE(database.probes.size() == 4);
    }

    SECTION("Empty file yields an empty database") {
        auto file = dir.write("empty", "");
        auto database = loadProbeDatabase(file);
        REQUIRE(database.probes.empty());
        REQUIRE(database.excludes.empty());
    }
}

TEST_CASE("ProbeDatabase JSON dump", "[ProbeParser]") {
    auto database = parseProbeDatabase(SampleProbes);
    nlohmann::json j = database;

    REQUIRE(j["probes"].size() == 4);
    REQUIRE(j["probes"][1]["name"] == "GetRequest");
    REQUIRE(j["probes"][1]["protocol"] == "TCP");
    REQUIRE(j["probes"][1]["probe_string"] == "GET / HTTP/1.0\\r\\n\\r\\n");
    REQUIRE(j["probes"][3]["probe_string"] == "\\x00\\x00\\x10\\x00\\x00\\x00\\x00\\x00\\x00\\x00\\x00\\x00");
    REQUIRE(j["probes"][0]["total_wait_ms"] == 6000);
    REQUIRE(j["probes"][0]["rarity"].is_null());
    REQUIRE(j["probes"][0]["matches"][0]["version_info"]["p"] == "OpenSSH");
    REQUIRE(j["excludes"][0] == "T:9100-9107");
}
