#include "core/probe/ProbeParser.hpp"

#include "core/types/PortSpec.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace portprobe::core {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Splits "keyword rest of line" into the keyword and the trimmed remainder.
std::pair<std::string_view, std::string_view> splitFirstWord(std::string_view text) {
    size_t end = 0;
    while (end < text.size() && !isSpace(text[end])) {
        ++end;
    }
    return {text.substr(0, end), trimWhitespace(text.substr(end))};
}

std::optional<uint64_t> parseUnsigned(std::string_view text, uint64_t maxValue) {
    auto token = splitFirstWord(text).first;
    if (token.empty() || token.size() > 19) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > maxValue) {
        return std::nullopt;
    }
    return value;
}

bool isVersionTag(const std::string& tag) {
    return tag == "p" || tag == "v" || tag == "i" || tag == "h" || tag == "o" || tag == "d" ||
           tag == "cpe";
}

// Parses trailing "p/.../ v/.../ cpe:/.../" fields. The first field of a tag wins.
void parseVersionFields(std::string_view text, std::map<std::string, std::string>& fields) {
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && isSpace(text[pos])) {
            ++pos;
        }
        if (pos >= text.size()) {
            break;
        }

        std::string tag;
        if (text.substr(pos, 4) == "cpe:") {
            tag = "cpe";
            pos += 4;
        } else {
            tag = std::string(1, text[pos]);
            pos += 1;
        }

        if (pos >= text.size()) {
            break;
        }

        char delimiter = text[pos];
        if (isSpace(delimiter) || std::isalnum(static_cast<unsigned char>(delimiter))) {
            // Not a field token, skip it
            while (pos < text.size() && !isSpace(text[pos])) {
                ++pos;
            }
            continue;
        }

        size_t close = text.find(delimiter, pos + 1);
        if (close == std::string_view::npos) {
            break;
        }

        auto value = text.substr(pos + 1, close - pos - 1);
        pos = close + 1;

        // Field flags such as the trailing 'a' of cpe:/.../a
        while (pos < text.size() && !isSpace(text[pos])) {
            ++pos;
        }

        if (isVersionTag(tag)) {
            fields.emplace(tag, std::string(value));
        }
    }
}

std::optional<Protocol> parseProtocol(std::string_view text) {
    if (text == "TCP")
        return Protocol::Tcp;
    if (text == "UDP")
        return Protocol::Udp;
    return std::nullopt;
}

bool hasToken(std::string_view text, std::string_view token) {
    while (!text.empty()) {
        auto [word, rest] = splitFirstWord(text);
        if (word == token) {
            return true;
        }
        text = rest;
    }
    return false;
}

struct ParseStats {
    size_t rejectedRules{0};
    size_t ignoredProbes{0};
};

void applyDirective(std::string_view keyword, std::string_view args, ProbeDatabase& database,
                    std::optional<ProbeEntry>& current, ParseStats& stats, size_t lineNo) {
    if (keyword == "Exclude") {
        if (!args.empty()) {
            database.excludes.emplace_back(args);
        }
        return;
    }

    if (keyword == "Probe") {
        if (current) {
            database.probes.push_back(std::move(*current));
            current.reset();
        }

        auto [protocolText, afterProtocol] = splitFirstWord(args);
        auto [name, probeString] = splitFirstWord(afterProtocol);
        if (protocolText.empty() || name.empty() || probeString.empty()) {
            ++stats.ignoredProbes;
            spdlog::debug("Ignoring incomplete Probe directive on line {}", lineNo);
            return;
        }

        auto protocol = parseProtocol(protocolText);
        if (!protocol) {
            ++stats.ignoredProbes;
            spdlog::debug("Ignoring probe {} with unknown protocol '{}' on line {}", name,
                          protocolText, lineNo);
            return;
        }

        ProbeEntry probe;
        probe.protocol = *protocol;
        probe.name = std::string(name);
        probe.payload = parseProbeString(probeString);
        probe.noPayload = hasToken(probeString, "no-payload");
        current = std::move(probe);
        return;
    }

    if (!current) {
        return;
    }

    if (keyword == "match" || keyword == "softmatch") {
        auto entry = parseMatchDirective(args);
        if (!entry) {
            ++stats.rejectedRules;
            spdlog::debug("Skipping {} rule on line {} of probe {}", keyword, lineNo,
                          current->name);
            return;
        }
        if (keyword == "match") {
            current->matches.push_back(std::move(*entry));
        } else {
            current->softMatches.push_back(std::move(*entry));
        }
    } else if (keyword == "ports") {
        if (!args.empty()) {
            current->ports.emplace_back(args);
        }
    } else if (keyword == "sslports") {
        if (!args.empty()) {
            current->sslPorts.emplace_back(args);
        }
    } else if (keyword == "totalwaitms") {
        if (auto value = parseUnsigned(args, std::numeric_limits<uint32_t>::max())) {
            current->totalWaitMs = static_cast<uint32_t>(*value);
        }
    } else if (keyword == "tcpwrappedms") {
        if (auto value = parseUnsigned(args, std::numeric_limits<uint32_t>::max())) {
            current->tcpWrappedMs = static_cast<uint32_t>(*value);
        }
    } else if (keyword == "rarity") {
        if (auto value = parseUnsigned(args, std::numeric_limits<uint8_t>::max())) {
            current->rarity = static_cast<uint8_t>(*value);
        }
    } else if (keyword == "fallback") {
        if (!args.empty()) {
            current->fallback = std::string(args);
        }
    }
}

} // namespace

std::string decodeEscapes(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c != '\\' || i + 1 >= text.size()) {
            result.push_back(c);
            ++i;
            continue;
        }

        char next = text[i + 1];
        switch (next) {
        case 'n':
            result.push_back('\n');
            i += 2;
            break;
        case 'r':
            result.push_back('\r');
            i += 2;
            break;
        case 't':
            result.push_back('\t');
            i += 2;
            break;
        case '0':
            result.push_back('\0');
            i += 2;
            break;
        case '\\':
            result.push_back('\\');
            i += 2;
            break;
        case 'x': {
            i += 2;
            char high = i < text.size() ? text[i++] : '0';
            char low = i < text.size() ? text[i++] : '0';
            int h = hexValue(high);
            int l = hexValue(low);
            if (h >= 0 && l >= 0) {
                result.push_back(static_cast<char>((h << 4) | l));
            }
            break;
        }
        default:
            result.push_back('\\');
            ++i;
            break;
        }
    }

    return result;
}

std::string parseProbeString(std::string_view text) {
    text = trimWhitespace(text);
    if (text.size() > 2 && text.front() == 'q') {
        char delimiter = text[1];
        size_t end = text.rfind(delimiter);
        if (end > 1) {
            return decodeEscapes(text.substr(2, end - 2));
        }
    }
    return decodeEscapes(text);
}

std::optional<MatchEntry> parseMatchDirective(std::string_view text) {
    auto [service, rest] = splitFirstWord(trimWhitespace(text));
    if (service.empty() || rest.size() < 2 || rest.front() != 'm') {
        return std::nullopt;
    }

    char delimiter = rest[1];
    size_t close = rest.find(delimiter, 2);
    if (close == std::string_view::npos) {
        return std::nullopt;
    }

    MatchEntry entry;
    entry.service = std::string(service);
    entry.pattern = std::string(rest.substr(2, close - 2));

    // Pattern options (i, s) are not modeled
    size_t pos = close + 1;
    while (pos < rest.size() && !isSpace(rest[pos])) {
        ++pos;
    }

    try {
        entry.regex = std::regex(entry.pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        spdlog::debug("Rejected pattern for {}: {} ({})", entry.service, entry.pattern,
                      e.what());
        return std::nullopt;
    }

    parseVersionFields(rest.substr(pos), entry.versionInfo);
    return entry;
}

ProbeDatabase parseProbeDatabase(std::string_view text) {
    ProbeDatabase database;
    std::optional<ProbeEntry> current;
    ParseStats stats;

    size_t lineNo = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = text.size();
        }
        auto line = trimWhitespace(text.substr(pos, eol - pos));
        pos = eol + 1;
        ++lineNo;

        if (line.empty() || line.front() == '#') {
            continue;
        }

        auto [keyword, args] = splitFirstWord(line);
        applyDirective(keyword, args, database, current, stats, lineNo);
    }

    if (current) {
        database.probes.push_back(std::move(*current));
    }

    spdlog::debug("Parsed {} probes with {} rules ({} rules rejected, {} probes ignored)",
                  database.probes.size(), database.ruleCount(), stats.rejectedRules,
                  stats.ignoredProbes);
    return database;
}

ProbeDatabase loadProbeDatabase(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ProbeLoadError("Probe file not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ProbeLoadError("Failed to open probe file: " + path.string());
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw ProbeLoadError("Failed to read probe file: " + path.string());
    }

    auto database = parseProbeDatabase(content.str());
    spdlog::info("Loaded {} probes ({} match rules) from {}", database.probes.size(),
                 database.ruleCount(), path.string());
    return database;
}

} // namespace portprobe::core
