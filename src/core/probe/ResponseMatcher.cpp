#include "core/probe/ResponseMatcher.hpp"

#include <cctype>

namespace portprobe::core {

std::string substituteCaptures(std::string_view templateText, const std::cmatch& match) {
    std::string result;
    result.reserve(templateText.size());

    for (size_t i = 0; i < templateText.size(); ++i) {
        char c = templateText[i];
        if (c != '$') {
            result.push_back(c);
            continue;
        }

        size_t digitsEnd = i + 1;
        while (digitsEnd < templateText.size() &&
               std::isdigit(static_cast<unsigned char>(templateText[digitsEnd]))) {
            ++digitsEnd;
        }

        // Longest run of digits that names an existing group: with three
        // groups, "$10" is group 1 followed by a literal 0
        size_t group = 0;
        size_t consumed = 0;
        size_t value = 0;
        for (size_t j = i + 1; j < digitsEnd; ++j) {
            value = value * 10 + static_cast<size_t>(templateText[j] - '0');
            if (value >= match.size()) {
                break;
            }
            if (value >= 1) {
                group = value;
                consumed = j - i;
            }
        }

        if (group == 0) {
            result.push_back(c);
            continue;
        }

        if (match[group].matched) {
            result += match[group].str();
        }
        i += consumed;
    }

    return result;
}

std::optional<ServiceInfo> matchRule(std::string_view response, const MatchEntry& rule,
                                     int confidence) {
    std::cmatch match;
    if (!std::regex_search(response.data(), response.data() + response.size(), match,
                           rule.regex)) {
        return std::nullopt;
    }

    ServiceInfo info;
    info.service = rule.service;
    info.confidence = confidence;

    for (const auto& [tag, templateText] : rule.versionInfo) {
        auto value = substituteCaptures(templateText, match);
        if (tag == "p") {
            info.product = std::move(value);
        } else if (tag == "v") {
            info.version = std::move(value);
        } else if (tag == "i") {
            info.extraInfo = std::move(value);
        } else if (tag == "h") {
            info.hostname = std::move(value);
        } else if (tag == "o") {
            info.osInfo = std::move(value);
        } else if (tag == "d") {
            info.deviceType = std::move(value);
        } else if (tag == "cpe") {
            info.cpe = "cpe:/" + value;
        }
    }

    return info;
}

std::optional<ServiceInfo> matchResponse(std::string_view response, const ProbeEntry& probe) {
    for (const auto& rule : probe.matches) {
        if (auto info = matchRule(response, rule, ServiceInfo::HardMatchConfidence)) {
            return info;
        }
    }

    for (const auto& rule : probe.softMatches) {
        if (auto info = matchRule(response, rule, ServiceInfo::SoftMatchConfidence)) {
            return info;
        }
    }

    return std::nullopt;
}

std::optional<ServiceInfo> detectService(std::string_view response, uint16_t port,
                                         const ProbeDatabase& database, Protocol protocol) {
    if (response.empty()) {
        return std::nullopt;
    }

    for (const auto* probe : database.probePlan(port, protocol)) {
        if (auto info = matchResponse(response, *probe)) {
            return info;
        }
    }

    return std::nullopt;
}

} // namespace portprobe::core
