#include "core/types/PortSpec.hpp"

#include <cctype>

namespace portprobe::core {

std::string_view trimWhitespace(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<uint16_t> parsePortNumber(std::string_view text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }

    uint32_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }

    if (value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::vector<uint16_t> parsePortSpec(std::string_view spec) {
    std::vector<uint16_t> ports;

    size_t pos = 0;
    while (pos <= spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = trimWhitespace(spec.substr(pos, comma - pos));
        pos = comma + 1;

        if (token.empty()) {
            continue;
        }

        auto dash = token.find('-');
        if (dash == std::string_view::npos) {
            if (auto port = parsePortNumber(token)) {
                ports.push_back(*port);
            }
            continue;
        }

        // Exactly one hyphen separating two numbers
        auto startText = trimWhitespace(token.substr(0, dash));
        auto endText = trimWhitespace(token.substr(dash + 1));
        if (endText.find('-') != std::string_view::npos) {
            continue;
        }

        auto start = parsePortNumber(startText);
        auto end = parsePortNumber(endText);
        if (!start || !end || *start > *end) {
            continue;
        }

        ports.reserve(ports.size() + (*end - *start) + 1);
        for (uint32_t port = *start; port <= *end; ++port) {
            ports.push_back(static_cast<uint16_t>(port));
        }
    }

    return ports;
}

} // namespace portprobe::core
