/**
 * @file ProbeParser.hpp
 * @brief Loader for the nmap-service-probes text grammar.
 *
 * The loader makes a single forward pass over the file, keeping the probe
 * currently being defined. Unknown directives are ignored and malformed
 * optional parts are skipped, so a partially broken file still loads.
 */

#pragma once

#include "core/probe/ProbeDatabase.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace portprobe::core {

/**
 * @brief Loads a probe database from a file.
 * @param path Path to an nmap-service-probes style file.
 * @return The parsed database.
 * @throws ProbeLoadError if the file does not exist or cannot be read.
 */
ProbeDatabase loadProbeDatabase(const std::filesystem::path& path);

/**
 * @brief Parses probe definitions from text already in memory.
 */
ProbeDatabase parseProbeDatabase(std::string_view text);

/**
 * @brief Resolves the escape sequences of a probe string.
 *
 * Supports \\n \\r \\t \\0 \\\\ and \\xHH. An unknown escape keeps the
 * backslash; an \\x with invalid hex digits produces no byte.
 */
std::string decodeEscapes(std::string_view text);

/**
 * @brief Extracts and decodes the payload of a q|...| probe string.
 *
 * The delimiter is the character after 'q'; the payload is everything
 * strictly between its first and last occurrence.
 */
std::string parseProbeString(std::string_view text);

/**
 * @brief Parses the arguments of a match or softmatch directive.
 * @param text Everything after the directive keyword, e.g.
 *             "ssh m|^SSH-([\d.]+)-| p/OpenSSH/ v/$1/".
 * @return The rule, or nullopt if the pattern clause is malformed or the
 *         regular expression is rejected by the regex engine.
 */
std::optional<MatchEntry> parseMatchDirective(std::string_view text);

} // namespace portprobe::core
