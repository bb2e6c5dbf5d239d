/**
 * @file PortSpec.hpp
 * @brief Parsing of textual port specifications such as "80,443,1000-2000".
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portprobe::core {

/**
 * @brief Parses a comma-separated port specification.
 *
 * Each token is trimmed and is either a single port or an inclusive
 * "start-end" range. Malformed tokens (non-numeric, reversed range, out of
 * range) are dropped. Ranges expand ascending and tokens keep their textual
 * order; overlapping tokens produce duplicates.
 *
 * @param spec The specification text.
 * @return Ports to scan, empty when nothing valid was given.
 */
std::vector<uint16_t> parsePortSpec(std::string_view spec);

/**
 * @brief Parses a single decimal port number (0-65535).
 * @param text Digits only, no sign or whitespace.
 * @return The port, or nullopt if the text is not a valid port.
 */
std::optional<uint16_t> parsePortNumber(std::string_view text);

/**
 * @brief Strips leading and trailing ASCII whitespace.
 */
std::string_view trimWhitespace(std::string_view text);

} // namespace portprobe::core
