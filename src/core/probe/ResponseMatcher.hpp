/**
 * @file ResponseMatcher.hpp
 * @brief Pure matching of probe responses against match rules.
 *
 * Nothing in this file performs I/O; the network prober hands every
 * received buffer to these functions.
 */

#pragma once

#include "core/probe/ProbeDatabase.hpp"
#include "core/types/PortScanResult.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace portprobe::core {

/**
 * @brief Resolves $N placeholders of a version template.
 *
 * N may have several digits. The longest leading run of digits that names
 * an existing group is used and the remaining digits stay literal, so with
 * twelve groups "$12" is group 12, while with three groups "$12" is group 1
 * followed by "2". Groups that did not participate in the match substitute
 * as empty text; a placeholder naming no group is left untouched.
 */
std::string substituteCaptures(std::string_view templateText, const std::cmatch& match);

/**
 * @brief Evaluates a single rule against a response.
 * @param confidence Confidence to report on a match.
 * @return Service information with every present version field resolved.
 */
std::optional<ServiceInfo> matchRule(std::string_view response, const MatchEntry& rule,
                                     int confidence);

/**
 * @brief Evaluates a probe's rules against a response it elicited.
 *
 * Hard matches are tried in order first (confidence 90), then soft matches
 * (confidence 50). The first matching rule wins.
 */
std::optional<ServiceInfo> matchResponse(std::string_view response, const ProbeEntry& probe);

/**
 * @brief Identifies a service from an already captured response.
 *
 * Walks the probe plan for the port (NULL probe first, then the relevant
 * probes) and returns the first rule hit, or nullopt when nothing matches.
 */
std::optional<ServiceInfo> detectService(std::string_view response, uint16_t port,
                                         const ProbeDatabase& database,
                                         Protocol protocol = Protocol::Tcp);

} // namespace portprobe::core
