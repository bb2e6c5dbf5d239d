#pragma once

#include "core/types/ScanReport.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace portprobe::infra {

/**
 * @brief Renders scan reports as text tables and JSON documents.
 *
 * The text form lists, per target and protocol, a table sorted by port
 * followed by a one-line summary. Unless the ports were given explicitly
 * only Open ports appear in the table; the summary always counts every
 * state. The JSON form always carries every result.
 */
class ResultPrinter {
public:
    /**
     * @brief Constructs a printer writing to the given stream.
     * @param out Destination of the text report (normally stdout).
     */
    explicit ResultPrinter(std::ostream& out);

    /**
     * @brief Prints the full text report: tables, service details and script output.
     */
    void print(const core::ScanReport& report);

    /**
     * @brief Prints one protocol's result table and its summary line.
     * @param showAll List every state instead of Open ports only.
     */
    void printTable(const std::vector<core::PortScanResult>& results, core::Protocol protocol,
                    bool showAll);

    /**
     * @brief Prints the detected service details of the open ports that have any.
     */
    void printServiceDetails(const std::vector<core::PortScanResult>& results);

    void printScriptResult(const core::ScriptResult& result);

    /**
     * @brief Builds the JSON report.
     */
    static nlohmann::json toJson(const core::ScanReport& report);

    /**
     * @brief Writes the JSON report to a file.
     * @return True if written successfully, false otherwise.
     */
    static bool writeJson(const core::ScanReport& report, const std::filesystem::path& path);

    /**
     * @brief Name shown in the SERVICE column.
     *
     * The detected service when present, otherwise the well-known name of the
     * port, otherwise "unknown".
     */
    static std::string serviceLabel(const core::PortScanResult& result);

    /**
     * @brief Text shown in the VERSION column: product, version and extra info,
     *        or the first line of the banner.
     */
    static std::string versionLabel(const core::PortScanResult& result);

    /**
     * @brief Lower-case state label; a UDP Open port reads "open|filtered".
     */
    static std::string stateLabel(const core::PortScanResult& result);

private:
    std::ostream& out_;
};

} // namespace portprobe::infra
