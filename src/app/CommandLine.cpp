#include "app/CommandLine.hpp"

#include <charconv>
#include <getopt.h>
#include <sstream>
#include <string_view>

namespace portprobe::app {

namespace {

enum LongOnlyOption : int {
    OptTcp = 256,
    OptNoTcp,
    OptUdp,
    OptTimeout,
    OptServiceTimeout,
    OptThreads,
    OptIoThreads,
    OptProbesFile,
    OptJson,
    OptScript,
    OptLogFile,
    OptConfig,
    OptSaveConfig,
    OptDumpProbes,
    OptReverseDns,
    OptListScripts,
    OptVersion
};

int parsePositive(const char* optionName, const char* text) {
    std::string_view value(text);
    int result = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || end != value.data() + value.size() || result <= 0) {
        throw CommandLineError(std::string("--") + optionName +
                               " expects a positive integer, got '" + text + "'");
    }
    return result;
}

} // namespace

void CommandLineOptions::applyTo(infra::ScanConfig& config) const {
    if (!targets.empty()) {
        config.targets = targets;
    }
    if (ports) {
        config.ports = *ports;
        config.portsExplicit = true;
    }
    if (tcp) config.tcp = *tcp;
    if (udp) config.udp = *udp;
    if (timeoutMs) config.timeoutMs = *timeoutMs;
    if (serviceDetection) config.serviceDetection = *serviceDetection;
    if (serviceTimeoutMs) config.serviceTimeoutMs = *serviceTimeoutMs;
    if (concurrency) config.concurrency = *concurrency;
    if (ioThreads) config.ioThreads = *ioThreads;
    if (probesFile) config.probesFile = *probesFile;
    if (reverseDns) config.reverseDns = *reverseDns;
    if (jsonOutput) config.jsonOutput = jsonOutput;
    if (script) config.script = script;
    if (logFile) config.logFile = logFile;
    if (verbose) config.verbose = *verbose;
}

CommandLineOptions parseCommandLine(int argc, char* argv[]) {
    static const struct option longOptions[] = {
        {"target", required_argument, nullptr, 't'},
        {"ports", required_argument, nullptr, 'p'},
        {"tcp", no_argument, nullptr, OptTcp},
        {"no-tcp", no_argument, nullptr, OptNoTcp},
        {"udp", no_argument, nullptr, OptUdp},
        {"timeout", required_argument, nullptr, OptTimeout},
        {"service-detection", no_argument, nullptr, 's'},
        {"service-timeout", required_argument, nullptr, OptServiceTimeout},
        {"threads", required_argument, nullptr, OptThreads},
        {"io-threads", required_argument, nullptr, OptIoThreads},
        {"probes-file", required_argument, nullptr, OptProbesFile},
        {"json", required_argument, nullptr, OptJson},
        {"script", required_argument, nullptr, OptScript},
        {"log-file", required_argument, nullptr, OptLogFile},
        {"verbose", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, OptConfig},
        {"save-config", required_argument, nullptr, OptSaveConfig},
        {"dump-probes", required_argument, nullptr, OptDumpProbes},
        {"reverse-dns", no_argument, nullptr, OptReverseDns},
        {"list-scripts", required_argument, nullptr, OptListScripts},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, OptVersion},
        {nullptr, 0, nullptr, 0}};

    CommandLineOptions options;

    // Restart getopt's scan; parsing may happen more than once per process
    optind = 0;
    opterr = 0;

    int opt;
    int longIndex = 0;
    while ((opt = getopt_long(argc, argv, ":t:p:svh", longOptions, &longIndex)) != -1) {
        switch (opt) {
        case 't':
            options.targets.emplace_back(optarg);
            break;
        case 'p':
            options.ports = optarg;
            break;
        case OptTcp:
            options.tcp = true;
            break;
        case OptNoTcp:
            options.tcp = false;
            break;
        case OptUdp:
            options.udp = true;
            break;
        case OptTimeout:
            options.timeoutMs = parsePositive("timeout", optarg);
            break;
        case 's':
            options.serviceDetection = true;
            break;
        case OptServiceTimeout:
            options.serviceTimeoutMs = parsePositive("service-timeout", optarg);
            break;
        case OptThreads:
            options.concurrency = parsePositive("threads", optarg);
            break;
        case OptIoThreads:
            options.ioThreads = parsePositive("io-threads", optarg);
            break;
        case OptProbesFile:
            options.probesFile = optarg;
            break;
        case OptJson:
            options.jsonOutput = optarg;
            break;
        case OptScript:
            options.script = optarg;
            break;
        case OptLogFile:
            options.logFile = optarg;
            break;
        case 'v':
            options.verbose = true;
            break;
        case OptConfig:
            options.configFile = optarg;
            break;
        case OptSaveConfig:
            options.saveConfigFile = optarg;
            break;
        case OptDumpProbes:
            options.dumpProbesFile = optarg;
            break;
        case OptReverseDns:
            options.reverseDns = true;
            break;
        case OptListScripts:
            options.listScriptsDir = optarg;
            break;
        case 'h':
            options.showHelp = true;
            break;
        case OptVersion:
            options.showVersion = true;
            break;
        case ':':
            throw CommandLineError(std::string("Option ") + argv[optind - 1] +
                                   " requires a value");
        default: {
            std::string name = optopt > 0 && optopt < OptTcp
                                   ? std::string("-") + static_cast<char>(optopt)
                                   : std::string(argv[optind - 1]);
            throw CommandLineError("Unknown option " + name);
        }
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.targets.emplace_back(argv[i]);
    }

    return options;
}

void validateConfig(const infra::ScanConfig& config) {
    if (config.targets.empty()) {
        throw CommandLineError("No target given (use -t/--target)");
    }
    if (!config.tcp && !config.udp) {
        throw CommandLineError("Both TCP and UDP scanning are disabled");
    }
    if (config.timeoutMs <= 0 || config.serviceTimeoutMs <= 0) {
        throw CommandLineError("Timeouts must be positive");
    }
    if (config.concurrency <= 0) {
        throw CommandLineError("Concurrency limit must be at least 1");
    }
    if (config.ioThreads <= 0) {
        throw CommandLineError("I/O thread count must be at least 1");
    }
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options] [target...]\n"
        << "\n"
        << "Targets and ports:\n"
        << "  -t, --target <host>        Host name or IP address (repeatable)\n"
        << "  -p, --ports <spec>         Ports or ranges, e.g. 22,80,1000-2000 (default 1-1024)\n"
        << "      --tcp / --no-tcp       Enable or disable the TCP connect scan (default on)\n"
        << "      --udp                  Also run the UDP scan\n"
        << "      --reverse-dns          Look up the host name of each scanned address\n"
        << "\n"
        << "Timing:\n"
        << "      --timeout <ms>         Connect/receive deadline per port (default 2000)\n"
        << "      --threads <n>          Maximum simultaneous connection attempts\n"
        << "      --io-threads <n>       I/O worker threads (default 4)\n"
        << "\n"
        << "Service detection:\n"
        << "  -s, --service-detection    Probe open TCP ports for their service\n"
        << "      --service-timeout <ms> Deadline per probe attempt (default 5000)\n"
        << "      --probes-file <path>   nmap-service-probes file\n"
        << "      --dump-probes <path>   Write the parsed probe database as JSON and exit\n"
        << "\n"
        << "Output and extras:\n"
        << "      --json <path>          Write a JSON report\n"
        << "      --script <library>     Run a script plugin on each host and open port\n"
        << "      --list-scripts <dir>   List the script plugins in a directory and exit\n"
        << "      --log-file <path>      Also log to a rotating file\n"
        << "  -v, --verbose              Debug logging\n"
        << "      --config <path>        Load settings from a JSON file\n"
        << "      --save-config <path>   Save the effective settings and exit\n"
        << "  -h, --help                 Show this help\n"
        << "      --version              Show the version\n";
    return oss.str();
}

} // namespace portprobe::app
