#include "options.hpp"
#include <arpa/inet.h>
#include <iostream>
#include <stdexcept>

static std::string requireValue(int argc, char* argv[], int& i) {
    std::string option(argv[i]);
    if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for " + option);
    }
    return argv[++i];
}

static unsigned long parseNumber(const std::string& option, const std::string& value,
                                 unsigned long min, unsigned long max) {
    size_t consumed = 0;
    unsigned long number = 0;
    try {
        number = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for " + option + ": " + value);
    }
    if (consumed != value.size() || number < min || number > max) {
        throw std::invalid_argument("Invalid number for " + option + ": " + value);
    }
    return number;
}

static bool isIpv4Address(const std::string& value) {
    struct in_addr addr;
    return inet_pton(AF_INET, value.c_str(), &addr) == 1;
}

static void parseListen(Options& opts, const std::string& value) {
    size_t colon = value.rfind(':');
    if (colon == std::string::npos) {
        throw std::invalid_argument("Listen address must be <address>:<port>: " + value);
    }

    std::string address = value.substr(0, colon);
    if (!isIpv4Address(address)) {
        throw std::invalid_argument("Invalid listen address: " + address);
    }

    opts.listenAddress = address;
    opts.listenPort = static_cast<uint16_t>(parseNumber("--listen", value.substr(colon + 1), 1, 65535));
}

Options parseOptions(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-s" || arg == "--ssid") {
            opts.ssid = requireValue(argc, argv, i);
        } else if (arg == "-i" || arg == "--interface") {
            opts.interface = requireValue(argc, argv, i);
        } else if (arg == "-p" || arg == "--password") {
            opts.password = requireValue(argc, argv, i);
        } else if (arg == "-g" || arg == "--gateway") {
            opts.gateway = requireValue(argc, argv, i);
        } else if (arg == "-l" || arg == "--listen") {
            parseListen(opts, requireValue(argc, argv, i));
        } else if (arg == "-t" || arg == "--scan-timeout") {
            opts.scanTimeout = std::chrono::seconds(parseNumber(arg, requireValue(argc, argv, i), 1, 600));
        } else if (arg == "--scan") {
            opts.scanOnly = true;
        } else if (arg == "--table") {
            opts.table = true;
        } else if (arg == "--json") {
            opts.table = false;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (opts.ssid.empty() || opts.ssid.size() > 32) {
        throw std::invalid_argument("SSID must be 1 to 32 bytes long");
    }
    if (opts.password && (opts.password->size() < 8 || opts.password->size() > 63)) {
        throw std::invalid_argument("Password must be 8 to 63 characters long");
    }
    if (!isIpv4Address(opts.gateway)) {
        throw std::invalid_argument("Invalid gateway address: " + opts.gateway);
    }

    return opts;
}

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -s, --ssid <name>          Captive portal SSID (default: " << DEFAULT_SSID << ")\n";
    std::cout << "  -i, --interface <name>     WiFi interface (default: first managed WiFi device)\n";
    std::cout << "  -p, --password <psk>       WPA2 passphrase for the captive portal\n";
    std::cout << "  -g, --gateway <address>    Captive portal gateway (default: " << DEFAULT_GATEWAY << ")\n";
    std::cout << "  -l, --listen <addr:port>   HTTP listen address (default: 127.0.0.1:3000)\n";
    std::cout << "  -t, --scan-timeout <sec>   Maximum wait for scan results (default: 45)\n";
    std::cout << "      --scan                 Scan once, print the networks and exit\n";
    std::cout << "      --json                 Print --scan results as JSON (default)\n";
    std::cout << "      --table                Print --scan results as a table\n";
    std::cout << "  -v, --verbose              Log every scan step\n";
    std::cout << "\nNote: This program requires root privileges to scan WiFi networks.\n";
    std::cout << "Run with: sudo " << programName << "\n";
}
