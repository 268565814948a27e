#include "http_server.hpp"
#include "network_manager.hpp"
#include "options.hpp"
#include "web_api.hpp"
#include "wifi_scanner.hpp"
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <unistd.h>

static std::atomic<bool> running{true};

static void handleSignal(int) {
    running = false;
}

void printAsTable(const std::vector<WifiScanner::Station>& stations) {
    if (stations.empty()) {
        std::cout << "No networks found.\n";
        return;
    }

    std::cout << std::left
              << std::setw(34) << "SSID"
              << std::setw(10) << "Quality"
              << "\n";

    std::cout << std::string(44, '-') << "\n";

    for (const auto& station : stations) {
        std::cout << std::left
                  << std::setw(34) << station.ssid
                  << std::setw(10) << (std::to_string(station.quality) + "%")
                  << "\n";
    }

    std::cout << "\nTotal networks found: " << stations.size() << "\n";
}

void printAsJson(const std::vector<WifiScanner::Station>& stations) {
    std::cout << "[";
    for (size_t i = 0; i < stations.size(); ++i) {
        std::cout << stations[i].toJson();
        if (i < stations.size() - 1) {
            std::cout << ",";
        }
    }
    std::cout << "]\n";
}

static int runScan(const Options& opts, const ScanOptions& scanOptions) {
    WifiScanner scanner(scanOptions);

    if (opts.table) {
        std::cout << "Scanning for WiFi networks...\n\n";
    }

    auto stations = scanner.scanNetwork(opts.interface.value_or(DEFAULT_SCAN_INTERFACE));

    if (opts.table) {
        printAsTable(stations);
    } else {
        printAsJson(stations);
    }
    return 0;
}

static int runPortal(const Options& opts, const ScanOptions& scanOptions) {
    NetworkManager networkManager;
    networkManager.deleteAccessPointProfiles(opts.ssid);

    NetworkManager::Device device = networkManager.findDevice(opts.interface);
    WifiScanner scanner(scanOptions);

    // Bind before the portal comes up so a busy port fails early.
    HttpServer server(opts.listenAddress, opts.listenPort);
    registerRoutes(server, networkManager, device, scanner, opts, running);

    networkManager.createPortal(device, opts);

    try {
        server.run(running);
    } catch (const std::exception&) {
        networkManager.stop();
        throw;
    }

    networkManager.stop();
    return 0;
}

int main(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parseOptions(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printHelp(argv[0]);
        return 1;
    }

    if (opts.help) {
        printHelp(argv[0]);
        return 0;
    }

    if (geteuid() != 0) {
        std::cerr << "Error: This program requires root privileges.\n";
        std::cerr << "Please run with: sudo " << argv[0] << "\n";
        return 1;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    ScanOptions scanOptions;
    scanOptions.completionTimeout = opts.scanTimeout;
    scanOptions.verbose = opts.verbose;

    try {
        if (opts.scanOnly) {
            return runScan(opts, scanOptions);
        }
        return runPortal(opts, scanOptions);

    } catch (const std::exception& e) {
        std::vector<std::string> chain = errorChain(e);
        std::cerr << "Error: " << chain.front() << "\n";
        for (size_t i = 1; i < chain.size(); ++i) {
            std::cerr << "  caused by: " << chain[i] << "\n";
        }
        return 1;
    }
}
