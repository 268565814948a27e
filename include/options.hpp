#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

constexpr const char* DEFAULT_SSID = "WiFiConnect";
constexpr const char* DEFAULT_GATEWAY = "192.168.42.1";
constexpr const char* DEFAULT_SCAN_INTERFACE = "wlan0";

struct Options {
    std::string ssid = DEFAULT_SSID;
    std::optional<std::string> interface;
    std::optional<std::string> password;
    std::string gateway = DEFAULT_GATEWAY;
    std::string listenAddress = "127.0.0.1";
    uint16_t listenPort = 3000;
    std::chrono::seconds scanTimeout{45};
    bool scanOnly = false;
    bool table = false;
    bool verbose = false;
    bool help = false;
};

// Throws std::invalid_argument on unknown options or bad values.
Options parseOptions(int argc, char* argv[]);

void printHelp(const char* programName);
