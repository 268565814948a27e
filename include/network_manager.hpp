#pragma once
#include "options.hpp"
#include <sdbus-c++/sdbus-c++.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class NetworkManagerError : public std::runtime_error {
public:
    explicit NetworkManagerError(const std::string& message)
        : std::runtime_error(message), chain_{message} {}

    NetworkManagerError(const std::string& context, const std::string& cause)
        : std::runtime_error(context + ": " + cause), chain_{context, cause} {}

    const std::vector<std::string>& chain() const { return chain_; }

private:
    std::vector<std::string> chain_;
};

// NetworkManager control plane over the system bus: device lookup, saved
// profiles, access point listing and the captive portal AP profile.
class NetworkManager {
public:
    struct ConnectionDetails {
        std::string id;
        std::string uuid;
        std::string toJson() const;
    };

    struct NetworkDetails {
        std::string ssid;
        int strength = 0;
        std::string security;
        std::string toJson() const;
    };

    struct Device {
        sdbus::ObjectPath path;
        std::string interface;
    };

    NetworkManager();
    ~NetworkManager();

    std::string checkConnectivity();
    std::vector<ConnectionDetails> listConnections();

    // Named interface, or the first managed WiFi device when none is given.
    Device findDevice(const std::optional<std::string>& interface);

    std::vector<NetworkDetails> listWifiNetworks(const Device& device, std::chrono::seconds timeout);

    void deleteAccessPointProfiles(const std::string& ssid);
    void createPortal(const Device& device, const Options& opts);
    void stop();

    static std::string determineSecurity(uint32_t flags, uint32_t wpaFlags, uint32_t rsnFlags);

    // Polls readState until the active connection is Activated. On
    // Deactivated or timeout, discard(stillActive) tears the portal down
    // before NetworkManagerError is thrown.
    static void awaitActivation(const std::function<uint32_t()>& readState,
                                const std::function<void(bool)>& discard,
                                std::chrono::milliseconds timeout,
                                std::chrono::milliseconds interval);

private:
    using Settings = std::map<std::string, std::map<std::string, sdbus::Variant>>;

    std::unique_ptr<sdbus::IProxy> createProxy(const sdbus::ObjectPath& path);
    std::vector<sdbus::ObjectPath> listConnectionPaths();
    Settings getSettings(const sdbus::ObjectPath& connection);
    void deleteConnection(const sdbus::ObjectPath& connection);
    void scanWifiDevice(const Device& device, std::chrono::seconds timeout);
    void waitForActivation(const sdbus::ObjectPath& active, const sdbus::ObjectPath& connection);

    std::unique_ptr<sdbus::IConnection> connection_;
    std::unique_ptr<sdbus::IProxy> manager_;
    sdbus::ObjectPath activeConnection_;
    sdbus::ObjectPath portalConnection_;
};
