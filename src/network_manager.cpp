#include "network_manager.hpp"
#include "json_format.hpp"
#include "network_list.hpp"
#include <ctime>
#include <functional>
#include <iostream>
#include <sstream>
#include <thread>

static const char* NM_SERVICE = "org.freedesktop.NetworkManager";
static const char* NM_PATH = "/org/freedesktop/NetworkManager";
static const char* NM_INTERFACE = "org.freedesktop.NetworkManager";
static const char* NM_SETTINGS_PATH = "/org/freedesktop/NetworkManager/Settings";
static const char* NM_SETTINGS_INTERFACE = "org.freedesktop.NetworkManager.Settings";
static const char* NM_CONNECTION_INTERFACE = "org.freedesktop.NetworkManager.Settings.Connection";
static const char* NM_DEVICE_INTERFACE = "org.freedesktop.NetworkManager.Device";
static const char* NM_WIRELESS_INTERFACE = "org.freedesktop.NetworkManager.Device.Wireless";
static const char* NM_ACCESS_POINT_INTERFACE = "org.freedesktop.NetworkManager.AccessPoint";
static const char* NM_ACTIVE_INTERFACE = "org.freedesktop.NetworkManager.Connection.Active";

static constexpr uint32_t NM_DEVICE_TYPE_WIFI = 2;
static constexpr uint32_t NM_DEVICE_STATE_UNMANAGED = 10;
static constexpr uint32_t NM_ACTIVE_CONNECTION_STATE_ACTIVATED = 2;
static constexpr uint32_t NM_ACTIVE_CONNECTION_STATE_DEACTIVATED = 4;
static constexpr uint32_t NM_802_11_AP_FLAGS_PRIVACY = 0x1;
static constexpr uint32_t NM_802_11_AP_SEC_KEY_MGMT_SAE = 0x400;

static const char* WIRELESS_SETTING_NAME = "802-11-wireless";
static const char* WIRELESS_MODE_AP = "ap";

static constexpr std::chrono::seconds PORTAL_ACTIVATION_TIMEOUT{60};

// LastScan is reported in CLOCK_BOOTTIME milliseconds.
static int64_t bootTimeMsec() {
    struct timespec ts;
    clock_gettime(CLOCK_BOOTTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

template <typename T>
static std::optional<T> settingValue(const std::map<std::string, std::map<std::string, sdbus::Variant>>& settings,
                                     const std::string& section, const std::string& key) {
    auto sectionIt = settings.find(section);
    if (sectionIt == settings.end()) return std::nullopt;

    auto valueIt = sectionIt->second.find(key);
    if (valueIt == sectionIt->second.end() || !valueIt->second.containsValueOfType<T>()) {
        return std::nullopt;
    }
    return valueIt->second.get<T>();
}

static const char* connectivityName(uint32_t state) {
    switch (state) {
        case 1:  return "none";
        case 2:  return "portal";
        case 3:  return "limited";
        case 4:  return "full";
        default: return "unknown";
    }
}

std::string NetworkManager::ConnectionDetails::toJson() const {
    std::ostringstream json;
    json << "{\"id\":" << jsonString(id) << ",\"uuid\":" << jsonString(uuid) << "}";
    return json.str();
}

std::string NetworkManager::NetworkDetails::toJson() const {
    std::ostringstream json;
    json << "{\"ssid\":" << jsonString(ssid) << ",\"strength\":" << strength
         << ",\"security\":" << jsonString(security) << "}";
    return json.str();
}

NetworkManager::NetworkManager() {
    try {
        connection_ = sdbus::createSystemBusConnection();
        manager_ = sdbus::createProxy(*connection_, NM_SERVICE, NM_PATH);

        sdbus::Variant version = manager_->getProperty("Version").onInterface(NM_INTERFACE);
        std::cerr << "Connected to NetworkManager " << version.get<std::string>() << std::endl;
    } catch (const sdbus::Error& e) {
        throw NetworkManagerError("NetworkManager daemon is not running", e.getMessage());
    }
}

NetworkManager::~NetworkManager() {}

std::unique_ptr<sdbus::IProxy> NetworkManager::createProxy(const sdbus::ObjectPath& path) {
    return sdbus::createProxy(*connection_, NM_SERVICE, path);
}

std::string NetworkManager::checkConnectivity() {
    try {
        uint32_t state = 0;
        manager_->callMethod("CheckConnectivity").onInterface(NM_INTERFACE).storeResultsTo(state);
        return connectivityName(state);
    } catch (const sdbus::Error& e) {
        throw NetworkManagerError("Failed to execute check connectivity", e.getMessage());
    }
}

std::vector<sdbus::ObjectPath> NetworkManager::listConnectionPaths() {
    auto settings = createProxy(sdbus::ObjectPath(NM_SETTINGS_PATH));
    std::vector<sdbus::ObjectPath> paths;
    settings->callMethod("ListConnections").onInterface(NM_SETTINGS_INTERFACE).storeResultsTo(paths);
    return paths;
}

NetworkManager::Settings NetworkManager::getSettings(const sdbus::ObjectPath& connection) {
    auto proxy = createProxy(connection);
    Settings settings;
    proxy->callMethod("GetSettings").onInterface(NM_CONNECTION_INTERFACE).storeResultsTo(settings);
    return settings;
}

void NetworkManager::deleteConnection(const sdbus::ObjectPath& connection) {
    auto proxy = createProxy(connection);
    proxy->callMethod("Delete").onInterface(NM_CONNECTION_INTERFACE);
}

std::vector<NetworkManager::ConnectionDetails> NetworkManager::listConnections() {
    try {
        std::vector<ConnectionDetails> connections;
        for (const sdbus::ObjectPath& path : listConnectionPaths()) {
            Settings settings = getSettings(path);
            std::optional<std::string> id = settingValue<std::string>(settings, "connection", "id");
            std::optional<std::string> uuid = settingValue<std::string>(settings, "connection", "uuid");
            if (id && uuid) {
                connections.push_back(ConnectionDetails{ *id, *uuid });
            }
        }
        return connections;
    } catch (const sdbus::Error& e) {
        throw NetworkManagerError("Failed to list connections", e.getMessage());
    }
}

NetworkManager::Device NetworkManager::findDevice(const std::optional<std::string>& interface) {
    if (interface) {
        sdbus::ObjectPath path;
        try {
            manager_->callMethod("GetDeviceByIpIface").onInterface(NM_INTERFACE)
                .withArguments(*interface).storeResultsTo(path);
        } catch (const sdbus::Error& e) {
            throw NetworkManagerError("Failed to find interface '" + *interface + "'", e.getMessage());
        }

        try {
            auto device = createProxy(path);
            uint32_t type = device->getProperty("DeviceType").onInterface(NM_DEVICE_INTERFACE).get<uint32_t>();
            if (type != NM_DEVICE_TYPE_WIFI) {
                throw NetworkManagerError("Not a WiFi interface '" + *interface + "'");
            }

            uint32_t state = device->getProperty("State").onInterface(NM_DEVICE_INTERFACE).get<uint32_t>();
            if (state == NM_DEVICE_STATE_UNMANAGED) {
                throw NetworkManagerError("Interface is not managed by NetworkManager '" + *interface + "'");
            }
        } catch (const sdbus::Error& e) {
            throw NetworkManagerError("Failed to inspect interface '" + *interface + "'", e.getMessage());
        }

        std::cerr << "Using WiFi device " << *interface << std::endl;
        return Device{ path, *interface };
    }

    try {
        std::vector<sdbus::ObjectPath> devices;
        manager_->callMethod("GetDevices").onInterface(NM_INTERFACE).storeResultsTo(devices);

        for (const sdbus::ObjectPath& path : devices) {
            auto device = createProxy(path);
            uint32_t type = device->getProperty("DeviceType").onInterface(NM_DEVICE_INTERFACE).get<uint32_t>();
            uint32_t state = device->getProperty("State").onInterface(NM_DEVICE_INTERFACE).get<uint32_t>();
            if (type == NM_DEVICE_TYPE_WIFI && state != NM_DEVICE_STATE_UNMANAGED) {
                std::string name = device->getProperty("Interface").onInterface(NM_DEVICE_INTERFACE).get<std::string>();
                std::cerr << "Using WiFi device " << name << std::endl;
                return Device{ path, name };
            }
        }
    } catch (const sdbus::Error& e) {
        throw NetworkManagerError("Failed to enumerate devices", e.getMessage());
    }

    throw NetworkManagerError("Failed to find a managed WiFi device");
}

void NetworkManager::scanWifiDevice(const Device& device, std::chrono::seconds timeout) {
    auto wireless = createProxy(device.path);
    int64_t prescan = bootTimeMsec();

    std::map<std::string, sdbus::Variant> scanOptions;
    wireless->callMethod("RequestScan").onInterface(NM_WIRELESS_INTERFACE).withArguments(scanOptions);

    for (int64_t i = 0; i < timeout.count(); i++) {
        int64_t lastScan = wireless->getProperty("LastScan").onInterface(NM_WIRELESS_INTERFACE).get<int64_t>();
        if (prescan < lastScan) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    std::cerr << "WiFi scan on " << device.interface << " did not finish within "
              << timeout.count() << " seconds, using cached access points" << std::endl;
}

std::string NetworkManager::determineSecurity(uint32_t flags, uint32_t wpaFlags, uint32_t rsnFlags) {
    if (rsnFlags & NM_802_11_AP_SEC_KEY_MGMT_SAE) {
        return "WPA3";
    }
    if (rsnFlags != 0 && wpaFlags != 0) {
        return "WPA/WPA2";
    }
    if (rsnFlags != 0) {
        return "WPA2";
    }
    if (wpaFlags != 0) {
        return "WPA";
    }
    if (flags & NM_802_11_AP_FLAGS_PRIVACY) {
        return "WEP";
    }
    return "Open";
}

std::vector<NetworkManager::NetworkDetails> NetworkManager::listWifiNetworks(const Device& device,
                                                                             std::chrono::seconds timeout) {
    try {
        scanWifiDevice(device, timeout);
    } catch (const sdbus::Error& e) {
        throw NetworkManagerError("Failed to request WiFi scan", e.getMessage());
    }

    try {
        auto wireless = createProxy(device.path);
        std::vector<sdbus::ObjectPath> accessPoints;
        wireless->callMethod("GetAllAccessPoints").onInterface(NM_WIRELESS_INTERFACE).storeResultsTo(accessPoints);

        std::vector<NetworkDetails> networks;
        for (const sdbus::ObjectPath& path : accessPoints) {
            auto ap = createProxy(path);
            std::vector<uint8_t> ssidBytes =
                ap->getProperty("Ssid").onInterface(NM_ACCESS_POINT_INTERFACE).get<std::vector<uint8_t>>();
            std::optional<std::string> ssid = ssidToString(ssidBytes);
            if (!ssid) continue;

            NetworkDetails network;
            network.ssid = *ssid;
            network.strength = ap->getProperty("Strength").onInterface(NM_ACCESS_POINT_INTERFACE).get<uint8_t>();
            network.security = determineSecurity(
                ap->getProperty("Flags").onInterface(NM_ACCESS_POINT_INTERFACE).get<uint32_t>(),
                ap->getProperty("WpaFlags").onInterface(NM_ACCESS_POINT_INTERFACE).get<uint32_t>(),
                ap->getProperty("RsnFlags").onInterface(NM_ACCESS_POINT_INTERFACE).get<uint32_t>());
            networks.push_back(network);
        }

        return rankNetworks(std::move(networks), &NetworkDetails::strength);
    } catch (const sdbus::Error& e) {
        throw NetworkManagerError("Failed to list WiFi networks", e.getMessage());
    }
}

void NetworkManager::deleteAccessPointProfiles(const std::string& ssid) {
    try {
        for (const sdbus::ObjectPath& path : listConnectionPaths()) {
            Settings settings = getSettings(path);

            std::optional<std::string> type = settingValue<std::string>(settings, "connection", "type");
            std::optional<std::string> mode = settingValue<std::string>(settings, WIRELESS_SETTING_NAME, "mode");
            std::optional<std::vector<uint8_t>> ssidBytes =
                settingValue<std::vector<uint8_t>>(settings, WIRELESS_SETTING_NAME, "ssid");

            if (!type || *type != WIRELESS_SETTING_NAME || !mode || *mode != WIRELESS_MODE_AP || !ssidBytes) {
                continue;
            }

            std::optional<std::string> profileSsid = ssidToString(*ssidBytes);
            if (profileSsid && *profileSsid == ssid) {
                std::cerr << "Deleting existing access point connection profile: " << ssid << std::endl;
                deleteConnection(path);
            }
        }
    } catch (const sdbus::Error& e) {
        throw NetworkManagerError("Failed to delete existing access point profiles", e.getMessage());
    }
}

void NetworkManager::createPortal(const Device& device, const Options& opts) {
    Settings settings;
    settings["connection"]["type"] = sdbus::Variant(std::string(WIRELESS_SETTING_NAME));
    settings["connection"]["id"] = sdbus::Variant(opts.ssid);
    settings["connection"]["autoconnect"] = sdbus::Variant(false);
    settings["connection"]["interface-name"] = sdbus::Variant(device.interface);

    settings[WIRELESS_SETTING_NAME]["ssid"] = sdbus::Variant(std::vector<uint8_t>(opts.ssid.begin(), opts.ssid.end()));
    settings[WIRELESS_SETTING_NAME]["band"] = sdbus::Variant(std::string("bg"));
    settings[WIRELESS_SETTING_NAME]["hidden"] = sdbus::Variant(false);
    settings[WIRELESS_SETTING_NAME]["mode"] = sdbus::Variant(std::string(WIRELESS_MODE_AP));

    if (opts.password) {
        settings["802-11-wireless-security"]["key-mgmt"] = sdbus::Variant(std::string("wpa-psk"));
        settings["802-11-wireless-security"]["psk"] = sdbus::Variant(*opts.password);
    }

    std::map<std::string, sdbus::Variant> address;
    address["address"] = sdbus::Variant(opts.gateway);
    address["prefix"] = sdbus::Variant(uint32_t(24));
    settings["ipv4"]["address-data"] = sdbus::Variant(std::vector<std::map<std::string, sdbus::Variant>>{ address });
    settings["ipv4"]["method"] = sdbus::Variant(std::string("manual"));

    sdbus::ObjectPath connection;
    sdbus::ObjectPath active;
    try {
        manager_->callMethod("AddAndActivateConnection").onInterface(NM_INTERFACE)
            .withArguments(settings, device.path, sdbus::ObjectPath("/"))
            .storeResultsTo(connection, active);
    } catch (const sdbus::Error& e) {
        throw NetworkManagerError("Failed to add and activate connection", e.getMessage());
    }

    waitForActivation(active, connection);

    activeConnection_ = active;
    portalConnection_ = connection;
    std::cerr << "Captive portal '" << opts.ssid << "' active on " << device.interface
              << " at " << opts.gateway << std::endl;
}

void NetworkManager::awaitActivation(const std::function<uint32_t()>& readState,
                                     const std::function<void(bool)>& discard,
                                     std::chrono::milliseconds timeout,
                                     std::chrono::milliseconds interval) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    uint32_t lastState = 0;

    for (;;) {
        uint32_t state = readState();
        if (state != lastState) {
            std::cerr << "Active connection state: " << state << std::endl;
            lastState = state;
        }

        if (state == NM_ACTIVE_CONNECTION_STATE_ACTIVATED) {
            std::cerr << "Successfully activated" << std::endl;
            return;
        }

        if (state == NM_ACTIVE_CONNECTION_STATE_DEACTIVATED) {
            std::cerr << "Connection deactivated" << std::endl;
            discard(false);
            throw NetworkManagerError("Failed to activate captive portal connection");
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "Connection still activating, giving up" << std::endl;
            discard(true);
            throw NetworkManagerError("Timed out activating captive portal connection");
        }

        std::this_thread::sleep_for(interval);
    }
}

void NetworkManager::waitForActivation(const sdbus::ObjectPath& active, const sdbus::ObjectPath& connection) {
    auto proxy = createProxy(active);

    auto readState = [&proxy]() -> uint32_t {
        try {
            return proxy->getProperty("State").onInterface(NM_ACTIVE_INTERFACE).get<uint32_t>();
        } catch (const sdbus::Error& e) {
            // The active connection object is removed once it deactivates.
            std::cerr << "Active connection gone: " << e.getMessage() << std::endl;
            return NM_ACTIVE_CONNECTION_STATE_DEACTIVATED;
        }
    };

    auto discard = [this, &active, &connection](bool stillActive) {
        try {
            if (stillActive) {
                manager_->callMethod("DeactivateConnection").onInterface(NM_INTERFACE).withArguments(active);
            }
            deleteConnection(connection);
        } catch (const sdbus::Error& e) {
            throw NetworkManagerError("Failed to remove captive portal connection", e.getMessage());
        }
    };

    awaitActivation(readState, discard, PORTAL_ACTIVATION_TIMEOUT, std::chrono::milliseconds(500));
}

void NetworkManager::stop() {
    if (activeConnection_.empty()) {
        return;
    }

    try {
        manager_->callMethod("DeactivateConnection").onInterface(NM_INTERFACE).withArguments(activeConnection_);
        deleteConnection(portalConnection_);
    } catch (const sdbus::Error& e) {
        throw NetworkManagerError("Failed to stop captive portal", e.getMessage());
    }

    std::cerr << "Captive portal stopped" << std::endl;
    activeConnection_ = sdbus::ObjectPath();
    portalConnection_ = sdbus::ObjectPath();
}
