#include "wireless_interface.hpp"
#include "scan_error.hpp"
#include <linux/nl80211.h>
#include <algorithm>
#include <iomanip>
#include <sstream>

const char* interfaceTypeName(InterfaceType type) {
    switch (type) {
        case InterfaceType::Adhoc:     return "adhoc";
        case InterfaceType::Station:   return "station";
        case InterfaceType::AP:        return "AP";
        case InterfaceType::APVlan:    return "AP/VLAN";
        case InterfaceType::WDS:       return "WDS";
        case InterfaceType::Monitor:   return "monitor";
        case InterfaceType::MeshPoint: return "mesh point";
        case InterfaceType::P2PClient: return "P2P-client";
        case InterfaceType::P2PGo:     return "P2P-GO";
        case InterfaceType::P2PDevice: return "P2P-device";
        case InterfaceType::Ocb:       return "outside context of a BSS";
        case InterfaceType::Nan:       return "NAN";
        default:                       return "unspecified";
    }
}

static InterfaceType toInterfaceType(uint32_t value) {
    if (value > NL80211_IFTYPE_NAN) {
        return InterfaceType::Unspecified;
    }
    return static_cast<InterfaceType>(value);
}

std::string WirelessInterface::macString() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < macAddress.size(); i++) {
        if (i > 0) oss << ":";
        oss << std::setw(2) << static_cast<int>(macAddress[i]);
    }
    return oss.str();
}

std::optional<WirelessInterface> WirelessInterface::fromMessage(const NetlinkMessage& message) {
    NetlinkAttributes attrs = message.attributes();

    const NetlinkAttribute* name = attrs.find(NL80211_ATTR_IFNAME);
    const NetlinkAttribute* index = attrs.find(NL80211_ATTR_IFINDEX);
    const NetlinkAttribute* type = attrs.find(NL80211_ATTR_IFTYPE);
    const NetlinkAttribute* wiphy = attrs.find(NL80211_ATTR_WIPHY);
    const NetlinkAttribute* wdev = attrs.find(NL80211_ATTR_WDEV);
    const NetlinkAttribute* mac = attrs.find(NL80211_ATTR_MAC);

    if (!name || !index || !type || !wiphy || !wdev || !mac) {
        return std::nullopt;
    }

    WirelessInterface iface;
    iface.name = name->asString();
    iface.index = index->asU32();
    iface.type = toInterfaceType(type->asU32());
    iface.wiphy = wiphy->asU32();
    iface.wdev = wdev->asU64();

    const std::vector<uint8_t>& macBytes = mac->payload();
    if (macBytes.size() != iface.macAddress.size()) {
        throw DecodeError("MAC address attribute has " + std::to_string(macBytes.size()) + " bytes");
    }
    std::copy(macBytes.begin(), macBytes.end(), iface.macAddress.begin());

    return iface;
}
