#pragma once
#include "netlink_message.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

enum class InterfaceType : uint32_t {
    Unspecified = 0,
    Adhoc,
    Station,
    AP,
    APVlan,
    WDS,
    Monitor,
    MeshPoint,
    P2PClient,
    P2PGo,
    P2PDevice,
    Ocb,
    Nan
};

const char* interfaceTypeName(InterfaceType type);

struct WirelessInterface {
    std::string name;
    uint32_t index = 0;
    InterfaceType type = InterfaceType::Unspecified;
    uint32_t wiphy = 0;
    uint64_t wdev = 0;
    std::array<uint8_t, 6> macAddress{};

    std::string macString() const;

    // Decodes one NL80211_CMD_NEW_INTERFACE dump entry. Entries lacking any
    // of the identifying attributes (P2P devices have no netdev, for one)
    // yield nullopt; attributes of the wrong size throw DecodeError.
    static std::optional<WirelessInterface> fromMessage(const NetlinkMessage& message);
};
