#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

constexpr uint8_t WLAN_EID_SSID = 0;

// Walks an 802.11 information element chain (id byte, length byte,
// payload) and returns the payload of the first element with the given
// id. A truncated trailing element ends the walk without an error.
std::optional<std::vector<uint8_t>> findInformationElement(const uint8_t* data, size_t length,
                                                           uint8_t elementId);

std::optional<std::vector<uint8_t>> extractSsid(const uint8_t* data, size_t length);
