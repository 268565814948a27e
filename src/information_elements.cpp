#include "information_elements.hpp"

std::optional<std::vector<uint8_t>> findInformationElement(const uint8_t* data, size_t length,
                                                           uint8_t elementId) {
    if (data == nullptr) {
        return std::nullopt;
    }

    for (size_t i = 0; i < length; ) {
        if (i + 1 >= length) break;

        uint8_t id = data[i];
        uint8_t len = data[i + 1];

        if (i + 2 + len > length) break;

        if (id == elementId) {
            return std::vector<uint8_t>(data + i + 2, data + i + 2 + len);
        }

        i += 2 + len;
    }

    return std::nullopt;
}

std::optional<std::vector<uint8_t>> extractSsid(const uint8_t* data, size_t length) {
    return findInformationElement(data, length, WLAN_EID_SSID);
}
