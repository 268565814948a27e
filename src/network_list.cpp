#include "network_list.hpp"

bool isValidUtf8(const std::string& text) {
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(text.data());
    size_t length = text.size();

    for (size_t i = 0; i < length; ) {
        unsigned char lead = bytes[i];
        size_t extra;
        uint32_t codepoint;

        if (lead < 0x80) {
            i++;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            codepoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            codepoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            codepoint = lead & 0x07;
        } else {
            return false;
        }

        if (i + extra >= length) {
            return false;
        }
        for (size_t k = 1; k <= extra; k++) {
            if ((bytes[i + k] & 0xC0) != 0x80) return false;
            codepoint = (codepoint << 6) | (bytes[i + k] & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF.
        static const uint32_t minimum[] = { 0, 0x80, 0x800, 0x10000 };
        if (codepoint < minimum[extra] || codepoint > 0x10FFFF ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return false;
        }

        i += extra + 1;
    }

    return true;
}

std::optional<std::string> ssidToString(const std::vector<uint8_t>& ssid) {
    std::string text(ssid.begin(), ssid.end());
    if (!isValidUtf8(text)) {
        return std::nullopt;
    }
    return text;
}
