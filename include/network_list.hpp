#pragma once
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

// SSIDs are raw bytes; only valid UTF-8 is accepted as a network name.
std::optional<std::string> ssidToString(const std::vector<uint8_t>& ssid);

bool isValidUtf8(const std::string& text);

// Orders networks by signal then SSID, both descending, keeps the first
// entry of every SSID and drops hidden (empty) SSIDs. The order of the
// three steps decides which duplicate survives.
template <typename T>
std::vector<T> rankNetworks(std::vector<T> networks, int T::*signal) {
    std::sort(networks.begin(), networks.end(),
        [signal](const T& a, const T& b) {
            if (a.*signal != b.*signal) return a.*signal > b.*signal;
            return a.ssid > b.ssid;
        });

    std::unordered_set<std::string> seen;
    std::vector<T> unique;
    for (T& network : networks) {
        if (seen.insert(network.ssid).second) {
            unique.push_back(std::move(network));
        }
    }

    unique.erase(std::remove_if(unique.begin(), unique.end(),
        [](const T& network) {
            return network.ssid.empty();
        }), unique.end());

    return unique;
}
