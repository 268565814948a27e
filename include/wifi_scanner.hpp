#pragma once
#include "netlink_transport.hpp"
#include "wireless_interface.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ScanOptions {
    // Upper bound for the NEW_SCAN_RESULTS notification after the trigger.
    std::chrono::seconds completionTimeout{45};
    // Upper bound for each reply on the control socket.
    std::chrono::milliseconds replyTimeout{10000};
    bool verbose = false;
};

// Active nl80211 scan of one interface: resolve the interface, trigger a
// scan, wait for the completion event, dump and decode the BSS list.
class WifiScanner {
public:
    struct Station {
        std::string ssid;
        int quality = 0;

        bool operator==(const Station& other) const {
            return ssid == other.ssid && quality == other.quality;
        }

        std::string toJson() const;
    };

    enum class State {
        ResolvingInterface,
        Triggering,
        AwaitingCompletion,
        FetchingResults,
        Done
    };

    WifiScanner();
    explicit WifiScanner(const ScanOptions& options);
    WifiScanner(std::shared_ptr<NetlinkTransportFactory> factory, const ScanOptions& options);
    ~WifiScanner();

    std::vector<Station> scanNetwork(const std::string& interfaceName);

    // Sort by quality then SSID (both descending), keep the first of each
    // SSID, drop hidden networks.
    static std::vector<Station> postProcess(std::vector<Station> stations);

    // Decodes one scan dump entry. Entries without a signal level or with an
    // SSID that is not valid UTF-8 yield nullopt.
    static std::optional<Station> decodeStation(const NetlinkMessage& message);

    static const char* stateName(State state);

private:
    struct ScanSession;

    void enter(ScanSession& session, State state);
    void resolveInterface(ScanSession& session, const std::string& interfaceName);
    void triggerScan(ScanSession& session);
    void awaitCompletion(ScanSession& session);
    std::vector<Station> fetchResults(ScanSession& session);

    std::shared_ptr<NetlinkTransportFactory> factory_;
    ScanOptions options_;
};
