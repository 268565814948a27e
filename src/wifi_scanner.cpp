#include "wifi_scanner.hpp"
#include "information_elements.hpp"
#include "json_format.hpp"
#include "network_list.hpp"
#include "signal_quality.hpp"
#include <linux/nl80211.h>
#include <algorithm>
#include <iostream>
#include <sstream>

struct WifiScanner::ScanSession {
    State state = State::ResolvingInterface;
    ControlChannel control;
    std::unique_ptr<NetlinkTransport> events;
    WirelessInterface iface;
    std::chrono::steady_clock::time_point prescan;
};

static const char* failureContext(WifiScanner::State state) {
    switch (state) {
        case WifiScanner::State::ResolvingInterface: return "Failed to get interfaces";
        case WifiScanner::State::Triggering:         return "Failed to trigger scan";
        case WifiScanner::State::AwaitingCompletion: return "Failed to receive new scan results notification";
        case WifiScanner::State::FetchingResults:    return "Failed to receive scan results";
        default:                                     return "Failed to finish scan";
    }
}

const char* WifiScanner::stateName(State state) {
    switch (state) {
        case State::ResolvingInterface: return "resolving interface";
        case State::Triggering:         return "triggering";
        case State::AwaitingCompletion: return "awaiting completion";
        case State::FetchingResults:    return "fetching results";
        default:                        return "done";
    }
}

std::string WifiScanner::Station::toJson() const {
    std::ostringstream json;
    json << "{";
    json << "\"ssid\":" << jsonString(ssid) << ",";
    json << "\"quality\":" << quality;
    json << "}";
    return json.str();
}

WifiScanner::WifiScanner() : WifiScanner(ScanOptions()) {}

WifiScanner::WifiScanner(const ScanOptions& options)
    : WifiScanner(std::make_shared<LibnlTransportFactory>(), options) {}

WifiScanner::WifiScanner(std::shared_ptr<NetlinkTransportFactory> factory, const ScanOptions& options)
    : factory_(std::move(factory)), options_(options) {}

WifiScanner::~WifiScanner() {}

std::vector<WifiScanner::Station> WifiScanner::scanNetwork(const std::string& interfaceName) {
    ScanSession session;
    std::cerr << "Scanning WiFi networks on " << interfaceName << std::endl;

    try {
        resolveInterface(session, interfaceName);
        triggerScan(session);
        awaitCompletion(session);
        std::vector<Station> stations = fetchResults(session);
        enter(session, State::Done);

        stations = postProcess(std::move(stations));
        std::cerr << "Found " << stations.size() << " networks on " << interfaceName << std::endl;
        return stations;
    } catch (ScanError& e) {
        e.addContext(failureContext(session.state));
        throw;
    }
}

void WifiScanner::enter(ScanSession& session, State state) {
    session.state = state;
    if (options_.verbose) {
        std::cerr << "Scan state: " << stateName(state) << std::endl;
    }
}

void WifiScanner::resolveInterface(ScanSession& session, const std::string& interfaceName) {
    enter(session, State::ResolvingInterface);

    session.control = factory_->openControl();
    session.control.transport->send(createGetInterfaceRequest(session.control.familyId));

    std::vector<WirelessInterface> interfaces = receiveAll<WirelessInterface>(
        *session.control.transport,
        [](const NetlinkMessage& msg) { return WirelessInterface::fromMessage(msg); },
        static_cast<int>(options_.replyTimeout.count()));

    auto it = std::find_if(interfaces.begin(), interfaces.end(),
        [&interfaceName](const WirelessInterface& iface) {
            return iface.name == interfaceName;
        });

    if (it == interfaces.end()) {
        throw InterfaceNotFound("Interface not found: '" + interfaceName + "'");
    }

    session.iface = *it;
    if (options_.verbose) {
        std::cerr << "Using wireless interface " << session.iface.name
                  << " (index " << session.iface.index
                  << ", " << interfaceTypeName(session.iface.type)
                  << ", " << session.iface.macString() << ")" << std::endl;
    }
}

void WifiScanner::triggerScan(ScanSession& session) {
    enter(session, State::Triggering);

    // Subscribe before triggering so a fast scan cannot finish unobserved.
    session.events = factory_->openEventChannel(NL80211_FAMILY_NAME, NL80211_SCAN_GROUP_NAME);

    session.prescan = std::chrono::steady_clock::now();
    session.control.transport->send(
        createTriggerScanRequest(session.control.familyId, session.iface.index));

    receiveAck(*session.control.transport, static_cast<int>(options_.replyTimeout.count()));
}

void WifiScanner::awaitCompletion(ScanSession& session) {
    using Clock = std::chrono::steady_clock;
    enter(session, State::AwaitingCompletion);

    const Clock::time_point deadline = session.prescan + options_.completionTimeout;
    std::vector<NetlinkMessage> batch;

    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0 ||
            !session.events->receiveBatch(batch, static_cast<int>(remaining.count()))) {
            throw ScanTimeout("No scan results within " +
                              std::to_string(options_.completionTimeout.count()) + " seconds");
        }

        for (const NetlinkMessage& msg : batch) {
            if (msg.kind != NetlinkMessage::Kind::Data) continue;

            if (msg.command != NL80211_CMD_NEW_SCAN_RESULTS) {
                if (options_.verbose) {
                    std::cerr << "Ignoring nl80211 scan notification, command " << static_cast<int>(msg.command)
                              << std::endl;
                }
                continue;
            }

            // Notifications for other radios share the multicast group.
            try {
                NetlinkAttributes attrs = msg.attributes();
                const NetlinkAttribute* ifindex = attrs.find(NL80211_ATTR_IFINDEX);
                if (ifindex && ifindex->asU32() != session.iface.index) continue;
            } catch (const DecodeError& e) {
                std::cerr << "Ignoring malformed scan notification: " << e.what() << std::endl;
                continue;
            }

            if (options_.verbose) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - session.prescan);
                std::cerr << "Scan completed after " << elapsed.count() << " ms" << std::endl;
            }
            return;
        }
    }
}

std::vector<WifiScanner::Station> WifiScanner::fetchResults(ScanSession& session) {
    enter(session, State::FetchingResults);

    session.control.transport->send(
        createGetScanRequest(session.control.familyId, session.iface.index));

    const bool verbose = options_.verbose;
    return receiveAll<Station>(
        *session.control.transport,
        [verbose](const NetlinkMessage& msg) -> std::optional<Station> {
            try {
                return decodeStation(msg);
            } catch (const DecodeError& e) {
                if (verbose) {
                    std::cerr << "Dropping malformed scan entry: " << e.what() << std::endl;
                }
                return std::nullopt;
            }
        },
        static_cast<int>(options_.replyTimeout.count()));
}

std::optional<WifiScanner::Station> WifiScanner::decodeStation(const NetlinkMessage& message) {
    NetlinkAttributes attrs = message.attributes();

    const NetlinkAttribute* bssAttr = attrs.find(NL80211_ATTR_BSS);
    if (!bssAttr) {
        return std::nullopt;
    }

    NetlinkAttributes bss = bssAttr->asNested();

    const NetlinkAttribute* signal = bss.find(NL80211_BSS_SIGNAL_MBM);
    if (!signal) {
        return std::nullopt;
    }

    Station station;
    station.quality = signalQuality(signal->asI32());

    std::vector<uint8_t> ssidBytes;
    if (const NetlinkAttribute* ies = bss.find(NL80211_BSS_INFORMATION_ELEMENTS)) {
        const std::vector<uint8_t>& buffer = ies->payload();
        std::optional<std::vector<uint8_t>> ssid = extractSsid(buffer.data(), buffer.size());
        if (ssid) {
            ssidBytes = std::move(*ssid);
        }
    }

    std::optional<std::string> ssid = ssidToString(ssidBytes);
    if (!ssid) {
        return std::nullopt;
    }
    station.ssid = std::move(*ssid);

    return station;
}

std::vector<WifiScanner::Station> WifiScanner::postProcess(std::vector<Station> stations) {
    return rankNetworks(std::move(stations), &Station::quality);
}
