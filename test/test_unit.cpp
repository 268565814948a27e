/**
 * @file test_unit.cpp
 * @brief Unit tests for pure logic (no kernel or bus access).
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "fake_transport.hpp"
#include "http_server.hpp"
#include "information_elements.hpp"
#include "json_format.hpp"
#include "network_list.hpp"
#include "network_manager.hpp"
#include "options.hpp"
#include "scan_error.hpp"
#include "signal_quality.hpp"
#include "web_api.hpp"
#include "wifi_scanner.hpp"
#include "wireless_interface.hpp"
#include <cerrno>
#include <climits>

using Station = WifiScanner::Station;

// =============================================================================
// Signal quality
// =============================================================================

TEST_CASE("Signal quality") {
    SUBCASE("strong signal is 100") {
        CHECK(signalQuality(-4000) == 100);
    }
    SUBCASE("weak signal is 0") {
        CHECK(signalQuality(-10000) == 0);
    }
    SUBCASE("midpoint") {
        CHECK(signalQuality(-7000) == 50);
    }
    SUBCASE("clamped beyond the range") {
        CHECK(signalQuality(-2000) == 100);
        CHECK(signalQuality(-12000) == 0);
        CHECK(signalQuality(INT32_MAX) == 100);
        CHECK(signalQuality(INT32_MIN) == 0);
    }
    SUBCASE("monotonic") {
        int previous = signalQuality(0);
        for (int32_t mbm = 0; mbm >= -11000; mbm -= 50) {
            int quality = signalQuality(mbm);
            CHECK(quality <= previous);
            CHECK(quality >= 0);
            CHECK(quality <= 100);
            previous = quality;
        }
    }
}

// =============================================================================
// Information elements
// =============================================================================

TEST_CASE("Information element extraction") {
    SUBCASE("SSID between other elements") {
        std::vector<uint8_t> ies = { 5, 1, 'x', 0, 5, 'M', 'y', 'N', 'e', 't', 1, 1, 'y' };
        auto ssid = extractSsid(ies.data(), ies.size());
        REQUIRE(ssid);
        CHECK(std::string(ssid->begin(), ssid->end()) == "MyNet");
    }
    SUBCASE("truncated trailing element") {
        std::vector<uint8_t> ies = { 5, 1, 'x', 0, 9, 'M', 'y' };
        CHECK_FALSE(extractSsid(ies.data(), ies.size()));
    }
    SUBCASE("lone id byte") {
        std::vector<uint8_t> ies = { 5, 1, 'x', 0 };
        CHECK_FALSE(extractSsid(ies.data(), ies.size()));
    }
    SUBCASE("empty buffer") {
        CHECK_FALSE(extractSsid(nullptr, 0));
        std::vector<uint8_t> ies;
        CHECK_FALSE(extractSsid(ies.data(), ies.size()));
    }
    SUBCASE("hidden network has an empty SSID element") {
        std::vector<uint8_t> ies = { 0, 0, 1, 1, 0x82 };
        auto ssid = extractSsid(ies.data(), ies.size());
        REQUIRE(ssid);
        CHECK(ssid->empty());
    }
    SUBCASE("other element ids") {
        std::vector<uint8_t> ies = { 5, 1, 'x', 1, 1, 'y' };
        auto rates = findInformationElement(ies.data(), ies.size(), 1);
        REQUIRE(rates);
        CHECK(*rates == std::vector<uint8_t>{ 'y' });
    }
}

// =============================================================================
// SSID text and post-processing
// =============================================================================

TEST_CASE("SSID to string") {
    CHECK(*ssidToString({ 'H', 'o', 'm', 'e' }) == "Home");
    CHECK(*ssidToString({ 'c', 'a', 'f', 0xc3, 0xa9 }) == "caf\xc3\xa9");
    CHECK(*ssidToString({}) == "");
    CHECK_FALSE(ssidToString({ 0xff, 'a' }));
    CHECK_FALSE(ssidToString({ 'a', 0xc3 }));
    // Overlong encoding of '/'.
    CHECK_FALSE(ssidToString({ 0xc0, 0xaf }));
    // UTF-16 surrogate.
    CHECK_FALSE(ssidToString({ 0xed, 0xa0, 0x80 }));
}

TEST_CASE("Post-processing") {
    SUBCASE("dedup, order and hidden networks") {
        std::vector<Station> input = { { "A", 50 }, { "B", 80 }, { "A", 90 }, { "", 99 } };
        std::vector<Station> expected = { { "A", 90 }, { "B", 80 } };
        CHECK(WifiScanner::postProcess(input) == expected);
    }
    SUBCASE("ties ordered by SSID descending") {
        std::vector<Station> input = { { "alpha", 60 }, { "gamma", 60 }, { "beta", 60 } };
        std::vector<Station> expected = { { "gamma", 60 }, { "beta", 60 }, { "alpha", 60 } };
        CHECK(WifiScanner::postProcess(input) == expected);
    }
    SUBCASE("empty input") {
        CHECK(WifiScanner::postProcess({}).empty());
    }
}

// =============================================================================
// Attribute codec
// =============================================================================

TEST_CASE("Request encode and decode") {
    SUBCASE("interface index survives the round trip") {
        NetlinkRequest request = createTriggerScanRequest(fake::FAMILY_ID, 7);
        NetlinkMessage msg = fake::single(request.bytes());

        CHECK(msg.kind == NetlinkMessage::Kind::Data);
        CHECK(msg.command == NL80211_CMD_TRIGGER_SCAN);
        CHECK(msg.version == 0);
        CHECK((msg.flags & NLM_F_ACK) != 0);

        NetlinkAttributes attrs = msg.attributes();
        CHECK(attrs.get(NL80211_ATTR_IFINDEX).asU32() == 7);
        CHECK(attrs.get(NL80211_ATTR_SCAN_FLAGS).asU32() == NL80211_SCAN_FLAG_AP);
    }
    SUBCASE("dump requests") {
        NetlinkMessage interfaces = fake::single(createGetInterfaceRequest(fake::FAMILY_ID).bytes());
        CHECK(interfaces.command == NL80211_CMD_GET_INTERFACE);
        CHECK((interfaces.flags & NLM_F_DUMP) == NLM_F_DUMP);
        CHECK(interfaces.attributes().size() == 0);

        NetlinkMessage scan = fake::single(createGetScanRequest(fake::FAMILY_ID, 3).bytes());
        CHECK(scan.command == NL80211_CMD_GET_SCAN);
        CHECK((scan.flags & NLM_F_DUMP) == NLM_F_DUMP);
        CHECK(scan.attributes().get(NL80211_ATTR_IFINDEX).asU32() == 3);
    }
}

TEST_CASE("Attribute widths") {
    NetlinkAttribute twoBytes(NL80211_ATTR_IFINDEX, { 1, 2 });
    CHECK(twoBytes.asU16() == 0x0201);
    CHECK_THROWS_AS(twoBytes.asU32(), DecodeError);
    CHECK_THROWS_AS(twoBytes.asU8(), DecodeError);
    CHECK_THROWS_AS(twoBytes.asU64(), DecodeError);
    CHECK_THROWS_AS(twoBytes.asI32(), DecodeError);

    NetlinkAttribute negative(NL80211_BSS_SIGNAL_MBM, { 0x60, 0xf0, 0xff, 0xff });
    CHECK(negative.asI32() == -4000);

    NetlinkAttribute name(NL80211_ATTR_IFNAME, { 'w', 'l', 'a', 'n', '0', 0 });
    CHECK(name.asString() == "wlan0");
    CHECK_THROWS_AS(NetlinkAttribute(NL80211_ATTR_IFNAME, {}).asString(), DecodeError);
}

TEST_CASE("Attribute sequences") {
    SUBCASE("nested view") {
        NetlinkMessage msg = fake::single(fake::bssMessage(3, "Nested", -5000));
        NetlinkAttributes bss = msg.attributes().get(NL80211_ATTR_BSS).asNested();
        CHECK(bss.get(NL80211_BSS_FREQUENCY).asU32() == 2412);
        CHECK(bss.get(NL80211_BSS_SIGNAL_MBM).asI32() == -5000);
        CHECK(bss.get(NL80211_BSS_BSSID).payload().size() == 6);
    }
    SUBCASE("attribute longer than the buffer") {
        std::vector<uint8_t> bytes = { 0x08, 0x00, 0x03, 0x00, 0x01, 0x02 };
        CHECK_THROWS_AS(NetlinkAttributes::parse(bytes.data(), bytes.size()), DecodeError);
    }
    SUBCASE("cut-off header") {
        std::vector<uint8_t> bytes = { 0x08, 0x00, 0x03, 0x00, 0x01, 0x00, 0x00, 0x00, 0x05, 0x00 };
        CHECK_THROWS_AS(NetlinkAttributes::parse(bytes.data(), bytes.size()), DecodeError);
    }
    SUBCASE("truncated nested payload names the attribute") {
        NetlinkAttribute nested(NL80211_ATTR_BSS, { 0x08, 0x00, 0x01 });
        try {
            nested.asNested();
            FAIL("expected DecodeError");
        } catch (const DecodeError& e) {
            REQUIRE(e.chain().size() == 2);
            CHECK(e.chain()[0] == "Failed to read attribute " + std::to_string(NL80211_ATTR_BSS) + " as nested");
        }
    }
    SUBCASE("unknown attributes are kept") {
        std::vector<uint8_t> bytes = { 0x08, 0x00, 0xff, 0x07, 0x01, 0x00, 0x00, 0x00,
                                       0x08, 0x00, 0x03, 0x00, 0x09, 0x00, 0x00, 0x00 };
        NetlinkAttributes attrs = NetlinkAttributes::parse(bytes.data(), bytes.size());
        CHECK(attrs.size() == 2);
        CHECK(attrs.has(0x7ff));
        CHECK(attrs.get(NL80211_ATTR_IFINDEX).asU32() == 9);
    }
    SUBCASE("repeated type keeps the last value") {
        std::vector<uint8_t> bytes = { 0x08, 0x00, 0x03, 0x00, 0x01, 0x00, 0x00, 0x00,
                                       0x08, 0x00, 0x03, 0x00, 0x02, 0x00, 0x00, 0x00 };
        NetlinkAttributes attrs = NetlinkAttributes::parse(bytes.data(), bytes.size());
        CHECK(attrs.get(NL80211_ATTR_IFINDEX).asU32() == 2);
    }
    SUBCASE("missing attribute") {
        NetlinkAttributes attrs = NetlinkAttributes::parse(nullptr, 0);
        CHECK(attrs.find(NL80211_ATTR_IFINDEX) == nullptr);
        CHECK_THROWS_AS(attrs.get(NL80211_ATTR_IFINDEX), DecodeError);
    }
}

TEST_CASE("Message batches") {
    SUBCASE("control messages") {
        std::vector<NetlinkMessage> batch = fake::batch({ fake::ackMessage(), fake::doneMessage() });
        REQUIRE(batch.size() == 2);
        CHECK(batch[0].kind == NetlinkMessage::Kind::Ack);
        CHECK(batch[1].kind == NetlinkMessage::Kind::Done);
    }
    SUBCASE("kernel error with extended ack text") {
        NetlinkMessage msg = fake::single(fake::errorMessage(-EBUSY, "Scan already in progress"));
        CHECK(msg.kind == NetlinkMessage::Kind::Error);
        CHECK(msg.error == -EBUSY);
        CHECK(kernelErrorText(msg) == "Scan already in progress");
    }
    SUBCASE("kernel error without text falls back to strerror") {
        NetlinkMessage msg = fake::single(fake::errorMessage(-ENODEV));
        CHECK(msg.errorMessage.empty());
        CHECK(kernelErrorText(msg) == std::strerror(ENODEV));
    }
    SUBCASE("clean end of dump") {
        NetlinkMessage msg = fake::single(fake::doneMessage());
        CHECK(msg.kind == NetlinkMessage::Kind::Done);
        CHECK(msg.error == 0);
    }
    SUBCASE("end of a failed dump carries the errno") {
        NetlinkMessage msg = fake::single(fake::doneMessage(-ENODEV));
        CHECK(msg.kind == NetlinkMessage::Kind::Done);
        CHECK(msg.error == -ENODEV);
        CHECK(kernelErrorText(msg) == std::strerror(ENODEV));
    }
    SUBCASE("end of a failed dump with extended ack text") {
        NetlinkMessage msg = fake::single(fake::doneMessage(-EINVAL, "Invalid scan dump"));
        CHECK(msg.error == -EINVAL);
        CHECK(kernelErrorText(msg) == "Invalid scan dump");
    }
    SUBCASE("trailing bytes") {
        std::vector<uint8_t> bytes = fake::doneMessage();
        bytes.insert(bytes.end(), { 0x01, 0x02, 0x03 });
        CHECK_THROWS_AS(NetlinkMessage::decodeBatch(bytes.data(), bytes.size()), DecodeError);
    }
    SUBCASE("data message without generic header") {
        struct nl_msg* raw = nlmsg_alloc_simple(fake::FAMILY_ID, 0);
        std::vector<uint8_t> bytes = fake::messageBytes(raw);
        CHECK_THROWS_AS(NetlinkMessage::decodeBatch(bytes.data(), bytes.size()), DecodeError);
    }
}

// =============================================================================
// Interfaces and stations
// =============================================================================

TEST_CASE("Wireless interface decode") {
    SUBCASE("complete entry") {
        auto iface = WirelessInterface::fromMessage(fake::single(fake::interfaceMessage("wlan0", 3)));
        REQUIRE(iface);
        CHECK(iface->name == "wlan0");
        CHECK(iface->index == 3);
        CHECK(iface->type == InterfaceType::Station);
        CHECK(iface->wdev == 1);
        CHECK(iface->macString() == "02:00:00:00:00:03");
        CHECK(std::string(interfaceTypeName(iface->type)) == "station");
    }
    SUBCASE("entry without a netdev") {
        NetlinkMessage msg = fake::single(fake::GenlBuilder(NL80211_CMD_NEW_INTERFACE)
            .u32(NL80211_ATTR_IFTYPE, NL80211_IFTYPE_P2P_DEVICE)
            .u32(NL80211_ATTR_WIPHY, 0)
            .u64(NL80211_ATTR_WDEV, 2)
            .build());
        CHECK_FALSE(WirelessInterface::fromMessage(msg));
    }
    SUBCASE("wrong index width") {
        NetlinkMessage msg = fake::single(fake::GenlBuilder(NL80211_CMD_NEW_INTERFACE)
            .string(NL80211_ATTR_IFNAME, "wlan0")
            .u16(NL80211_ATTR_IFINDEX, 3)
            .u32(NL80211_ATTR_IFTYPE, NL80211_IFTYPE_STATION)
            .u32(NL80211_ATTR_WIPHY, 0)
            .u64(NL80211_ATTR_WDEV, 1)
            .bytes(NL80211_ATTR_MAC, { 1, 2, 3, 4, 5, 6 })
            .build());
        CHECK_THROWS_AS(WirelessInterface::fromMessage(msg), DecodeError);
    }
    SUBCASE("short MAC address") {
        NetlinkMessage msg = fake::single(fake::GenlBuilder(NL80211_CMD_NEW_INTERFACE)
            .string(NL80211_ATTR_IFNAME, "wlan0")
            .u32(NL80211_ATTR_IFINDEX, 3)
            .u32(NL80211_ATTR_IFTYPE, NL80211_IFTYPE_STATION)
            .u32(NL80211_ATTR_WIPHY, 0)
            .u64(NL80211_ATTR_WDEV, 1)
            .bytes(NL80211_ATTR_MAC, { 1, 2, 3, 4, 5 })
            .build());
        CHECK_THROWS_AS(WirelessInterface::fromMessage(msg), DecodeError);
    }
}

TEST_CASE("Station decode") {
    SUBCASE("SSID and quality") {
        auto station = WifiScanner::decodeStation(fake::single(fake::bssMessage(3, "Cafe", -5500)));
        REQUIRE(station);
        CHECK(station->ssid == "Cafe");
        CHECK(station->quality == 75);
    }
    SUBCASE("no information elements means hidden") {
        NetlinkMessage msg = fake::single(fake::GenlBuilder(NL80211_CMD_NEW_SCAN_RESULTS)
            .beginNested(NL80211_ATTR_BSS)
            .s32(NL80211_BSS_SIGNAL_MBM, -6000)
            .endNested()
            .build());
        auto station = WifiScanner::decodeStation(msg);
        REQUIRE(station);
        CHECK(station->ssid.empty());
    }
    SUBCASE("no signal level") {
        NetlinkMessage msg = fake::single(fake::GenlBuilder(NL80211_CMD_NEW_SCAN_RESULTS)
            .beginNested(NL80211_ATTR_BSS)
            .bytes(NL80211_BSS_INFORMATION_ELEMENTS, fake::ssidElements("NoSignal"))
            .endNested()
            .build());
        CHECK_FALSE(WifiScanner::decodeStation(msg));
    }
    SUBCASE("no BSS attribute") {
        CHECK_FALSE(WifiScanner::decodeStation(fake::single(
            fake::notificationMessage(NL80211_CMD_NEW_SCAN_RESULTS, 3))));
    }
    SUBCASE("SSID that is not UTF-8") {
        std::vector<uint8_t> ies = { 0, 2, 0xff, 0xfe };
        CHECK_FALSE(WifiScanner::decodeStation(fake::single(fake::bssMessage(3, ies, -5000))));
    }
    SUBCASE("JSON") {
        Station station{ "Say \"hi\"", 42 };
        CHECK(station.toJson() == "{\"ssid\":\"Say \\\"hi\\\"\",\"quality\":42}");
    }
}

// =============================================================================
// Errors
// =============================================================================

TEST_CASE("Error chains") {
    SUBCASE("scan error contexts are outermost first") {
        ProtocolError error("Device or resource busy", -EBUSY);
        error.addContext("Failed to trigger scan");
        error.addContext("Scan of wlan0");
        std::vector<std::string> expected = { "Scan of wlan0", "Failed to trigger scan", "Device or resource busy" };
        CHECK(error.chain() == expected);
        CHECK(error.code() == -EBUSY);
        CHECK(errorChain(error) == expected);
    }
    SUBCASE("NetworkManager errors") {
        NetworkManagerError error("Failed to list connections", "org.freedesktop.DBus.Error.ServiceUnknown");
        CHECK(std::string(error.what()) == "Failed to list connections: org.freedesktop.DBus.Error.ServiceUnknown");
        CHECK(errorChain(error).size() == 2);
    }
    SUBCASE("other exceptions") {
        std::runtime_error error("boom");
        CHECK(errorChain(error) == std::vector<std::string>{ "boom" });
    }
    SUBCASE("error response") {
        InterfaceNotFound error("Interface not found: 'wlan9'");
        error.addContext("Failed to get interfaces");
        HttpServer::Response response = errorResponse(error);
        CHECK(response.status == 500);
        CHECK(response.body == "{\"errors\":[\"Failed to get interfaces\",\"Interface not found: 'wlan9'\"]}");
    }
}

TEST_CASE("Access point security") {
    CHECK(NetworkManager::determineSecurity(0, 0, 0) == "Open");
    CHECK(NetworkManager::determineSecurity(1, 0, 0) == "WEP");
    CHECK(NetworkManager::determineSecurity(1, 0x188, 0) == "WPA");
    CHECK(NetworkManager::determineSecurity(1, 0, 0x188) == "WPA2");
    CHECK(NetworkManager::determineSecurity(1, 0x188, 0x188) == "WPA/WPA2");
    CHECK(NetworkManager::determineSecurity(1, 0, 0x400) == "WPA3");
}

TEST_CASE("Portal activation wait") {
    std::vector<bool> discards;
    auto discard = [&discards](bool stillActive) { discards.push_back(stillActive); };

    SUBCASE("activated") {
        std::vector<uint32_t> states = { 1, 1, 2 };
        size_t next = 0;
        NetworkManager::awaitActivation([&] { return states[next++]; }, discard,
                                        std::chrono::milliseconds(1000), std::chrono::milliseconds(0));
        CHECK(next == 3);
        CHECK(discards.empty());
    }
    SUBCASE("deactivated removes the profile") {
        CHECK_THROWS_WITH_AS(
            NetworkManager::awaitActivation([] { return uint32_t(4); }, discard,
                                            std::chrono::milliseconds(1000), std::chrono::milliseconds(0)),
            "Failed to activate captive portal connection", NetworkManagerError);
        CHECK(discards == std::vector<bool>{ false });
    }
    SUBCASE("timeout deactivates and removes the profile") {
        CHECK_THROWS_WITH_AS(
            NetworkManager::awaitActivation([] { return uint32_t(1); }, discard,
                                            std::chrono::milliseconds(0), std::chrono::milliseconds(0)),
            "Timed out activating captive portal connection", NetworkManagerError);
        CHECK(discards == std::vector<bool>{ true });
    }
}

// =============================================================================
// Options
// =============================================================================

static Options parse(std::vector<std::string> args) {
    args.insert(args.begin(), "wifi-connect");
    std::vector<char*> argv;
    for (std::string& arg : args) {
        argv.push_back(&arg[0]);
    }
    return parseOptions(static_cast<int>(argv.size()), argv.data());
}

TEST_CASE("Option parsing") {
    SUBCASE("defaults") {
        Options opts = parse({});
        CHECK(opts.ssid == "WiFiConnect");
        CHECK_FALSE(opts.interface);
        CHECK_FALSE(opts.password);
        CHECK(opts.gateway == "192.168.42.1");
        CHECK(opts.listenAddress == "127.0.0.1");
        CHECK(opts.listenPort == 3000);
        CHECK(opts.scanTimeout == std::chrono::seconds(45));
        CHECK_FALSE(opts.scanOnly);
    }
    SUBCASE("all values") {
        Options opts = parse({ "-s", "Setup", "--interface", "wlp2s0", "-p", "secret123",
                               "-g", "10.0.0.1", "--listen", "0.0.0.0:8080", "-t", "20",
                               "--scan", "--table", "-v" });
        CHECK(opts.ssid == "Setup");
        CHECK(*opts.interface == "wlp2s0");
        CHECK(*opts.password == "secret123");
        CHECK(opts.gateway == "10.0.0.1");
        CHECK(opts.listenAddress == "0.0.0.0");
        CHECK(opts.listenPort == 8080);
        CHECK(opts.scanTimeout == std::chrono::seconds(20));
        CHECK(opts.scanOnly);
        CHECK(opts.table);
        CHECK(opts.verbose);
    }
    SUBCASE("help") {
        CHECK(parse({ "--help" }).help);
    }
    SUBCASE("invalid input") {
        CHECK_THROWS_AS(parse({ "--bogus" }), std::invalid_argument);
        CHECK_THROWS_AS(parse({ "--ssid" }), std::invalid_argument);
        CHECK_THROWS_AS(parse({ "-s", "" }), std::invalid_argument);
        CHECK_THROWS_AS(parse({ "-s", std::string(33, 'a') }), std::invalid_argument);
        CHECK_THROWS_AS(parse({ "-p", "short" }), std::invalid_argument);
        CHECK_THROWS_AS(parse({ "-g", "192.168.42" }), std::invalid_argument);
        CHECK_THROWS_AS(parse({ "-l", "127.0.0.1" }), std::invalid_argument);
        CHECK_THROWS_AS(parse({ "-l", "127.0.0.1:70000" }), std::invalid_argument);
        CHECK_THROWS_AS(parse({ "-t", "0" }), std::invalid_argument);
        CHECK_THROWS_AS(parse({ "-t", "5s" }), std::invalid_argument);
    }
}

// =============================================================================
// JSON and HTTP
// =============================================================================

TEST_CASE("JSON strings") {
    CHECK(jsonString("plain") == "\"plain\"");
    CHECK(jsonString("a\"b\\c") == "\"a\\\"b\\\\c\"");
    CHECK(jsonString("line\nbreak\t") == "\"line\\nbreak\\t\"");
    CHECK(jsonString(std::string("\x01", 1)) == "\"\\u0001\"");
    CHECK(jsonString("caf\xc3\xa9") == "\"caf\xc3\xa9\"");
    CHECK(jsonStringArray({}) == "[]");
    CHECK(jsonStringArray({ "a", "b" }) == "[\"a\",\"b\"]");

    std::vector<Station> stations = { { "A", 90 }, { "B", 80 } };
    CHECK(jsonArray(stations) == "[{\"ssid\":\"A\",\"quality\":90},{\"ssid\":\"B\",\"quality\":80}]");
}

TEST_CASE("HTTP request parsing") {
    SUBCASE("request line") {
        HttpServer::Request request = HttpServer::parseRequest("GET /scan?fresh=1 HTTP/1.1\r\nHost: x\r\n\r\n");
        CHECK(request.method == "GET");
        CHECK(request.path == "/scan");
    }
    SUBCASE("malformed") {
        CHECK_THROWS_AS(HttpServer::parseRequest("GET /scan"), std::invalid_argument);
        CHECK_THROWS_AS(HttpServer::parseRequest("GET\r\n\r\n"), std::invalid_argument);
        CHECK_THROWS_AS(HttpServer::parseRequest("GET /scan FTP/1.0\r\n\r\n"), std::invalid_argument);
        CHECK_THROWS_AS(HttpServer::parseRequest("GET scan HTTP/1.1\r\n\r\n"), std::invalid_argument);
    }
}

TEST_CASE("HTTP responses") {
    HttpServer::Response response;
    response.body = "[]";
    std::string raw = HttpServer::formatResponse(response);
    CHECK(raw.find("HTTP/1.1 200 OK\r\n") == 0);
    CHECK(raw.find("Content-Type: application/json\r\n") != std::string::npos);
    CHECK(raw.find("Content-Length: 2\r\n") != std::string::npos);
    CHECK(raw.find("Connection: close\r\n\r\n[]") != std::string::npos);
    CHECK(std::string(HttpServer::statusText(405)) == "Method Not Allowed");
}

TEST_CASE("HTTP dispatch") {
    HttpServer server("127.0.0.1", 0);
    server.route("/ping", [](const HttpServer::Request&) {
        HttpServer::Response response;
        response.body = "{\"pong\":true}";
        return response;
    });

    CHECK(server.dispatch({ "GET", "/ping" }).body == "{\"pong\":true}");
    CHECK(server.dispatch({ "GET", "/missing" }).status == 404);
    CHECK(server.dispatch({ "POST", "/ping" }).status == 405);
}
