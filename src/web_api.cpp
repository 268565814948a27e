#include "web_api.hpp"
#include "json_format.hpp"
#include "scan_error.hpp"
#include <iostream>

static const char* USAGE =
    "WiFi Connect\n"
    "\n"
    "GET /check-connectivity   NetworkManager connectivity state\n"
    "GET /list-connections     saved connection profiles\n"
    "GET /list-wifi-networks   access points seen by NetworkManager\n"
    "GET /scan                 nl80211 scan of the portal interface\n"
    "GET /stop                 tear down the portal and exit\n";

std::vector<std::string> errorChain(const std::exception& e) {
    if (auto scanError = dynamic_cast<const ScanError*>(&e)) {
        return scanError->chain();
    }
    if (auto nmError = dynamic_cast<const NetworkManagerError*>(&e)) {
        return nmError->chain();
    }
    return { e.what() };
}

HttpServer::Response errorResponse(const std::exception& e) {
    std::vector<std::string> chain = errorChain(e);
    for (const std::string& line : chain) {
        std::cerr << "  " << line << std::endl;
    }

    HttpServer::Response response;
    response.status = 500;
    response.body = "{\"errors\":" + jsonStringArray(chain) + "}";
    return response;
}

// Runs a handler body, turning any failure into an error response.
template <typename Body>
static HttpServer::Response respond(const char* what, Body body) {
    try {
        HttpServer::Response response;
        response.body = body();
        return response;
    } catch (const std::exception& e) {
        std::cerr << what << " failed" << std::endl;
        return errorResponse(e);
    }
}

void registerRoutes(HttpServer& server, NetworkManager& networkManager,
                    const NetworkManager::Device& device, WifiScanner& scanner,
                    const Options& opts, std::atomic<bool>& running) {
    server.route("/", [](const HttpServer::Request&) {
        HttpServer::Response response;
        response.contentType = "text/plain";
        response.body = USAGE;
        return response;
    });

    server.route("/check-connectivity", [&networkManager](const HttpServer::Request&) {
        return respond("Connectivity check", [&] {
            return "{\"connectivity\":" + jsonString(networkManager.checkConnectivity()) + "}";
        });
    });

    server.route("/list-connections", [&networkManager](const HttpServer::Request&) {
        return respond("Listing connections", [&] {
            return "{\"connections\":" + jsonArray(networkManager.listConnections()) + "}";
        });
    });

    server.route("/list-wifi-networks", [&networkManager, device, &opts](const HttpServer::Request&) {
        return respond("Listing WiFi networks", [&] {
            return "{\"networks\":" + jsonArray(networkManager.listWifiNetworks(device, opts.scanTimeout)) + "}";
        });
    });

    server.route("/scan", [&scanner, device](const HttpServer::Request&) {
        return respond("Scan", [&] {
            return jsonArray(scanner.scanNetwork(device.interface));
        });
    });

    server.route("/stop", [&networkManager, &running](const HttpServer::Request&) {
        return respond("Stopping portal", [&] {
            networkManager.stop();
            running = false;
            return std::string("{\"stopped\":true}");
        });
    });
}
