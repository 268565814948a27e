#pragma once
#include "http_server.hpp"
#include "network_manager.hpp"
#include "options.hpp"
#include "wifi_scanner.hpp"
#include <atomic>
#include <exception>
#include <string>
#include <vector>

// Messages of an error from the outermost context down to the cause.
std::vector<std::string> errorChain(const std::exception& e);

// 500 response with an {"errors": [...]} body.
HttpServer::Response errorResponse(const std::exception& e);

void registerRoutes(HttpServer& server, NetworkManager& networkManager,
                    const NetworkManager::Device& device, WifiScanner& scanner,
                    const Options& opts, std::atomic<bool>& running);
