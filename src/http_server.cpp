#include "http_server.hpp"
#include "json_format.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

static constexpr size_t MAX_REQUEST_HEAD = 8192;
static constexpr int ACCEPT_POLL_MS = 500;

HttpServer::HttpServer(const std::string& address, uint16_t port) {
    fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        throw std::runtime_error(std::string("Failed to create HTTP socket: ") + std::strerror(errno));
    }

    int reuse = 1;
    if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        std::cerr << "Failed to set SO_REUSEADDR: " << std::strerror(errno) << std::endl;
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        close(fd_);
        throw std::runtime_error("Invalid HTTP listen address: " + address);
    }

    if (bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 || listen(fd_, 16) < 0) {
        std::string reason = std::strerror(errno);
        close(fd_);
        throw std::runtime_error("Failed to listen on " + address + ":" + std::to_string(port) + ": " + reason);
    }

    std::cerr << "Web server listening on " << address << ":" << port << std::endl;
}

HttpServer::~HttpServer() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

void HttpServer::route(const std::string& path, Handler handler) {
    routes_[path] = std::move(handler);
}

void HttpServer::run(const std::atomic<bool>& running) {
    while (running) {
        struct pollfd pfd = { fd_, POLLIN, 0 };
        int ready = poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("Failed to poll HTTP socket: ") + std::strerror(errno));
        }
        if (ready == 0) continue;

        int client = accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            throw std::runtime_error(std::string("Failed to accept HTTP connection: ") + std::strerror(errno));
        }

        handleConnection(client);
        close(client);
    }
}

void HttpServer::handleConnection(int client) {
    struct timeval timeout = { 5, 0 };
    if (setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
        std::cerr << "Failed to set HTTP read timeout: " << std::strerror(errno) << std::endl;
        return;
    }

    std::string head;
    char buffer[1024];
    while (head.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = recv(client, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            return;
        }
        head.append(buffer, static_cast<size_t>(n));
        if (head.size() > MAX_REQUEST_HEAD) {
            break;
        }
    }

    Response response;
    try {
        Request request = parseRequest(head);
        std::cerr << request.method << " " << request.path << std::endl;
        response = dispatch(request);
    } catch (const std::invalid_argument& e) {
        response.status = 400;
        response.body = "{\"errors\":" + jsonStringArray({ e.what() }) + "}";
    } catch (const std::exception& e) {
        std::cerr << "Request failed: " << e.what() << std::endl;
        response.status = 500;
        response.body = "{\"errors\":" + jsonStringArray({ e.what() }) + "}";
    }

    std::string raw = formatResponse(response);
    size_t sent = 0;
    while (sent < raw.size()) {
        ssize_t n = ::send(client, raw.data() + sent, raw.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "Failed to write HTTP response: " << std::strerror(errno) << std::endl;
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

HttpServer::Response HttpServer::dispatch(const Request& request) const {
    Response response;

    auto it = routes_.find(request.path);
    if (it == routes_.end()) {
        response.status = 404;
        response.body = "{\"errors\":" + jsonStringArray({ "Not found: " + request.path }) + "}";
        return response;
    }

    if (request.method != "GET") {
        response.status = 405;
        response.body = "{\"errors\":" + jsonStringArray({ "Method not allowed: " + request.method }) + "}";
        return response;
    }

    return it->second(request);
}

HttpServer::Request HttpServer::parseRequest(const std::string& head) {
    size_t lineEnd = head.find("\r\n");
    if (lineEnd == std::string::npos) {
        throw std::invalid_argument("Incomplete request line");
    }

    std::istringstream line(head.substr(0, lineEnd));
    std::string target;
    std::string version;
    Request request;
    if (!(line >> request.method >> target >> version) || version.compare(0, 5, "HTTP/") != 0) {
        throw std::invalid_argument("Malformed request line");
    }
    if (target.empty() || target[0] != '/') {
        throw std::invalid_argument("Unsupported request target: " + target);
    }

    request.path = target.substr(0, target.find('?'));
    return request;
}

const char* HttpServer::statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

std::string HttpServer::formatResponse(const Response& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << statusText(response.status) << "\r\n";
    out << "Content-Type: " << response.contentType << "\r\n";
    out << "Content-Length: " << response.body.size() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";
    out << response.body;
    return out.str();
}
