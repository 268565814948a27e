#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

// Minimal HTTP/1.1 server: one request per connection, handled in order on
// the calling thread.
class HttpServer {
public:
    struct Request {
        std::string method;
        std::string path;
    };

    struct Response {
        int status = 200;
        std::string contentType = "application/json";
        std::string body;
    };

    using Handler = std::function<Response(const Request&)>;

    HttpServer(const std::string& address, uint16_t port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void route(const std::string& path, Handler handler);

    // Accepts connections until running turns false.
    void run(const std::atomic<bool>& running);

    Response dispatch(const Request& request) const;

    // Parses the request line of a request head; throws std::invalid_argument.
    static Request parseRequest(const std::string& head);
    static std::string formatResponse(const Response& response);
    static const char* statusText(int status);

private:
    void handleConnection(int client);

    int fd_ = -1;
    std::map<std::string, Handler> routes_;
};
