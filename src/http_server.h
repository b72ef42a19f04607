#pragma once

#include <string>
#include <functional>
#include <map>
#include <mutex>
#include <atomic>

namespace scriptbox {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup, "" if absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server: one detached thread per connection, one
// request per connection, Connection: close
class HttpServer {
public:
    explicit HttpServer(int port = 8080);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Register route handlers; paths match exactly
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Bind and listen. Returns the bound port (useful with port 0).
    // Throws std::runtime_error on failure.
    int listen();

    // Accept loop; returns after stop()
    void serve();

    // listen() + serve() (blocks)
    void start();

    // Stop server; safe from another thread
    void stop();

    int port() const { return port_; }

    // Dispatch a parsed request to its handler (404/405/500 otherwise)
    HttpResponse dispatch(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static HttpResponse error_response(int status_code, const std::string& message);

private:
    int port_;
    std::atomic<int> server_fd_;
    std::atomic<bool> running_;
    mutable std::mutex routes_mutex_;
    std::map<std::string, HandlerFunc> routes_;

    void handle_client(int client_fd, const std::string& client_ip);
};

} // namespace scriptbox
