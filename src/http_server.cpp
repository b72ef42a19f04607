#include "http_server.h"
#include "constants.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <json/json.h>

namespace scriptbox {

namespace {

constexpr int CLIENT_READ_TIMEOUT_SECONDS = 30;

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r");
    return value.substr(start, end - start + 1);
}

bool send_all(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

// Content-Length from a raw header block; -1 if absent or malformed
long long content_length(const std::string& head) {
    std::istringstream stream(head);
    std::string line;
    while (std::getline(stream, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (to_lower(trim(line.substr(0, colon))) != "content-length") continue;
        std::string value = trim(line.substr(colon + 1));
        if (value.empty() || !std::all_of(value.begin(), value.end(),
                                          [](unsigned char c) { return std::isdigit(c); })) {
            return -1;
        }
        try {
            return std::stoll(value);
        } catch (const std::exception&) {
            return -1;
        }
    }
    return 0;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) {
            return value;
        }
    }
    return "";
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    std::lock_guard<std::mutex> lock(routes_mutex_);
    routes_[method + " " + path] = std::move(handler);
}

int HttpServer::listen() {
    // Close-on-exec so connections never leak into supervised children
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("Failed to create socket: ") + std::strerror(errno));
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[Server] SO_REUSEADDR failed: " << std::strerror(errno) << std::endl;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string reason = std::strerror(errno);
        close(fd);
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_) + ": " + reason);
    }

    if (::listen(fd, LISTEN_BACKLOG) < 0) {
        std::string reason = std::strerror(errno);
        close(fd);
        throw std::runtime_error("Failed to listen: " + reason);
    }

    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    server_fd_ = fd;
    running_ = true;
    std::cout << "[Server] Listening on port " << port_ << std::endl;
    return port_;
}

void HttpServer::serve() {
    while (running_) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_, reinterpret_cast<sockaddr*>(&client_addr),
                                &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (!running_) break;
            if (errno == EINTR || errno == ECONNABORTED || errno == EMFILE || errno == ENFILE) {
                continue;
            }
            std::cerr << "[Server] accept failed: " << std::strerror(errno) << std::endl;
            break;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        timeval tv{};
        tv.tv_sec = CLIENT_READ_TIMEOUT_SECONDS;
        if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
            std::cerr << "[Server] SO_RCVTIMEO failed: " << std::strerror(errno) << std::endl;
        }

        // Handle in new thread (simple concurrency)
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
        }).detach();
    }
}

void HttpServer::start() {
    listen();
    serve();
}

void HttpServer::stop() {
    running_ = false;
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        // Wakes a thread blocked in accept
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    size_t expected_size = 0;
    bool headers_done = false;

    auto reject = [client_fd](int status, const std::string& message) {
        if (!send_all(client_fd, build_response(error_response(status, message)))) {
            std::cerr << "[Server] Failed to send " << status << " response" << std::endl;
        }
    };

    while (!headers_done || request_data.size() < expected_size) {
        ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer));
        if (bytes_read < 0 && errno == EINTR) continue;
        if (bytes_read <= 0) break;

        request_data.append(buffer, static_cast<size_t>(bytes_read));
        if (request_data.size() > MAX_REQUEST_SIZE) {
            reject(413, "Request exceeds " + std::to_string(MAX_REQUEST_SIZE) + " bytes");
            return;
        }

        if (!headers_done) {
            size_t header_end = request_data.find("\r\n\r\n");
            if (header_end == std::string::npos) continue;
            headers_done = true;

            long long length = content_length(request_data.substr(0, header_end));
            if (length < 0) {
                reject(400, "Invalid Content-Length");
                return;
            }
            expected_size = header_end + 4 + static_cast<size_t>(length);
            if (expected_size > MAX_REQUEST_SIZE) {
                reject(413, "Request exceeds " + std::to_string(MAX_REQUEST_SIZE) + " bytes");
                return;
            }
        }
    }

    if (request_data.empty()) return;
    if (!headers_done || request_data.size() < expected_size) {
        reject(400, "Incomplete request");
        return;
    }

    HttpRequest req = parse_request(request_data.substr(0, expected_size));
    req.client_ip = client_ip;

    HttpResponse resp = dispatch(req);
    if (!send_all(client_fd, build_response(resp))) {
        std::cerr << "[Server] Failed to send response to " << client_ip << std::endl;
    }
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    HandlerFunc handler;
    bool path_known = false;
    {
        std::lock_guard<std::mutex> lock(routes_mutex_);
        auto it = routes_.find(req.method + " " + req.path);
        if (it != routes_.end()) {
            handler = it->second;
        } else {
            for (const auto& entry : routes_) {
                const std::string& pattern = entry.first;
                if (pattern.substr(pattern.find(' ') + 1) == req.path) {
                    path_known = true;
                    break;
                }
            }
        }
    }

    if (!handler) {
        if (req.method == "OPTIONS") {
            HttpResponse preflight;
            preflight.status_code = 204;
            preflight.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
            preflight.headers["Access-Control-Allow-Headers"] = "Content-Type";
            return preflight;
        }
        return path_known ? error_response(405, "Method not allowed")
                          : error_response(404, "Not found");
    }

    try {
        return handler(req);
    } catch (const std::exception& e) {
        std::cerr << "[Server] Handler for " << req.method << " " << req.path
                  << " failed: " << e.what() << std::endl;
        return error_response(500, "Internal server error");
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        req.path = line.substr(space1 + 1, space2 - space1 - 1);
    }

    // Query strings are not routed
    size_t query = req.path.find('?');
    if (query != std::string::npos) {
        req.path.erase(query);
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            req.headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
        }
    }

    return req;
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " ";
    switch (resp.status_code) {
        case 200: out << "OK"; break;
        case 204: out << "No Content"; break;
        case 400: out << "Bad Request"; break;
        case 404: out << "Not Found"; break;
        case 405: out << "Method Not Allowed"; break;
        case 413: out << "Payload Too Large"; break;
        case 415: out << "Unsupported Media Type"; break;
        case 429: out << "Too Many Requests"; break;
        case 500: out << "Internal Server Error"; break;
        case 503: out << "Service Unavailable"; break;
        default: out << "Unknown"; break;
    }
    out << "\r\n";

    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    out << resp.body;

    return out.str();
}

HttpResponse HttpServer::error_response(int status_code, const std::string& message) {
    Json::Value body(Json::objectValue);
    body["error"] = message;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";

    HttpResponse resp;
    resp.status_code = status_code;
    resp.body = Json::writeString(writer, body);
    return resp;
}

} // namespace scriptbox
