/**
 * HTTP Server Integration Tests
 *
 * Drives the real server over loopback sockets with the production
 * routes registered, plus a couple of test-only routes.
 */

#include <gtest/gtest.h>
#include "../../src/api.h"
#include "../../src/result_extractor.h"
#include <thread>
#include <chrono>
#include <filesystem>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cstring>

namespace fs = std::filesystem;
using namespace scriptbox;

// ============================================================================
// Test Fixture
// ============================================================================

class HttpIntegrationTest : public ::testing::Test {
protected:
    fs::path script_dir;
    std::unique_ptr<ExecutionService> service;
    std::unique_ptr<ScriptApi> api;
    std::unique_ptr<HttpServer> server;
    std::thread server_thread;
    int test_port = 0;

    void SetUp() override {
        script_dir = fs::temp_directory_path() / ("scriptbox_http_test_" + std::to_string(getpid()));
        fs::remove_all(script_dir);

        ServiceConfig config;
        config.use_sandbox = false;
        config.script_dir = script_dir.string();
        config.supervisor.timeout = std::chrono::seconds(10);
        service = std::make_unique<ExecutionService>(config);
        api = std::make_unique<ScriptApi>(*service, nullptr);

        // Port 0: the kernel picks a free one
        server = std::make_unique<HttpServer>(0);
        api->register_routes(*server);

        server->route("GET", "/error", [](const HttpRequest&) -> HttpResponse {
            throw std::runtime_error("Test exception");
        });

        server->route("POST", "/echo-body", [](const HttpRequest& req) {
            HttpResponse resp;
            resp.body = req.body;
            return resp;
        });

        test_port = server->listen();
        server_thread = std::thread([this]() {
            server->serve();
        });
    }

    void TearDown() override {
        if (server) {
            server->stop();
        }
        if (server_thread.joinable()) {
            server_thread.join();
        }
        fs::remove_all(script_dir);
    }

    // Helper: Connect to server
    int connect_to_server() {
        int sock = socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) return -1;

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(test_port));
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

        timeval tv{};
        tv.tv_sec = 15;
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(sock);
            return -1;
        }
        return sock;
    }

    // Helper: Send raw request, read until the server closes
    std::string send_request(const std::string& request) {
        int sock = connect_to_server();
        if (sock < 0) {
            return "CONNECTION_FAILED";
        }

        size_t offset = 0;
        while (offset < request.size()) {
            ssize_t sent = send(sock, request.data() + offset, request.size() - offset, MSG_NOSIGNAL);
            if (sent <= 0) {
                close(sock);
                return "SEND_FAILED";
            }
            offset += static_cast<size_t>(sent);
        }

        // Every response is Connection: close
        std::string response;
        char buffer[4096];
        ssize_t n;
        while ((n = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
            response.append(buffer, static_cast<size_t>(n));
        }

        close(sock);
        return response;
    }

    std::string post(const std::string& path, const std::string& body) {
        return send_request(
            "POST " + path + " HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: " + std::to_string(body.size()) + "\r\n"
            "\r\n" + body);
    }

    std::string get(const std::string& path) {
        return send_request(
            "GET " + path + " HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "\r\n");
    }

    static Json::Value body_of(const std::string& response) {
        Json::Value body;
        size_t header_end = response.find("\r\n\r\n");
        if (header_end != std::string::npos) {
            ResultExtractor::parse_json(response.substr(header_end + 4), body);
        }
        return body;
    }

    static bool has_python() {
        return !ExecutionSupervisor::resolve_executable("python3").empty();
    }
};

// ============================================================================
// Service Endpoints
// ============================================================================

TEST_F(HttpIntegrationTest, HealthCheck) {
    std::string response = get("/health");

    EXPECT_NE(response.find("HTTP/1.1 200 OK"), std::string::npos) << response;
    EXPECT_NE(response.find("{\"status\":\"healthy\"}"), std::string::npos);
    EXPECT_NE(response.find("Connection: close"), std::string::npos);
}

TEST_F(HttpIntegrationTest, RootDescribesService) {
    std::string response = get("/");

    EXPECT_NE(response.find("HTTP/1.1 200 OK"), std::string::npos) << response;
    EXPECT_TRUE(body_of(response)["endpoints"].isMember("POST /execute"));
}

TEST_F(HttpIntegrationTest, ExecuteReturnsResult) {
    if (!has_python()) {
        GTEST_SKIP() << "python3 not available";
    }

    // Given: A script printing and returning
    Json::Value request;
    request["script"] = "def main():\n    print('hi')\n    return {'sum': 2 + 3}\n";
    Json::StreamWriterBuilder writer;

    // When: Posted to /execute
    std::string response = post("/execute", Json::writeString(writer, request));

    // Then: 200 with the three-field body
    EXPECT_NE(response.find("HTTP/1.1 200 OK"), std::string::npos) << response;
    Json::Value body = body_of(response);
    EXPECT_EQ(body["result"]["sum"].asInt(), 5);
    EXPECT_EQ(body["stdout"].asString(), "hi\n");
    EXPECT_TRUE(body["error"].isNull());
}

TEST_F(HttpIntegrationTest, ExecuteScriptErrorIs400) {
    if (!has_python()) {
        GTEST_SKIP() << "python3 not available";
    }

    std::string response = post("/execute",
        "{\"script\": \"def main():\\n    raise KeyError('k')\"}");

    EXPECT_NE(response.find("HTTP/1.1 400"), std::string::npos) << response;
    EXPECT_EQ(body_of(response)["error"].asString(), "KeyError: 'k'");
}

TEST_F(HttpIntegrationTest, ExecuteRejectsMalformedJson) {
    std::string response = post("/execute", "{\"script\": ");

    EXPECT_NE(response.find("HTTP/1.1 400"), std::string::npos) << response;
    EXPECT_EQ(body_of(response)["error"].asString(), "Request body must be a JSON object");
}

TEST_F(HttpIntegrationTest, ExecuteRejectsScriptWithoutMain) {
    std::string response = post("/execute", "{\"script\": \"print(1)\"}");

    EXPECT_NE(response.find("HTTP/1.1 400"), std::string::npos) << response;
    EXPECT_EQ(body_of(response)["error"].asString(), "Script must contain a 'main()' function");
    EXPECT_FALSE(fs::exists(script_dir));
}

// ============================================================================
// Routing
// ============================================================================

TEST_F(HttpIntegrationTest, UnknownPathIs404) {
    std::string response = get("/nonexistent");

    EXPECT_NE(response.find("HTTP/1.1 404"), std::string::npos) << response;
}

TEST_F(HttpIntegrationTest, PathsMatchExactly) {
    std::string response = get("/health/extra");

    EXPECT_NE(response.find("HTTP/1.1 404"), std::string::npos) << response;
}

TEST_F(HttpIntegrationTest, WrongMethodIs405) {
    std::string response = get("/execute");

    EXPECT_NE(response.find("HTTP/1.1 405"), std::string::npos) << response;
}

TEST_F(HttpIntegrationTest, PreflightAnswered) {
    std::string response = send_request(
        "OPTIONS /execute HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Origin: http://example.com\r\n"
        "\r\n");

    EXPECT_NE(response.find("HTTP/1.1 204"), std::string::npos) << response;
    EXPECT_NE(response.find("Access-Control-Allow-Methods"), std::string::npos);
}

TEST_F(HttpIntegrationTest, QueryStringIgnoredForRouting) {
    std::string response = get("/health?verbose=1");

    EXPECT_NE(response.find("HTTP/1.1 200 OK"), std::string::npos) << response;
}

TEST_F(HttpIntegrationTest, ResponseIncludesCorsHeader) {
    std::string response = get("/health");

    EXPECT_NE(response.find("Access-Control-Allow-Origin: *"), std::string::npos) << response;
    EXPECT_NE(response.find("Content-Type: application/json"), std::string::npos);
}

// ============================================================================
// Error Handling
// ============================================================================

TEST_F(HttpIntegrationTest, HandlerExceptionReturns500) {
    std::string response = get("/error");

    EXPECT_NE(response.find("HTTP/1.1 500"), std::string::npos) << response;
    // The exception text stays in the logs
    EXPECT_EQ(response.find("Test exception"), std::string::npos);
}

TEST_F(HttpIntegrationTest, OversizedContentLengthIs413) {
    std::string response = send_request(
        "POST /execute HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: " + std::to_string(MAX_REQUEST_SIZE + 1) + "\r\n"
        "\r\n");

    EXPECT_NE(response.find("HTTP/1.1 413"), std::string::npos) << response;
}

TEST_F(HttpIntegrationTest, InvalidContentLengthIs400) {
    std::string response = send_request(
        "POST /execute HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: lots\r\n"
        "\r\n");

    EXPECT_NE(response.find("HTTP/1.1 400"), std::string::npos) << response;
}

TEST_F(HttpIntegrationTest, BodyArrivingInPiecesIsReassembled) {
    // Given: A body larger than one read
    std::string body(20000, 'a');

    // When: Echoed back
    std::string response = post("/echo-body", body);

    // Then: Nothing is lost
    size_t header_end = response.find("\r\n\r\n");
    ASSERT_NE(header_end, std::string::npos) << response;
    EXPECT_EQ(response.substr(header_end + 4), body);
}

// ============================================================================
// Connection Handling
// ============================================================================

TEST_F(HttpIntegrationTest, ConcurrentRequests) {
    std::vector<std::thread> threads;
    std::vector<int> ok(8, 0);

    for (int i = 0; i < 8; i++) {
        threads.emplace_back([this, i, &ok]() {
            std::string response = get("/health");
            ok[i] = response.find("HTTP/1.1 200 OK") != std::string::npos ? 1 : 0;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < 8; i++) {
        EXPECT_EQ(ok[i], 1) << "Request " << i << " failed";
    }
}

TEST_F(HttpIntegrationTest, ClientClosingEarlyDoesNotKillServer) {
    // Given: A client that disconnects mid-headers
    int sock = connect_to_server();
    ASSERT_GE(sock, 0);
    std::string partial = "GET /health HTTP/1.1\r\nHost: loc";
    send(sock, partial.data(), partial.size(), MSG_NOSIGNAL);
    close(sock);

    // Then: The server keeps answering
    std::string response = get("/health");
    EXPECT_NE(response.find("HTTP/1.1 200 OK"), std::string::npos) << response;
}

TEST_F(HttpIntegrationTest, StopUnblocksServe) {
    server->stop();
    server_thread.join();

    EXPECT_EQ(get("/health"), "CONNECTION_FAILED");
}
