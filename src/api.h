#pragma once

#include <memory>
#include <string>
#include "execution_service.h"
#include "http_server.h"
#include "rate_limiter.h"

namespace scriptbox {

// HTTP surface of the service: POST /execute, GET /health, GET /
class ScriptApi {
public:
    // limiter may be null (rate limiting disabled)
    ScriptApi(const ExecutionService& service, std::shared_ptr<RateLimiter> limiter);

    void register_routes(HttpServer& server);

    HttpResponse handle_execute(const HttpRequest& req) const;
    HttpResponse handle_health(const HttpRequest& req) const;
    HttpResponse handle_root(const HttpRequest& req) const;

    // Response with the {result, stdout, error} body and its status
    static HttpResponse to_response(const ExecutionResult& result);

private:
    const ExecutionService& service_;
    std::shared_ptr<RateLimiter> limiter_;
};

} // namespace scriptbox
