#include "api.h"
#include "crypto_utils.h"
#include "result_extractor.h"
#include <iostream>

namespace scriptbox {

namespace {

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

HttpResponse json_response(int status_code, const Json::Value& body) {
    HttpResponse resp;
    resp.status_code = status_code;
    resp.body = write_json(body);
    return resp;
}

} // namespace

ScriptApi::ScriptApi(const ExecutionService& service, std::shared_ptr<RateLimiter> limiter)
    : service_(service), limiter_(std::move(limiter)) {}

void ScriptApi::register_routes(HttpServer& server) {
    server.route("POST", "/execute", [this](const HttpRequest& req) { return handle_execute(req); });
    server.route("GET", "/health", [this](const HttpRequest& req) { return handle_health(req); });
    server.route("GET", "/", [this](const HttpRequest& req) { return handle_root(req); });
}

HttpResponse ScriptApi::to_response(const ExecutionResult& result) {
    return json_response(result.http_status(), result.to_json());
}

HttpResponse ScriptApi::handle_execute(const HttpRequest& req) const {
    Json::Value body;
    if (!ResultExtractor::parse_json(req.body, body) || !body.isObject()) {
        return to_response(ExecutionResult::failure(ErrorKind::VALIDATION,
                                                    "Request body must be a JSON object"));
    }
    if (!body.isMember("script")) {
        return to_response(ExecutionResult::failure(ErrorKind::VALIDATION,
                                                    "Missing 'script' field in request"));
    }
    if (!body["script"].isString()) {
        return to_response(ExecutionResult::failure(ErrorKind::VALIDATION,
                                                    "'script' field must be a string"));
    }
    std::string script = body["script"].asString();

    if (!limiter_) {
        return to_response(service_.execute(script));
    }

    std::string job_id = CryptoUtils::random_hex(8);
    if (!limiter_->register_job_start(req.client_ip, job_id)) {
        auto quota = limiter_->check_quota(req.client_ip);
        std::cout << "[RateLimit] " << req.client_ip << " refused: " << quota.reason << std::endl;

        ExecutionResult refused = ExecutionResult::failure(ErrorKind::VALIDATION,
            "Rate limit exceeded: " + quota.reason);
        HttpResponse resp = to_response(refused);
        resp.status_code = 429;
        resp.headers["Retry-After"] = "60";
        return resp;
    }

    ExecutionResult result = service_.execute(script);
    limiter_->register_job_end(req.client_ip, job_id, result.cpu_seconds);
    return to_response(result);
}

HttpResponse ScriptApi::handle_health(const HttpRequest&) const {
    Json::Value body(Json::objectValue);
    body["status"] = "healthy";
    return json_response(200, body);
}

HttpResponse ScriptApi::handle_root(const HttpRequest&) const {
    const ServiceConfig& config = service_.config();

    Json::Value body(Json::objectValue);
    body["service"] = "scriptbox";
    body["description"] = "Runs a submitted Python script's main() and returns its JSON result";

    Json::Value endpoints(Json::objectValue);
    endpoints["POST /execute"] = "Execute a script: {\"script\": \"def main(): ...\"}";
    endpoints["GET /health"] = "Health check";
    endpoints["GET /"] = "This document";
    body["endpoints"] = endpoints;

    Json::Value isolation(Json::objectValue);
    isolation["requested"] = config.use_sandbox;
    isolation["sandbox_available"] = service_.sandbox_available();
    isolation["timeout_seconds"] = static_cast<Json::Int64>(config.supervisor.timeout.count());
    isolation["rate_limited"] = static_cast<bool>(limiter_);
    body["isolation"] = isolation;

    Json::Value example(Json::objectValue);
    example["script"] = "def main():\n    return {\"message\": \"Hello, World!\"}";
    body["example_request"] = example;

    return json_response(200, body);
}

} // namespace scriptbox
