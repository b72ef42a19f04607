#include "execution_result.h"

namespace scriptbox {

ExecutionResult ExecutionResult::success(const Json::Value& value, const std::string& stdout_text) {
    ExecutionResult r;
    r.result = value;
    r.stdout_text = stdout_text;
    return r;
}

ExecutionResult ExecutionResult::failure(ErrorKind kind, const std::string& message) {
    ExecutionResult r;
    r.error_kind = kind == ErrorKind::NONE ? ErrorKind::INTERNAL : kind;
    r.error = message;
    return r;
}

Json::Value ExecutionResult::to_json() const {
    Json::Value body(Json::objectValue);
    body["result"] = ok() ? result : Json::Value(Json::nullValue);
    body["stdout"] = stdout_text;
    body["error"] = ok() ? Json::Value(Json::nullValue) : Json::Value(error);
    return body;
}

int ExecutionResult::http_status() const {
    switch (error_kind) {
        case ErrorKind::NONE:
            return 200;
        case ErrorKind::SPAWN:
        case ErrorKind::INTERNAL:
            return 500;
        default:
            return 400;
    }
}

std::string ExecutionResult::kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::SPAWN: return "spawn";
        case ErrorKind::SERIALIZATION: return "serialization";
        case ErrorKind::SCRIPT: return "script";
        case ErrorKind::EXTRACTION: return "extraction";
        case ErrorKind::OUTPUT_LIMIT: return "output_limit";
        case ErrorKind::INTERNAL: return "internal";
    }
    return "unknown";
}

} // namespace scriptbox
