#pragma once

#include <string>
#include <chrono>
#include <json/json.h>

namespace scriptbox {

enum class ErrorKind {
    NONE,
    VALIDATION,     // Rejected before anything was spawned
    TIMEOUT,        // Deadline hit
    SPAWN,          // Could not start the interpreter or isolation tool
    SERIALIZATION,  // main() returned something JSON cannot hold
    SCRIPT,         // The script raised or wrote to stderr
    EXTRACTION,     // No usable payload in the output
    OUTPUT_LIMIT,   // Too much output
    INTERNAL        // Service fault; detail stays in the logs
};

// Caller-facing outcome of one submission. Exactly one of
// result (success) or error (failure) is meaningful.
struct ExecutionResult {
    Json::Value result;          // null on failure
    std::string stdout_text;     // What the script printed inside main()
    std::string error;           // Empty on success
    ErrorKind error_kind = ErrorKind::NONE;

    // Run metadata; logged and charged to the caller's quota, not returned
    double cpu_seconds = 0;
    size_t memory_bytes = 0;
    std::chrono::milliseconds wall_time{0};

    bool ok() const { return error_kind == ErrorKind::NONE; }

    static ExecutionResult success(const Json::Value& value, const std::string& stdout_text);
    static ExecutionResult failure(ErrorKind kind, const std::string& message);

    // {"result": ..., "stdout": ..., "error": ...}
    Json::Value to_json() const;

    // 200 / 400 / 429 / 500
    int http_status() const;

    static std::string kind_to_string(ErrorKind kind);
};

} // namespace scriptbox
