#pragma once

#include <cstddef>  // for size_t

namespace scriptbox {

// Submission limits
constexpr size_t MAX_SCRIPT_SIZE = 1024 * 1024;                   // 1MB of source
constexpr size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;              // 10MB stdout+stderr
constexpr size_t MAX_REQUEST_SIZE = 4 * 1024 * 1024;              // 4MB max request

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 30;                       // Wall clock per execution
constexpr int SANDBOX_GRACE_SECONDS = 5;                          // Isolation tool startup overhead
constexpr int POLL_INTERVAL_MS = 50;                              // Supervisor wake-up interval

// Direct-mode resource limits
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 512 * 1024 * 1024;  // 512MB address space
constexpr size_t MAX_FILE_SIZE_BYTES = 16 * 1024 * 1024;          // 16MB per written file
constexpr int MAX_PROCESSES_PER_JOB = 32;                         // Max threads/processes
constexpr int MAX_OPEN_FILES = 256;                               // Max file descriptors

// Rate limiting
constexpr int MAX_CONCURRENT_JOBS_PER_IP = 2;                     // Per IP limit
constexpr int MAX_JOBS_PER_HOUR = 120;                            // Hourly execution limit
constexpr double CPU_SECONDS_PER_MINUTE = 60.0;                   // CPU quota per minute
constexpr int RATE_LIMIT_CLEANUP_MINUTES = 60;                    // Cleanup inactive IPs

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                      // Initial HTTP buffer

// Network
constexpr int DEFAULT_PORT = 8080;                                // Default server port
constexpr int LISTEN_BACKLOG = 64;                                // Socket listen backlog

// Deployment paths
constexpr const char* DEFAULT_INTERPRETER = "python3";
constexpr const char* DEFAULT_SANDBOX_INTERPRETER = "/usr/bin/python3";
constexpr const char* DEFAULT_SANDBOX_BINARY = "/usr/local/bin/nsjail";
constexpr const char* DEFAULT_SANDBOX_CONFIG = "/app/nsjail.cfg";
constexpr const char* DEFAULT_SCRIPT_DIR = "/tmp/scriptbox";
constexpr const char* DEFAULT_WORKING_DIR = "/tmp";

// Marker protocol
constexpr const char* RESULT_START_MARKER = "__RESULT_START__";
constexpr const char* RESULT_END_MARKER = "__RESULT_END__";
constexpr const char* ERROR_START_MARKER = "__ERROR_START__";
constexpr const char* ERROR_END_MARKER = "__ERROR_END__";

} // namespace scriptbox
