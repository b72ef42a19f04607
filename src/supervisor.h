#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include "constants.h"

namespace scriptbox {

// Supervisor configuration; passed in at construction, never read globally
struct SupervisorConfig {
    std::string interpreter = DEFAULT_INTERPRETER;          // Direct mode, PATH lookup
    std::string working_directory = DEFAULT_WORKING_DIR;    // cwd of the child
    std::chrono::seconds timeout = std::chrono::seconds(DEFAULT_TIMEOUT_SECONDS);
    size_t max_output_bytes = MAX_OUTPUT_SIZE;              // stdout + stderr

    // Isolation tool: <sandbox_binary> --config <sandbox_config> -- <interp> <path>
    bool fallback_to_direct = true;                         // Binary missing -> run direct
    std::string sandbox_binary = DEFAULT_SANDBOX_BINARY;
    std::string sandbox_config = DEFAULT_SANDBOX_CONFIG;
    std::string sandbox_interpreter = DEFAULT_SANDBOX_INTERPRETER;
    std::string sandbox_script_dir;                         // Harness dir as seen in the jail
    std::chrono::seconds sandbox_grace = std::chrono::seconds(SANDBOX_GRACE_SECONDS);

    // Direct-mode hardening
    size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES; // 0 = unlimited
    int max_processes = MAX_PROCESSES_PER_JOB;
    int max_open_files = MAX_OPEN_FILES;
    size_t max_file_size_bytes = MAX_FILE_SIZE_BYTES;
    bool syscall_filter = true;
    bool allow_network = false;                             // Airgapped by default
};

enum class RunStatus {
    COMPLETED,              // Child exited (any exit code)
    TIMED_OUT,              // Deadline hit, process group killed
    SPAWN_FAILED,           // Could not start the command at all
    OUTPUT_LIMIT_EXCEEDED   // Captured output over max_output_bytes, group killed
};

// Raw capture of one supervised process
struct ExecutionOutcome {
    RunStatus status = RunStatus::COMPLETED;
    int exit_code = -1;                  // Negative signal number if killed
    std::string stdout_output;
    std::string stderr_output;
    std::string error_message;           // Detail for SPAWN_FAILED
    bool isolated = false;
    std::chrono::seconds deadline{0};
    std::chrono::milliseconds wall_time{0};
    double cpu_seconds = 0;
    size_t memory_bytes = 0;             // Peak RSS of the direct child
};

// Resolved command for one run
struct LaunchPlan {
    std::vector<std::string> argv;       // argv[0] is an absolute path
    bool isolated = false;
    std::chrono::seconds deadline{0};
    std::string error;                   // Non-empty if nothing can be launched

    bool ok() const { return error.empty(); }
};

// Spawns the harness, enforces the deadline and collects its output.
// One process group per call; nothing it started survives the call.
class ExecutionSupervisor {
public:
    // Throws std::runtime_error if the syscall filter cannot be built
    explicit ExecutionSupervisor(const SupervisorConfig& config = SupervisorConfig{});
    ~ExecutionSupervisor();

    ExecutionSupervisor(const ExecutionSupervisor&) = delete;
    ExecutionSupervisor& operator=(const ExecutionSupervisor&) = delete;

    ExecutionOutcome run(const std::string& harness_path, bool isolate) const;

    LaunchPlan plan(const std::string& harness_path, bool isolate) const;
    bool sandbox_available() const;
    const SupervisorConfig& config() const { return config_; }

    static std::string status_to_string(RunStatus status);

    // Absolute path for name (searched in PATH if it has no slash), or ""
    static std::string resolve_executable(const std::string& name);

private:
    class Impl;
    SupervisorConfig config_;
    std::unique_ptr<Impl> impl_;
};

} // namespace scriptbox
