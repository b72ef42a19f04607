#include "supervisor.h"
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <seccomp.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace scriptbox {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {

// How long to keep reading after the child is gone (or killed) before
// abandoning pipes still held by something outside our process group
constexpr auto DRAIN_WINDOW = std::chrono::seconds(1);

// Reported by the child over the close-on-exec error pipe
enum ChildStage : int {
    STAGE_SETUP = 1,
    STAGE_CHDIR,
    STAGE_LIMITS,
    STAGE_FILTER,
    STAGE_EXEC
};

struct ChildError {
    int stage;
    int error;
};

const char* stage_name(int stage) {
    switch (stage) {
        case STAGE_SETUP: return "set up child process";
        case STAGE_CHDIR: return "enter working directory";
        case STAGE_LIMITS: return "apply resource limits";
        case STAGE_FILTER: return "install syscall filter";
        case STAGE_EXEC: return "execute";
        default: return "start";
    }
}

class UniqueFd {
public:
    explicit UniqueFd(int fd = -1) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

bool make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

// Everything the child needs, prepared before fork so the child only
// makes async-signal-safe calls (the server is multithreaded).
struct ChildSpec {
    std::vector<char*> argv;
    const char* working_directory = nullptr;
    pid_t parent_pid = 0;
    bool apply_limits = false;
    const sock_fprog* filter = nullptr;
    std::vector<std::pair<int, rlimit>> limits;
};

[[noreturn]] void fail_child(int error_fd, int stage) {
    ChildError report{stage, errno};
    // Nothing else to tell the parent if this write fails; it sees EOF + exit 127
    if (write(error_fd, &report, sizeof(report)) < 0) {
        _exit(127);
    }
    _exit(127);
}

[[noreturn]] void exec_child(const ChildSpec& spec, int stdin_fd, int stdout_fd,
                             int stderr_fd, int error_fd) {
    setpgid(0, 0);

    if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) {
        fail_child(error_fd, STAGE_SETUP);
    }
    if (getppid() != spec.parent_pid) {
        _exit(127);  // Supervisor already gone
    }

    if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0) {
        fail_child(error_fd, STAGE_SETUP);
    }

    // The server ignores SIGPIPE; the script should not inherit that
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    signal(SIGPIPE, SIG_DFL);

    if (chdir(spec.working_directory) != 0) {
        fail_child(error_fd, STAGE_CHDIR);
    }

    if (spec.apply_limits) {
        for (const auto& [resource, limit] : spec.limits) {
            if (setrlimit(resource, &limit) != 0) {
                fail_child(error_fd, STAGE_LIMITS);
            }
        }
    }

    if (spec.filter) {
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0 ||
            prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, spec.filter) != 0) {
            fail_child(error_fd, STAGE_FILTER);
        }
    }

    execve(spec.argv[0], spec.argv.data(), environ);
    fail_child(error_fd, STAGE_EXEC);
}

void kill_group(pid_t pgid) {
    if (killpg(pgid, SIGKILL) != 0 && errno != ESRCH) {
        std::cerr << "[Supervisor] killpg(" << pgid << ") failed: "
                  << std::strerror(errno) << std::endl;
    }
}

rlimit make_limit(rlim_t soft, rlim_t hard) {
    rlimit limit;
    limit.rlim_cur = soft;
    limit.rlim_max = hard;
    return limit;
}

struct CaptureStream {
    int fd;
    std::string* sink;
    bool open;
};

} // namespace

class ExecutionSupervisor::Impl {
public:
    std::vector<sock_filter> filter_program;
    sock_fprog filter{};
    bool has_filter = false;

    explicit Impl(const SupervisorConfig& config) {
        if (config.syscall_filter) {
            build_filter(config.allow_network);
        }
    }

    const sock_fprog* filter_for(bool isolated) const {
        // Inside the isolation tool the tool owns the policy
        return (has_filter && !isolated) ? &filter : nullptr;
    }

    ChildSpec make_spec(const LaunchPlan& launch, const SupervisorConfig& config) const {
        ChildSpec spec;
        for (const auto& arg : launch.argv) {
            spec.argv.push_back(const_cast<char*>(arg.c_str()));
        }
        spec.argv.push_back(nullptr);
        spec.working_directory = config.working_directory.c_str();
        spec.parent_pid = getpid();
        spec.filter = filter_for(launch.isolated);

        // The isolation tool applies its own limits and may need more than
        // the script itself
        spec.apply_limits = !launch.isolated;
        if (spec.apply_limits) {
            rlim_t cpu = static_cast<rlim_t>(config.timeout.count()) + 1;
            spec.limits.emplace_back(RLIMIT_CPU, make_limit(cpu, cpu + 1));
            spec.limits.emplace_back(RLIMIT_CORE, make_limit(0, 0));
            spec.limits.emplace_back(RLIMIT_FSIZE,
                make_limit(config.max_file_size_bytes, config.max_file_size_bytes));
            spec.limits.emplace_back(RLIMIT_NOFILE,
                make_limit(config.max_open_files, config.max_open_files));
            spec.limits.emplace_back(RLIMIT_NPROC,
                make_limit(config.max_processes, config.max_processes));
            if (config.memory_limit_bytes > 0) {
                spec.limits.emplace_back(RLIMIT_AS,
                    make_limit(config.memory_limit_bytes, config.memory_limit_bytes));
            }
        }
        return spec;
    }

private:
    void build_filter(bool allow_network) {
        scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
        if (!ctx) {
            throw std::runtime_error("Failed to initialize syscall filter");
        }

        auto fail = [&ctx](const std::string& what, int rc) {
            seccomp_release(ctx);
            throw std::runtime_error("Failed to build syscall filter (" + what + "): " +
                                     std::strerror(-rc));
        };

        int rc;
        if (!allow_network) {
            rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                                  SCMP_A0(SCMP_CMP_NE, AF_UNIX));
            if (rc < 0) fail("socket", rc);
        }

        // setsid/setpgid are denied so descendants cannot leave the process
        // group that the deadline kills
        struct DeniedSyscall { const char* name; int nr; };
        const DeniedSyscall denied[] = {
            {"ptrace", SCMP_SYS(ptrace)},
            {"process_vm_readv", SCMP_SYS(process_vm_readv)},
            {"process_vm_writev", SCMP_SYS(process_vm_writev)},
            {"setsid", SCMP_SYS(setsid)},
            {"setpgid", SCMP_SYS(setpgid)},
            {"mount", SCMP_SYS(mount)},
            {"umount2", SCMP_SYS(umount2)},
            {"pivot_root", SCMP_SYS(pivot_root)},
            {"chroot", SCMP_SYS(chroot)},
            {"unshare", SCMP_SYS(unshare)},
            {"setns", SCMP_SYS(setns)},
            {"init_module", SCMP_SYS(init_module)},
            {"finit_module", SCMP_SYS(finit_module)},
            {"delete_module", SCMP_SYS(delete_module)},
            {"kexec_load", SCMP_SYS(kexec_load)},
            {"reboot", SCMP_SYS(reboot)},
            {"swapon", SCMP_SYS(swapon)},
            {"swapoff", SCMP_SYS(swapoff)},
            {"bpf", SCMP_SYS(bpf)},
            {"perf_event_open", SCMP_SYS(perf_event_open)},
            {"keyctl", SCMP_SYS(keyctl)},
            {"add_key", SCMP_SYS(add_key)},
            {"request_key", SCMP_SYS(request_key)},
            {"acct", SCMP_SYS(acct)},
        };
        for (const auto& syscall : denied) {
            rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall.nr, 0);
            if (rc < 0) fail(syscall.name, rc);
        }

        // Export as raw BPF so the child can install it with prctl alone
        int fd = memfd_create("scriptbox-seccomp", MFD_CLOEXEC);
        if (fd < 0) fail("memfd_create", -errno);
        UniqueFd program_fd(fd);

        rc = seccomp_export_bpf(ctx, program_fd.get());
        seccomp_release(ctx);
        if (rc < 0) {
            throw std::runtime_error(std::string("Failed to export syscall filter: ") +
                                     std::strerror(-rc));
        }

        off_t size = lseek(program_fd.get(), 0, SEEK_END);
        if (size <= 0 || size % sizeof(sock_filter) != 0 ||
            lseek(program_fd.get(), 0, SEEK_SET) != 0) {
            throw std::runtime_error("Exported syscall filter has unexpected size");
        }

        filter_program.resize(static_cast<size_t>(size) / sizeof(sock_filter));
        char* out = reinterpret_cast<char*>(filter_program.data());
        size_t remaining = static_cast<size_t>(size);
        while (remaining > 0) {
            ssize_t n = read(program_fd.get(), out, remaining);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                throw std::runtime_error("Failed to read exported syscall filter");
            }
            out += n;
            remaining -= static_cast<size_t>(n);
        }

        filter.len = static_cast<unsigned short>(filter_program.size());
        filter.filter = filter_program.data();
        has_filter = true;
    }
};

ExecutionSupervisor::ExecutionSupervisor(const SupervisorConfig& config)
    : config_(config), impl_(std::make_unique<Impl>(config)) {}

ExecutionSupervisor::~ExecutionSupervisor() = default;

std::string ExecutionSupervisor::resolve_executable(const std::string& name) {
    if (name.empty()) {
        return "";
    }

    auto executable = [](const fs::path& candidate) {
        std::error_code ec;
        return fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        return executable(name) ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream dirs(search);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        if (executable(candidate)) {
            return candidate.string();
        }
    }
    return "";
}

bool ExecutionSupervisor::sandbox_available() const {
    return !resolve_executable(config_.sandbox_binary).empty();
}

LaunchPlan ExecutionSupervisor::plan(const std::string& harness_path, bool isolate) const {
    LaunchPlan launch;

    if (isolate) {
        std::string binary = resolve_executable(config_.sandbox_binary);
        if (!binary.empty()) {
            std::string jail_path = harness_path;
            if (!config_.sandbox_script_dir.empty()) {
                jail_path = (fs::path(config_.sandbox_script_dir) /
                             fs::path(harness_path).filename()).string();
            }
            launch.argv = {binary, "--config", config_.sandbox_config, "--",
                           config_.sandbox_interpreter, jail_path};
            launch.isolated = true;
            launch.deadline = config_.timeout + config_.sandbox_grace;
            return launch;
        }

        if (!config_.fallback_to_direct) {
            launch.error = "Sandbox binary not available: " + config_.sandbox_binary;
            return launch;
        }
        std::cerr << "[Supervisor] Sandbox binary " << config_.sandbox_binary
                  << " not found, running without isolation" << std::endl;
    }

    std::string interpreter = resolve_executable(config_.interpreter);
    if (interpreter.empty()) {
        launch.error = "Interpreter not found: " + config_.interpreter;
        return launch;
    }

    launch.argv = {interpreter, harness_path};
    launch.deadline = config_.timeout;
    return launch;
}

ExecutionOutcome ExecutionSupervisor::run(const std::string& harness_path, bool isolate) const {
    ExecutionOutcome outcome;
    auto start_time = Clock::now();

    auto spawn_failed = [&outcome, start_time](const std::string& message) {
        outcome.status = RunStatus::SPAWN_FAILED;
        outcome.error_message = message;
        outcome.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - start_time);
        std::cerr << "[Supervisor] " << message << std::endl;
        return outcome;
    };

    LaunchPlan launch = plan(harness_path, isolate);
    outcome.isolated = launch.isolated;
    outcome.deadline = launch.deadline;
    if (!launch.ok()) {
        return spawn_failed(launch.error);
    }

    UniqueFd devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));
    UniqueFd stdout_read, stdout_write, stderr_read, stderr_write, error_read, error_write;
    if (!devnull || !make_pipe(stdout_read, stdout_write) ||
        !make_pipe(stderr_read, stderr_write) || !make_pipe(error_read, error_write)) {
        return spawn_failed(std::string("Failed to create pipes: ") + std::strerror(errno));
    }

    ChildSpec spec = impl_->make_spec(launch, config_);

    pid_t pid = fork();
    if (pid < 0) {
        return spawn_failed(std::string("Failed to fork process: ") + std::strerror(errno));
    }
    if (pid == 0) {
        exec_child(spec, devnull.get(), stdout_write.get(), stderr_write.get(),
                   error_write.get());
    }

    // Either side may win this race; both set the same group
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        std::cerr << "[Supervisor] setpgid(" << pid << ") failed: "
                  << std::strerror(errno) << std::endl;
    }

    devnull.reset();
    stdout_write.reset();
    stderr_write.reset();
    error_write.reset();

    int wait_status = 0;
    rusage usage{};
    bool reaped = false;

    auto reap = [&](int options) {
        pid_t r;
        do {
            r = wait4(pid, &wait_status, options, &usage);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            reaped = true;
            kill_group(pid);  // Sweep anything the child left behind
        } else if (r < 0) {
            std::cerr << "[Supervisor] wait4(" << pid << ") failed: "
                      << std::strerror(errno) << std::endl;
            reaped = true;
        }
    };

    // EOF on the error pipe means execve succeeded
    ChildError child_error{};
    ssize_t n;
    do {
        n = read(error_read.get(), &child_error, sizeof(child_error));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_error))) {
        reap(0);
        return spawn_failed(std::string("Failed to ") + stage_name(child_error.stage) +
                            " " + launch.argv[0] + ": " + std::strerror(child_error.error));
    }
    error_read.reset();

    CaptureStream streams[2] = {
        {stdout_read.get(), &outcome.stdout_output, true},
        {stderr_read.get(), &outcome.stderr_output, true},
    };
    size_t captured = 0;
    char buffer[PIPE_BUFFER_SIZE];

    // Returns false once the stream is finished
    auto read_stream = [&](CaptureStream& stream, bool keep) {
        ssize_t bytes_read = read(stream.fd, buffer, sizeof(buffer));
        if (bytes_read < 0) {
            if (errno == EINTR || errno == EAGAIN) return true;
            stream.open = false;
            return false;
        }
        if (bytes_read == 0) {
            stream.open = false;
            return false;
        }
        size_t room = config_.max_output_bytes > captured ? config_.max_output_bytes - captured : 0;
        size_t kept = keep ? std::min(room, static_cast<size_t>(bytes_read)) : 0;
        stream.sink->append(buffer, kept);
        captured += kept;
        if (keep && static_cast<size_t>(bytes_read) > room) {
            outcome.status = RunStatus::OUTPUT_LIMIT_EXCEEDED;
        }
        return true;
    };

    // Poll both pipes until they close or the time limit passes
    auto pump = [&](Clock::time_point until, bool keep, bool stop_on_exit) {
        while (streams[0].open || streams[1].open || (stop_on_exit && !reaped)) {
            if (stop_on_exit && !reaped) {
                reap(WNOHANG);
                if (reaped) {
                    until = std::min(until, Clock::now() + DRAIN_WINDOW);
                }
            }
            if (stop_on_exit && reaped && !streams[0].open && !streams[1].open) {
                return true;
            }

            auto now = Clock::now();
            if (now >= until) {
                return false;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
            int wait_ms = static_cast<int>(std::min<long long>(POLL_INTERVAL_MS, remaining.count() + 1));

            pollfd fds[2];
            CaptureStream* owners[2];
            nfds_t count = 0;
            for (auto& stream : streams) {
                if (stream.open) {
                    fds[count] = {stream.fd, POLLIN, 0};
                    owners[count] = &stream;
                    ++count;
                }
            }

            int rc = poll(count ? fds : nullptr, count, wait_ms);
            if (rc < 0) {
                if (errno == EINTR) continue;
                std::cerr << "[Supervisor] poll failed: " << std::strerror(errno) << std::endl;
                return false;
            }
            for (nfds_t i = 0; i < count; ++i) {
                if (fds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
                    read_stream(*owners[i], keep);
                }
            }
            if (outcome.status == RunStatus::OUTPUT_LIMIT_EXCEEDED) {
                return false;
            }
        }
        return true;
    };

    bool finished = pump(start_time + launch.deadline, true, true);

    if (!finished) {
        kill_group(pid);
        if (!reaped) {
            if (outcome.status == RunStatus::COMPLETED) {
                outcome.status = RunStatus::TIMED_OUT;
            }
            if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
                std::cerr << "[Supervisor] kill(" << pid << ") failed: "
                          << std::strerror(errno) << std::endl;
            }
            // Keep what was written before the kill
            pump(Clock::now() + DRAIN_WINDOW,
                 outcome.status != RunStatus::OUTPUT_LIMIT_EXCEEDED, false);
        }
    }

    if (!reaped) {
        reap(0);
    }

    outcome.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start_time);

    if (WIFEXITED(wait_status)) {
        outcome.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        outcome.exit_code = -WTERMSIG(wait_status);
    }

    outcome.cpu_seconds = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6 +
                          usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;
    outcome.memory_bytes = static_cast<size_t>(usage.ru_maxrss) * 1024;

    if (outcome.status == RunStatus::TIMED_OUT) {
        std::cerr << "[Supervisor] Process " << pid << " killed after "
                  << launch.deadline.count() << "s deadline" << std::endl;
    } else if (outcome.status == RunStatus::OUTPUT_LIMIT_EXCEEDED) {
        std::cerr << "[Supervisor] Process " << pid << " killed after exceeding "
                  << config_.max_output_bytes << " bytes of output" << std::endl;
    }

    return outcome;
}

std::string ExecutionSupervisor::status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::TIMED_OUT: return "timed_out";
        case RunStatus::SPAWN_FAILED: return "spawn_failed";
        case RunStatus::OUTPUT_LIMIT_EXCEEDED: return "output_limit_exceeded";
    }
    return "unknown";
}

} // namespace scriptbox
