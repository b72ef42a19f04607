#include "execution_service.h"
#include "crypto_utils.h"
#include "harness_composer.h"
#include "harness_file.h"
#include "result_extractor.h"
#include <signal.h>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace scriptbox {

namespace {

const char* INTERNAL_ERROR_MESSAGE = "Internal server error";

std::string format_summary(const std::string& fingerprint, const ExecutionOutcome& outcome,
                           const ExecutionResult& result) {
    std::ostringstream line;
    line << "[Exec] " << fingerprint
         << " mode=" << (outcome.isolated ? "isolated" : "direct")
         << " status=" << ExecutionSupervisor::status_to_string(outcome.status)
         << " exit=" << outcome.exit_code
         << " result=" << (result.ok() ? "ok" : ExecutionResult::kind_to_string(result.error_kind))
         << " wall=" << outcome.wall_time.count() << "ms"
         << " cpu=" << std::fixed << std::setprecision(3) << outcome.cpu_seconds << "s"
         << " mem=" << (outcome.memory_bytes / (1024 * 1024)) << "MB";
    return line.str();
}

// SIGXCPU at the soft limit, SIGKILL at the hard one
bool cpu_limit_hit(const ExecutionOutcome& outcome) {
    if (outcome.isolated) return false;
    if (outcome.exit_code == -SIGXCPU) return true;
    return outcome.exit_code == -SIGKILL &&
           outcome.cpu_seconds >= static_cast<double>(outcome.deadline.count());
}

} // namespace

ExecutionService::ExecutionService(const ServiceConfig& config)
    : config_(config),
      validator_(config.validator),
      supervisor_(config.supervisor) {}

ExecutionResult ExecutionService::execute(const std::string& script) const {
    std::string fingerprint = "unknown";
    try {
        fingerprint = CryptoUtils::fingerprint(script);

        ValidationResult validation = validator_.validate(script);
        for (const auto& warning : validation.warnings) {
            std::cerr << "[Validator] " << fingerprint << " " << warning << std::endl;
        }
        if (!validation.ok()) {
            std::cout << "[Exec] " << fingerprint << " rejected ("
                      << Validator::reason_to_string(validation.reason) << ", "
                      << script.size() << " bytes)" << std::endl;
            return ExecutionResult::failure(ErrorKind::VALIDATION, validation.message);
        }

        std::cout << "[Exec] " << fingerprint << " accepted (" << script.size()
                  << " bytes)" << std::endl;
        return run_validated(script, fingerprint);
    } catch (const std::exception& e) {
        std::cerr << "[Exec] " << fingerprint << " internal error: " << e.what() << std::endl;
        return ExecutionResult::failure(ErrorKind::INTERNAL, INTERNAL_ERROR_MESSAGE);
    }
}

ExecutionResult ExecutionService::run_validated(const std::string& script,
                                                const std::string& fingerprint) const {
    // Removed on every path out of this scope
    HarnessFile harness(config_.script_dir, HarnessComposer::compose(script));

    ExecutionOutcome outcome = supervisor_.run(harness.path(), config_.use_sandbox);
    ExecutionResult result = interpret(outcome);
    result.cpu_seconds = outcome.cpu_seconds;
    result.memory_bytes = outcome.memory_bytes;
    result.wall_time = outcome.wall_time;

    std::cout << format_summary(fingerprint, outcome, result) << std::endl;
    return result;
}

ExecutionResult ExecutionService::interpret(const ExecutionOutcome& outcome) const {
    const ExecutionResult timed_out = ExecutionResult::failure(ErrorKind::TIMEOUT,
        "Script execution timed out after " +
        std::to_string(config_.supervisor.timeout.count()) + " seconds");

    switch (outcome.status) {
        case RunStatus::TIMED_OUT:
            return timed_out;

        case RunStatus::SPAWN_FAILED:
            return ExecutionResult::failure(ErrorKind::SPAWN,
                "Failed to start script execution: " + outcome.error_message);

        case RunStatus::OUTPUT_LIMIT_EXCEEDED:
            return ExecutionResult::failure(ErrorKind::OUTPUT_LIMIT,
                "Script output exceeded the limit of " +
                std::to_string(config_.supervisor.max_output_bytes) + " bytes");

        case RunStatus::COMPLETED:
            break;
    }

    // RLIMIT_CPU counts every thread, so a multithreaded script can run out
    // of CPU time before the wall-clock deadline
    if (cpu_limit_hit(outcome)) {
        return timed_out;
    }
    return ResultExtractor::extract(outcome);
}

} // namespace scriptbox
