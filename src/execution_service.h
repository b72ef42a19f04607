#pragma once

#include <string>
#include "config.h"
#include "execution_result.h"
#include "supervisor.h"
#include "validator.h"

namespace scriptbox {

// validate -> compose -> write harness -> supervise -> extract -> clean up.
// Stateless between calls apart from the script directory, so one instance
// is shared by all connection threads.
class ExecutionService {
public:
    // Throws std::runtime_error if the supervisor cannot be set up
    explicit ExecutionService(const ServiceConfig& config);

    // Never throws; every failure comes back as an ExecutionResult
    ExecutionResult execute(const std::string& script) const;

    bool isolation_enabled() const { return config_.use_sandbox; }
    bool sandbox_available() const { return supervisor_.sandbox_available(); }
    const ServiceConfig& config() const { return config_; }

private:
    ServiceConfig config_;
    Validator validator_;
    ExecutionSupervisor supervisor_;

    ExecutionResult run_validated(const std::string& script, const std::string& fingerprint) const;
    ExecutionResult interpret(const ExecutionOutcome& outcome) const;
};

} // namespace scriptbox
