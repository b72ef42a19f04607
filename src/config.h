#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include "constants.h"
#include "validator.h"
#include "supervisor.h"
#include "rate_limiter.h"

namespace scriptbox {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Everything the service needs, assembled once at startup and passed down
struct ServiceConfig {
    int port = DEFAULT_PORT;
    bool use_sandbox = true;                  // Run through the isolation tool
    std::string script_dir = DEFAULT_SCRIPT_DIR;
    bool rate_limit_enabled = true;
    bool show_help = false;

    ValidatorConfig validator;
    SupervisorConfig supervisor;
    RateLimiter::Config rate_limit;
};

class ConfigLoader {
public:
    // Defaults, then environment, then command line.
    // Throws ConfigError on invalid values or unknown flags.
    static ServiceConfig load(int argc, char* argv[]);

    static void apply_environment(ServiceConfig& config);
    static void apply_arguments(ServiceConfig& config, const std::vector<std::string>& args);

    static std::string usage(const std::string& program);

    // Strict parsers shared by both sources
    static int parse_port(const std::string& value);
    static int parse_timeout(const std::string& value);
    static bool parse_bool(const std::string& value);
};

} // namespace scriptbox
