#include "config.h"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <sstream>

namespace scriptbox {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

int parse_int(const std::string& value, const std::string& what) {
    if (value.empty()) {
        throw ConfigError(what + " must not be empty");
    }
    size_t consumed = 0;
    long parsed;
    try {
        parsed = std::stol(value, &consumed, 10);
    } catch (const std::exception&) {
        throw ConfigError("Invalid " + what + ": " + value);
    }
    if (consumed != value.size() || parsed < INT32_MIN || parsed > INT32_MAX) {
        throw ConfigError("Invalid " + what + ": " + value);
    }
    return static_cast<int>(parsed);
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

void set_timeout(ServiceConfig& config, int seconds) {
    config.supervisor.timeout = std::chrono::seconds(seconds);
}

} // namespace

int ConfigLoader::parse_port(const std::string& value) {
    int port = parse_int(value, "port");
    if (port < 1 || port > 65535) {
        throw ConfigError("Port out of range (1-65535): " + value);
    }
    return port;
}

int ConfigLoader::parse_timeout(const std::string& value) {
    int seconds = parse_int(value, "timeout");
    if (seconds < 1 || seconds > 3600) {
        throw ConfigError("Timeout out of range (1-3600 seconds): " + value);
    }
    return seconds;
}

bool ConfigLoader::parse_bool(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError("Invalid boolean value: " + value);
}

void ConfigLoader::apply_environment(ServiceConfig& config) {
    if (const char* v = env("PORT")) {
        config.port = parse_port(v);
    }
    if (const char* v = env("USE_NSJAIL")) {
        config.use_sandbox = parse_bool(v);
    }
    if (const char* v = env("SCRIPTBOX_SANDBOX_BINARY")) {
        config.supervisor.sandbox_binary = v;
    }
    if (const char* v = env("SCRIPTBOX_SANDBOX_CONFIG")) {
        config.supervisor.sandbox_config = v;
    }
    if (const char* v = env("SCRIPTBOX_SCRIPT_DIR")) {
        config.script_dir = v;
    }
    if (const char* v = env("SCRIPTBOX_TIMEOUT")) {
        set_timeout(config, parse_timeout(v));
    }
}

void ConfigLoader::apply_arguments(ServiceConfig& config, const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw ConfigError("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--port") {
            config.port = parse_port(value());
        } else if (arg == "--sandbox") {
            config.use_sandbox = true;
        } else if (arg == "--no-sandbox") {
            config.use_sandbox = false;
        } else if (arg == "--sandbox-binary") {
            config.supervisor.sandbox_binary = value();
        } else if (arg == "--sandbox-config") {
            config.supervisor.sandbox_config = value();
        } else if (arg == "--sandbox-script-dir") {
            config.supervisor.sandbox_script_dir = value();
        } else if (arg == "--interpreter") {
            config.supervisor.interpreter = value();
        } else if (arg == "--timeout") {
            set_timeout(config, parse_timeout(value()));
        } else if (arg == "--script-dir") {
            config.script_dir = value();
        } else if (arg == "--deny-policy") {
            try {
                config.validator.deny_policy = Validator::parse_policy(value());
            } catch (const std::invalid_argument& e) {
                throw ConfigError(e.what());
            }
        } else if (arg == "--no-rate-limit") {
            config.rate_limit_enabled = false;
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    if (config.script_dir.empty()) {
        throw ConfigError("Script directory must not be empty");
    }
    if (config.supervisor.interpreter.empty()) {
        throw ConfigError("Interpreter must not be empty");
    }
}

ServiceConfig ConfigLoader::load(int argc, char* argv[]) {
    ServiceConfig config;
    apply_environment(config);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    apply_arguments(config, args);
    return config;
}

std::string ConfigLoader::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --port N                  Listen port (default " << DEFAULT_PORT << ", env PORT)\n"
        << "  --sandbox                 Run scripts through the isolation tool (default, env USE_NSJAIL)\n"
        << "  --no-sandbox              Run scripts directly under rlimits and a syscall filter\n"
        << "  --sandbox-binary PATH     Isolation tool (default " << DEFAULT_SANDBOX_BINARY << ")\n"
        << "  --sandbox-config PATH     Isolation tool config (default " << DEFAULT_SANDBOX_CONFIG << ")\n"
        << "  --sandbox-script-dir DIR  Script directory as mounted inside the jail\n"
        << "  --interpreter NAME        Interpreter for direct mode (default " << DEFAULT_INTERPRETER << ")\n"
        << "  --timeout SECONDS         Per-execution time limit (default " << DEFAULT_TIMEOUT_SECONDS << ")\n"
        << "  --script-dir DIR          Where harness files are written (default " << DEFAULT_SCRIPT_DIR << ")\n"
        << "  --deny-policy POLICY      block | warn | off (default block)\n"
        << "  --no-rate-limit           Disable per-IP quotas\n"
        << "  --help                    Show this message\n";
    return out.str();
}

} // namespace scriptbox
