/*
 * scriptbox - Sandboxed Python script execution over HTTP
 * POST a script with a main() function, get its JSON return value back
 */

#include "api.h"
#include "config.h"
#include "execution_service.h"
#include "http_server.h"
#include "rate_limiter.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <thread>

using namespace scriptbox;

int main(int argc, char* argv[]) {
    ServiceConfig config;
    try {
        config = ConfigLoader::load(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << ConfigLoader::usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        std::cout << ConfigLoader::usage(argv[0]);
        return 0;
    }

    // Broken client connections must not kill the server
    if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
        std::cerr << "Failed to ignore SIGPIPE: " << std::strerror(errno) << std::endl;
        return 1;
    }

    std::unique_ptr<ExecutionService> service;
    try {
        service = std::make_unique<ExecutionService>(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize execution service: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "scriptbox - Sandboxed Script Execution" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    if (config.use_sandbox) {
        std::cout << "Isolation: " << config.supervisor.sandbox_binary
                  << (service->sandbox_available() ? "" : " (NOT FOUND, falling back to direct)")
                  << std::endl;
        std::cout << "Sandbox config: " << config.supervisor.sandbox_config << std::endl;
    } else {
        std::cout << "Isolation: direct (rlimits"
                  << (config.supervisor.syscall_filter ? " + syscall filter" : "") << ")" << std::endl;
    }
    std::cout << "Timeout: " << config.supervisor.timeout.count() << "s" << std::endl;
    std::cout << "Script dir: " << config.script_dir << std::endl;
    std::cout << "Rate limiting: " << (config.rate_limit_enabled ? "on" : "off") << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    std::shared_ptr<RateLimiter> limiter;
    if (config.rate_limit_enabled) {
        limiter = std::make_shared<RateLimiter>(config.rate_limit);

        // Forget idle clients periodically
        std::thread([limiter]() {
            while (true) {
                std::this_thread::sleep_for(std::chrono::minutes(5));
                limiter->cleanup_old_entries();
            }
        }).detach();
    }

    HttpServer server(config.port);
    ScriptApi api(*service, limiter);
    api.register_routes(server);

    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
