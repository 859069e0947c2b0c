// Harbor Reverse Proxy - Main Entry Point

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "core/server_runner.hpp"

namespace {

std::atomic<bool> g_server_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_server_running.store(false, std::memory_order_relaxed);
    }
}

void print_usage(const char* program) {
    fprintf(stderr, "Usage: %s --config <config.json> [--check]\n", program);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    bool check_only = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--check") {
            check_only = true;
        } else {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (config_path.empty()) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    // Validation errors are printed by the loader
    auto config = harbor::control::ConfigLoader::load_from_file(config_path);
    if (!config) {
        fprintf(stderr, "Failed to load configuration from %s\n", config_path.c_str());
        return EXIT_FAILURE;
    }

    if (check_only) {
        printf("Configuration %s is valid\n", config_path.c_str());
        return EXIT_SUCCESS;
    }

    harbor::logging::init_logging_system();
    auto* logger = harbor::logging::init_logger(config->logging);
    LOG_INFO(logger, "Harbor starting: listen={}:{}, upstreams={}, admin={}",
             config->server.listen_address, config->server.listen_port, config->upstreams.size(),
             config->admin.enabled ? "on" : "off");

    // Broken pipes surface as EPIPE from send()
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto ec = harbor::core::run_server(*config, g_server_running);
    if (ec) {
        LOG_ERROR(logger, "Server error: {}", ec.message());
        harbor::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    LOG_INFO(logger, "Harbor stopped");
    harbor::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
