// Harbor Unit Tests - Global Setup
#include <catch2/catch_test_macros.hpp>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        harbor::logging::init_logging_system();

        harbor::control::LogConfig log_config;
        log_config.output = "/tmp/harbor_tests";
        log_config.level = "debug";
        harbor::logging::init_logger(log_config);
    }

    ~GlobalSetup() {
        harbor::logging::shutdown_logging();
    }
};

static GlobalSetup g_setup;
