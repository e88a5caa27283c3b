// Tripwire Unit Tests - Main Entry Point
#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        // Initialize logging system for tests
        tripwire::logging::init_logging_system();

        tripwire::control::LogConfig log_config;
        log_config.level = "debug";
        log_config.output = "/tmp/tripwire_tests";
        tripwire::logging::init_logger(log_config);
    }

    ~GlobalSetup() {
        // Cleanup logging system
        tripwire::logging::shutdown_logging();
    }
};

// Create global instance to run setup/teardown
static GlobalSetup g_setup;

TEST_CASE("Basic sanity test", "[smoke]") {
    REQUIRE(tripwire::logging::get_logger() != nullptr);
}
