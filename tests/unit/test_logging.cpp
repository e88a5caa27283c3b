// Tripwire Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <future>
#include <stdexcept>
#include <thread>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "resilience/circuit_breaker.hpp"

using namespace tripwire;
using namespace std::chrono_literals;

TEST_CASE("Log level parsing", "[logging]") {
    SECTION("Known levels") {
        REQUIRE(logging::parse_log_level("debug") == quill::LogLevel::Debug);
        REQUIRE(logging::parse_log_level("info") == quill::LogLevel::Info);
        REQUIRE(logging::parse_log_level("warning") == quill::LogLevel::Warning);
        REQUIRE(logging::parse_log_level("warn") == quill::LogLevel::Warning);
        REQUIRE(logging::parse_log_level("error") == quill::LogLevel::Error);
    }

    SECTION("Case insensitive") {
        REQUIRE(logging::parse_log_level("DEBUG") == quill::LogLevel::Debug);
        REQUIRE(logging::parse_log_level("Warning") == quill::LogLevel::Warning);
    }

    SECTION("Unknown levels fall back to info") {
        REQUIRE(logging::parse_log_level("verbose") == quill::LogLevel::Info);
        REQUIRE(logging::parse_log_level("") == quill::LogLevel::Info);
    }
}

TEST_CASE("Logger initialization", "[logging]") {
    // Test fixture already created the process logger
    auto* logger = logging::get_logger();
    REQUIRE(logger != nullptr);

    // Same name returns the same logger
    control::LogConfig config;
    config.level = "debug";
    config.output = "/tmp/tripwire_tests";
    REQUIRE(logging::init_logger(config) == logger);
    REQUIRE(logger->get_log_level() == quill::LogLevel::Debug);
}

TEST_CASE("Logging event sink", "[logging]") {
    auto* logger = logging::get_logger();
    REQUIRE(logger != nullptr);

    resilience::CircuitBreakerConfig config;
    config.name = "logged-api";
    config.failure_threshold = 1;
    config.reset_timeout = 20ms;
    config.volume_threshold = 1;

    resilience::CircuitBreaker breaker(config, {resilience::make_logging_sink(logger)});

    SECTION("Every event type logs without throwing") {
        std::promise<int> failed;
        failed.set_exception(std::make_exception_ptr(std::runtime_error("refused")));
        auto failing = failed.get_future();
        REQUIRE_THROWS_AS(breaker.execute([&failing] { return std::move(failing); }),
                          std::runtime_error);
        REQUIRE(breaker.get_state() == resilience::CircuitState::OPEN);

        std::this_thread::sleep_for(50ms);

        std::promise<int> ok;
        ok.set_value(1);
        auto succeeding = ok.get_future();
        REQUIRE(breaker.execute([&succeeding] { return std::move(succeeding); }) == 1);
        REQUIRE(breaker.get_state() == resilience::CircuitState::CLOSED);

        REQUIRE_NOTHROW(breaker.reset());
        logger->flush_log();
    }

    SECTION("Null logger is ignored") {
        auto sink = resilience::make_logging_sink(nullptr);
        resilience::BreakerEvent event;
        event.type = resilience::BreakerEventType::Open;
        REQUIRE_NOTHROW(sink(event));
    }
}
