// Tripwire Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <fstream>

#include "../../src/control/config.hpp"

using namespace tripwire::control;
using namespace std::chrono_literals;

namespace {

bool contains(const std::vector<std::string>& messages, const std::string& needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("Config JSON serialization", "[control][config]") {
    Config config;
    config.policies["admin-api"] = BreakerPolicy{};

    std::string json = ConfigLoader::to_json(config);
    REQUIRE_FALSE(json.empty());
    REQUIRE(json.find("\"version\"") != std::string::npos);
    REQUIRE(json.find("\"admin-api\"") != std::string::npos);
    REQUIRE((json.find("\"resetTimeout\": 30000") != std::string::npos ||
             json.find("\"resetTimeout\":30000") != std::string::npos));

    // Serialized form loads back to the same policy
    auto loaded = ConfigLoader::load_from_json(json);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->policies.at("admin-api").reset_timeout == 30000);
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "version": "1.0",
        "logging": {"level": "debug", "format": "json", "output": "/tmp/tripwire"},
        "policies": {
            "admin-api": {"threshold": 5, "timeout": 60000, "resetTimeout": 30000},
            "customer-api": {"threshold": 10, "timeout": 30000, "resetTimeout": 15000}
        }
    })";

    ValidationResult validation;
    auto maybe_config = ConfigLoader::load_from_json(json, &validation);
    REQUIRE(maybe_config.has_value());

    const auto& config = *maybe_config;
    REQUIRE(config.version == "1.0");
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.logging.format == "json");
    REQUIRE(config.policies.size() == 2);

    const auto& admin = config.policies.at("admin-api");
    REQUIRE(admin.threshold == 5);
    REQUIRE(admin.timeout == 60000);
    REQUIRE(admin.reset_timeout == 30000);

    const auto& customer = config.policies.at("customer-api");
    REQUIRE(customer.threshold == 10);
    REQUIRE(customer.reset_timeout == 15000);

    // Both call timeouts outlast their reset timeouts
    REQUIRE_FALSE(validation.has_errors());
    REQUIRE(contains(validation.warnings, "admin-api"));
    REQUIRE(contains(validation.warnings, "customer-api"));
}

TEST_CASE("Config - Policies inherit defaults", "[control][config]") {
    const char* json = R"({
        "defaults": {"timeout": 2000, "volumeThreshold": 20, "errorThresholdPercentage": 25},
        "policies": {
            "search-api": {"threshold": 3}
        }
    })";

    auto config = ConfigLoader::load_from_json(json);
    REQUIRE(config.has_value());

    const auto& policy = config->policies.at("search-api");
    REQUIRE(policy.threshold == 3);
    REQUIRE(policy.timeout == 2000);
    REQUIRE(policy.volume_threshold == 20);
    REQUIRE(policy.error_threshold_percentage == 25.0);
    REQUIRE(policy.reset_timeout == 30000);
    REQUIRE(policy.rolling_window == 10000);
    REQUIRE(policy.bucket_interval == 1000);
}

TEST_CASE("Config - Invalid JSON", "[control][config]") {
    ValidationResult validation;
    auto config = ConfigLoader::load_from_json("{ not json", &validation);

    REQUIRE_FALSE(config.has_value());
    REQUIRE(validation.has_errors());
    REQUIRE(contains(validation.errors, "JSON parsing error"));
}

TEST_CASE("Config - Wrong value type", "[control][config]") {
    ValidationResult validation;
    auto config = ConfigLoader::load_from_json(
        R"({"policies": {"admin-api": {"timeout": "fast"}}})", &validation);

    REQUIRE_FALSE(config.has_value());
    REQUIRE(validation.has_errors());
}

TEST_CASE("Config validation - valid config", "[control][config]") {
    Config config;
    config.policies["admin-api"] = BreakerPolicy{};

    auto validation = ConfigLoader::validate(config);
    REQUIRE(validation.valid);
    REQUIRE_FALSE(validation.has_errors());
    REQUIRE(validation.warnings.empty());
}

TEST_CASE("Config validation - empty policy set warns", "[control][config]") {
    Config config;

    auto validation = ConfigLoader::validate(config);
    REQUIRE_FALSE(validation.has_errors());
    REQUIRE(contains(validation.warnings, "No breaker policies"));
}

TEST_CASE("Config validation - policy values", "[control][config]") {
    Config config;
    BreakerPolicy policy;

    SECTION("Zero timeout") {
        policy.timeout = 0;
        config.policies["admin-api"] = policy;
        auto validation = ConfigLoader::validate(config);
        REQUIRE(contains(validation.errors, "timeout must be > 0"));
    }

    SECTION("Zero threshold") {
        policy.threshold = 0;
        config.policies["admin-api"] = policy;
        auto validation = ConfigLoader::validate(config);
        REQUIRE(contains(validation.errors, "threshold must be > 0"));
    }

    SECTION("Zero volume threshold") {
        policy.volume_threshold = 0;
        config.policies["admin-api"] = policy;
        auto validation = ConfigLoader::validate(config);
        REQUIRE(contains(validation.errors, "volumeThreshold must be > 0"));
    }

    SECTION("Percentage out of range") {
        policy.error_threshold_percentage = 150.0;
        config.policies["admin-api"] = policy;
        auto validation = ConfigLoader::validate(config);
        REQUIRE(contains(validation.errors, "errorThresholdPercentage"));
    }

    SECTION("Bucket interval longer than the window") {
        policy.bucket_interval = 20000;
        config.policies["admin-api"] = policy;
        auto validation = ConfigLoader::validate(config);
        REQUIRE(contains(validation.errors, "bucketInterval"));
    }

    SECTION("Timeout not below reset timeout only warns") {
        policy.timeout = 60000;
        config.policies["admin-api"] = policy;
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE(contains(validation.warnings, "resetTimeout"));
    }
}

TEST_CASE("Config validation - policy names", "[control][config][security]") {
    Config config;

    SECTION("Empty name") {
        config.policies[""] = BreakerPolicy{};
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Whitespace and control characters rejected") {
        config.policies["admin api"] = BreakerPolicy{};
        config.policies["admin\napi"] = BreakerPolicy{};
        auto validation = ConfigLoader::validate(config);
        REQUIRE(validation.errors.size() == 2);
        REQUIRE(contains(validation.errors, "Invalid character"));
    }

    SECTION("Overlong name rejected") {
        config.policies[std::string(MAX_POLICY_NAME_LENGTH + 1, 'a')] = BreakerPolicy{};
        REQUIRE(contains(ConfigLoader::validate(config).errors, "too long"));
    }

    SECTION("Dots, dashes and underscores accepted") {
        config.policies["payments.v2_primary-eu"] = BreakerPolicy{};
        REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());
    }
}

TEST_CASE("Config validation - logging", "[control][config]") {
    Config config;
    config.policies["admin-api"] = BreakerPolicy{};

    SECTION("Unknown level") {
        config.logging.level = "verbose";
        REQUIRE(contains(ConfigLoader::validate(config).errors, "logging level"));
    }

    SECTION("Unknown format") {
        config.logging.format = "xml";
        REQUIRE(contains(ConfigLoader::validate(config).errors, "logging format"));
    }
}

TEST_CASE("Config - Load from file", "[control][config]") {
    SECTION("Missing file") {
        ValidationResult validation;
        auto config = ConfigLoader::load_from_file("/nonexistent/tripwire.json", &validation);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(contains(validation.errors, "Cannot open"));
    }

    SECTION("File on disk") {
        const char* path = "/tmp/tripwire_test_policies.json";
        {
            std::ofstream out(path);
            out << R"({"policies": {"admin-api": {"threshold": 4}}})";
        }

        auto config = ConfigLoader::load_from_file(path);
        std::remove(path);

        REQUIRE(config.has_value());
        REQUIRE(config->policies.at("admin-api").threshold == 4);
    }
}

TEST_CASE("Config - Policy to breaker config", "[control][config]") {
    BreakerPolicy policy;
    policy.timeout = 60000;
    policy.threshold = 5;
    policy.reset_timeout = 30000;
    policy.rolling_window = 20000;
    policy.volume_threshold = 15;
    policy.error_threshold_percentage = 40.0;
    policy.bucket_interval = 500;

    auto config = to_breaker_config(policy, "admin-api");

    REQUIRE(config.name == "admin-api");
    REQUIRE(config.timeout == 60000ms);
    REQUIRE(config.failure_threshold == 5);
    REQUIRE(config.reset_timeout == 30000ms);
    REQUIRE(config.rolling_window == 20000ms);
    REQUIRE(config.volume_threshold == 15);
    REQUIRE(config.error_threshold_percentage == 40.0);
    REQUIRE(config.bucket_interval == 500ms);
    REQUIRE_FALSE(config.fallback);
    REQUIRE_FALSE(config.health_check);
}
