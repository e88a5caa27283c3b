/*
 * Copyright 2025 Tripwire Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Tripwire Configuration - Header
// JSON breaker policy schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../resilience/circuit_breaker.hpp"

namespace tripwire::control {

/// Maximum policy name length (names become log fields and registry keys)
constexpr size_t MAX_POLICY_NAME_LENGTH = 128;

/// Logging configuration
struct LogConfig {
    std::string level = "info";      // debug, info, warning, error
    std::string format = "text";     // json, text
    std::string output = "console";  // "console" or a log directory

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Breaker settings for one dependency (durations in milliseconds)
struct BreakerPolicy {
    uint32_t timeout = 10000;                 // Call timeout
    uint32_t threshold = 5;                   // Consecutive failures to open
    uint32_t reset_timeout = 30000;           // OPEN → HALF_OPEN delay
    uint32_t rolling_window = 10000;          // Error-rate window
    uint32_t volume_threshold = 10;           // Window volume / HALF_OPEN successes
    double error_threshold_percentage = 50.0; // 0-100
    uint32_t bucket_interval = 1000;          // Bucket rotation period
};

/// Full Tripwire configuration
struct Config {
    LogConfig logging;

    // Applied to every policy key a policy does not set
    BreakerPolicy defaults;

    // Dependency name → policy
    core::fast_map<std::string, BreakerPolicy> policies;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("console"));
    if (j.contains("rotation")) {
        const auto& r = j.at("rotation");
        l.rotation.max_size_mb = r.value("max_size_mb", 100u);
        l.rotation.max_files = r.value("max_files", 10u);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"rotation",
                        {{"max_size_mb", l.rotation.max_size_mb},
                         {"max_files", l.rotation.max_files}}}};
}

/// Overlay the keys present in `j` onto `p` (missing keys keep p's values)
inline void apply_policy_json(const nlohmann::json& j, BreakerPolicy& p) {
    p.timeout = j.value("timeout", p.timeout);
    p.threshold = j.value("threshold", p.threshold);
    p.reset_timeout = j.value("resetTimeout", p.reset_timeout);
    p.rolling_window = j.value("rollingWindow", p.rolling_window);
    p.volume_threshold = j.value("volumeThreshold", p.volume_threshold);
    p.error_threshold_percentage =
        j.value("errorThresholdPercentage", p.error_threshold_percentage);
    p.bucket_interval = j.value("bucketInterval", p.bucket_interval);
}

inline void from_json(const nlohmann::json& j, BreakerPolicy& p) {
    p = BreakerPolicy{};
    apply_policy_json(j, p);
}

inline void to_json(nlohmann::json& j, const BreakerPolicy& p) {
    j = nlohmann::json{{"timeout", p.timeout},
                       {"threshold", p.threshold},
                       {"resetTimeout", p.reset_timeout},
                       {"rollingWindow", p.rolling_window},
                       {"volumeThreshold", p.volume_threshold},
                       {"errorThresholdPercentage", p.error_threshold_percentage},
                       {"bucketInterval", p.bucket_interval}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("defaults")) {
        j.at("defaults").get_to(c.defaults);
    }
    if (j.contains("policies")) {
        for (const auto& [name, policy_json] : j.at("policies").items()) {
            BreakerPolicy policy = c.defaults;
            apply_policy_json(policy_json, policy);
            c.policies[name] = policy;
        }
    }
    c.version = j.value("version", std::string("1.0"));
    if (j.contains("description")) {
        c.description = j.at("description").get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    nlohmann::json policies = nlohmann::json::object();
    for (const auto& [name, policy] : c.policies) {
        policies[name] = policy;
    }

    j = nlohmann::json{{"version", c.version},
                       {"logging", c.logging},
                       {"defaults", c.defaults},
                       {"policies", policies}};
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file. Parse and validation problems are
    /// written to `validation` when given.
    [[nodiscard]] static std::optional<Config> load_from_file(
        std::string_view path, ValidationResult* validation = nullptr);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(
        std::string_view json, ValidationResult* validation = nullptr);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Build the runtime breaker configuration for dependency `name`
[[nodiscard]] resilience::CircuitBreakerConfig to_breaker_config(const BreakerPolicy& policy,
                                                                 std::string name);

}  // namespace tripwire::control
