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

// Tripwire Configuration - Implementation

#include "config.hpp"

#include <fmt/format.h>

#include <cctype>
#include <fstream>
#include <sstream>

namespace tripwire::control {

namespace {

/// Validate a policy name (registry key, log field)
/// Returns empty string if valid, error message if invalid
[[nodiscard]] std::string validate_policy_name(std::string_view name) {
    if (name.empty()) {
        return "Policy name cannot be empty";
    }
    if (name.length() > MAX_POLICY_NAME_LENGTH) {
        return fmt::format("Policy name too long ({} > {} chars)", name.length(),
                           MAX_POLICY_NAME_LENGTH);
    }

    // Character whitelist: [a-zA-Z0-9_.-] only
    for (size_t i = 0; i < name.length(); ++i) {
        char c = name[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return fmt::format(
                "Invalid character '{}' at position {} (only alphanumeric, underscore, "
                "hyphen and dot allowed)",
                c, i);
        }
    }

    return "";
}

void validate_policy(const BreakerPolicy& policy, const std::string& context,
                     ValidationResult& result) {
    if (policy.timeout == 0) {
        result.add_error(context + ": timeout must be > 0");
    }
    if (policy.threshold == 0) {
        result.add_error(context + ": threshold must be > 0");
    }
    if (policy.reset_timeout == 0) {
        result.add_error(context + ": resetTimeout must be > 0");
    }
    if (policy.rolling_window == 0) {
        result.add_error(context + ": rollingWindow must be > 0");
    }
    if (policy.volume_threshold == 0) {
        result.add_error(context + ": volumeThreshold must be > 0");
    }
    if (policy.bucket_interval == 0) {
        result.add_error(context + ": bucketInterval must be > 0");
    }
    if (policy.error_threshold_percentage < 0.0 || policy.error_threshold_percentage > 100.0) {
        result.add_error(fmt::format("{}: errorThresholdPercentage must be within 0-100, got {}",
                                     context, policy.error_threshold_percentage));
    }
    if (policy.bucket_interval > policy.rolling_window) {
        result.add_error(fmt::format("{}: bucketInterval ({}ms) exceeds rollingWindow ({}ms)",
                                     context, policy.bucket_interval, policy.rolling_window));
    }

    if (policy.timeout >= policy.reset_timeout) {
        result.add_warning(fmt::format(
            "{}: timeout ({}ms) >= resetTimeout ({}ms), recovery attempts may overlap", context,
            policy.timeout, policy.reset_timeout));
    }
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path,
                                                   ValidationResult* validation) {
    // Read file contents
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        if (validation) {
            validation->add_error("Cannot open configuration file '" + path_str + "'");
        }
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json, validation);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json,
                                                   ValidationResult* validation) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        if (validation) {
            validation->add_error(fmt::format("JSON parsing error: {}", e.what()));
        }
        return std::nullopt;
    }

    auto result = validate(config);
    bool failed = result.has_errors();
    if (validation) {
        *validation = std::move(result);
    }

    if (failed) {
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    validate_policy(config.defaults, "defaults", result);

    if (config.policies.empty()) {
        result.add_warning("No breaker policies configured");
    }

    for (const auto& [name, policy] : config.policies) {
        auto name_error = validate_policy_name(name);
        if (!name_error.empty()) {
            result.add_error("Policy '" + name + "': " + name_error);
            continue;
        }
        validate_policy(policy, "Policy '" + name + "'", result);
    }

    // Validate logging level
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    // Validate logging format
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    if (config.logging.output.empty()) {
        result.add_error("Logging output cannot be empty");
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception&) {
        return "";
    }
}

resilience::CircuitBreakerConfig to_breaker_config(const BreakerPolicy& policy,
                                                   std::string name) {
    resilience::CircuitBreakerConfig config;
    config.name = std::move(name);
    config.timeout = std::chrono::milliseconds(policy.timeout);
    config.failure_threshold = policy.threshold;
    config.reset_timeout = std::chrono::milliseconds(policy.reset_timeout);
    config.rolling_window = std::chrono::milliseconds(policy.rolling_window);
    config.volume_threshold = policy.volume_threshold;
    config.error_threshold_percentage = policy.error_threshold_percentage;
    config.bucket_interval = std::chrono::milliseconds(policy.bucket_interval);
    return config;
}

}  // namespace tripwire::control
