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

// Tripwire Status Reporting - Header
// Renders breaker status snapshots for admin/health endpoints

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "../resilience/circuit_breaker.hpp"

namespace tripwire::control {

/// Aggregate health across all breakers
enum class HealthStatus {
    Healthy,    // Every circuit CLOSED
    Degraded,   // Some circuits OPEN or HALF_OPEN
    Unhealthy   // Every circuit OPEN
};

/// Status response builder
class StatusResponse {
public:
    /// Overall verdict for a set of breaker snapshots (empty set is healthy)
    [[nodiscard]] static HealthStatus evaluate(const std::vector<resilience::BreakerStatus>& statuses);

    /// One breaker as a JSON object
    [[nodiscard]] static nlohmann::json to_json_object(const resilience::BreakerStatus& status);

    /// Full report: {"status": ..., "breakers": [...]}
    [[nodiscard]] static std::string to_json(const std::vector<resilience::BreakerStatus>& statuses);

    /// One line per breaker (for basic health checks)
    [[nodiscard]] static std::string to_text(const std::vector<resilience::BreakerStatus>& statuses);

    /// Determine HTTP status code based on health
    [[nodiscard]] static uint16_t to_http_status(HealthStatus status) noexcept {
        switch (status) {
            case HealthStatus::Healthy:
                return 200;  // OK
            case HealthStatus::Degraded:
                return 200;  // Still OK but with warnings
            case HealthStatus::Unhealthy:
                return 503;  // Service Unavailable
        }
        return 500;  // Internal Server Error
    }
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Unhealthy:
            return "unhealthy";
    }
    return "unknown";
}

}  // namespace tripwire::control
