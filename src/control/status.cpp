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

// Tripwire Status Reporting - Implementation

#include "status.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace tripwire::control {

using resilience::BreakerStatus;
using resilience::CircuitState;

HealthStatus StatusResponse::evaluate(const std::vector<BreakerStatus>& statuses) {
    size_t open = 0;
    size_t not_closed = 0;

    for (const auto& status : statuses) {
        if (status.state == CircuitState::OPEN) {
            ++open;
        }
        if (status.state != CircuitState::CLOSED) {
            ++not_closed;
        }
    }

    if (!statuses.empty() && open == statuses.size()) {
        return HealthStatus::Unhealthy;
    }
    if (not_closed > 0) {
        return HealthStatus::Degraded;
    }
    return HealthStatus::Healthy;
}

nlohmann::json StatusResponse::to_json_object(const BreakerStatus& status) {
    const auto& lifetime = status.lifetime;
    const auto& window = status.window;
    const auto& config = status.config;

    nlohmann::json history = nlohmann::json::array();
    for (const auto& sample : status.error_rate_history) {
        history.push_back(sample.rate);
    }

    nlohmann::json j = {
        {"name", status.name},
        {"state", resilience::to_string(status.state)},
        {"metrics",
         {{"totalRequests", lifetime.requests},
          {"totalSuccesses", lifetime.successes},
          {"totalFailures", lifetime.failures},
          {"totalTimeouts", lifetime.timeouts},
          {"totalCircuitOpens", lifetime.circuit_opens},
          {"totalRejected", lifetime.rejected},
          {"window",
           {{"total", window.total},
            {"successes", window.successes},
            {"failures", window.failures},
            {"timeouts", window.timeouts}}},
          {"errorRate", status.error_rate},
          {"errorRates", history},
          {"averageResponseTime", status.average_latency_ms},
          {"consecutiveFailures", status.consecutive_failures},
          {"consecutiveSuccesses", status.consecutive_successes},
          {"abandonedCalls", status.abandoned_calls}}},
        {"config",
         {{"timeout", config.timeout.count()},
          {"threshold", config.failure_threshold},
          {"resetTimeout", config.reset_timeout.count()},
          {"rollingWindow", config.rolling_window.count()},
          {"volumeThreshold", config.volume_threshold},
          {"errorThresholdPercentage", config.error_threshold_percentage},
          {"bucketInterval", config.bucket_interval.count()},
          {"fallback", status.has_fallback},
          {"healthCheck", status.has_health_check}}},
        {"lastStateChange", std::chrono::duration_cast<std::chrono::milliseconds>(
                                status.last_state_change.time_since_epoch())
                                .count()}};

    if (status.next_attempt_in) {
        j["nextAttemptInMs"] = status.next_attempt_in->count();
    }
    if (!status.last_health_check_error.empty()) {
        j["lastHealthCheckError"] = status.last_health_check_error;
    }

    return j;
}

std::string StatusResponse::to_json(const std::vector<BreakerStatus>& statuses) {
    nlohmann::json breakers = nlohmann::json::array();
    for (const auto& status : statuses) {
        breakers.push_back(to_json_object(status));
    }

    nlohmann::json j = {{"status", to_string(evaluate(statuses))}, {"breakers", breakers}};
    return j.dump(2);
}

std::string StatusResponse::to_text(const std::vector<BreakerStatus>& statuses) {
    std::string text;

    switch (evaluate(statuses)) {
        case HealthStatus::Healthy:
            text = "OK";
            break;
        case HealthStatus::Degraded:
            text = "DEGRADED";
            break;
        case HealthStatus::Unhealthy:
            text = "UNHEALTHY";
            break;
    }
    text += fmt::format(" - Breakers: {}\n", statuses.size());

    for (const auto& status : statuses) {
        text += fmt::format("{} {} requests={} failures={} error_rate={:.1f}% avg_ms={:.2f}\n",
                            status.name, resilience::to_string(status.state),
                            status.lifetime.requests, status.lifetime.failures,
                            status.error_rate, status.average_latency_ms);
    }

    return text;
}

}  // namespace tripwire::control
