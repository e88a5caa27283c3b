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

// Tripwire Breaker Events - Header
// Typed lifecycle events pushed to sinks injected at construction

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "circuit_state.hpp"

namespace quill {
class Logger;
}

namespace tripwire::resilience {

enum class BreakerEventType : uint8_t {
    Success,
    Failure,
    Open,
    HalfOpen,
    Close,
    Reset
};

/// Why a call counted as a failure
enum class FailureKind : uint8_t {
    None,
    Error,    // Wrapped operation threw
    Timeout   // Operation did not settle in time
};

struct BreakerEvent {
    BreakerEventType type = BreakerEventType::Success;
    std::string breaker;
    CircuitState previous_state = CircuitState::CLOSED;
    CircuitState state = CircuitState::CLOSED;  // State after the event

    // success / failure
    std::chrono::milliseconds duration{0};
    FailureKind failure_kind = FailureKind::None;
    std::string reason;

    // open
    uint32_t consecutive_failures = 0;

    // close: time since the last recorded failure
    std::optional<std::chrono::milliseconds> recovery_time;

    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/// Event consumer. Invoked on the thread that produced the event, after the
/// breaker lock is released. Must not throw.
using EventSink = std::function<void(const BreakerEvent&)>;

using EventSinks = std::vector<EventSink>;

/// Wire names: "success", "failure", "open", "half-open", "close", "reset"
[[nodiscard]] constexpr std::string_view to_string(BreakerEventType type) noexcept {
    switch (type) {
        case BreakerEventType::Success:
            return "success";
        case BreakerEventType::Failure:
            return "failure";
        case BreakerEventType::Open:
            return "open";
        case BreakerEventType::HalfOpen:
            return "half-open";
        case BreakerEventType::Close:
            return "close";
        case BreakerEventType::Reset:
            return "reset";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::None:
            return "NONE";
        case FailureKind::Error:
            return "ERROR";
        case FailureKind::Timeout:
            return "TIMEOUT";
    }
    return "UNKNOWN";
}

/// Sink that writes every event to `logger` (open/failure at warning,
/// transitions at info, success at debug)
[[nodiscard]] EventSink make_logging_sink(quill::Logger* logger);

}  // namespace tripwire::resilience
