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

// Tripwire Breaker Errors - Header
// Error category for failures produced by the breaker itself

#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace tripwire::resilience {

/// Failure kinds raised by the breaker (never by the wrapped operation)
enum class BreakerErrc {
    circuit_open = 1,  // Call refused, circuit is OPEN and the reset window has not elapsed
    timeout = 2,       // Operation did not settle within the configured timeout
};

/// Error category "tripwire.breaker"
[[nodiscard]] const std::error_category& breaker_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(BreakerErrc e) noexcept {
    return {static_cast<int>(e), breaker_category()};
}

/// Exception thrown by CircuitBreaker::execute() for CIRCUIT_OPEN and TIMEOUT.
/// Errors thrown by the wrapped operation are re-thrown as-is, never wrapped.
class BreakerError : public std::system_error {
public:
    BreakerError(BreakerErrc code, std::string breaker, const std::string& what);

    /// Name of the breaker that produced the error
    [[nodiscard]] const std::string& breaker() const noexcept { return breaker_; }

    [[nodiscard]] bool is_circuit_open() const noexcept {
        return code() == make_error_code(BreakerErrc::circuit_open);
    }

    [[nodiscard]] bool is_timeout() const noexcept {
        return code() == make_error_code(BreakerErrc::timeout);
    }

private:
    std::string breaker_;
};

/// Stable kind name used in events and logs: "CIRCUIT_OPEN", "TIMEOUT"
[[nodiscard]] constexpr std::string_view to_string(BreakerErrc e) noexcept {
    switch (e) {
        case BreakerErrc::circuit_open:
            return "CIRCUIT_OPEN";
        case BreakerErrc::timeout:
            return "TIMEOUT";
    }
    return "UNKNOWN";
}

}  // namespace tripwire::resilience

namespace std {
template <>
struct is_error_code_enum<tripwire::resilience::BreakerErrc> : true_type {};
}  // namespace std
