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

// Tripwire Bucket - Header
// Fixed-duration outcome counters for the rolling window

#pragma once

#include <chrono>
#include <cstdint>

namespace tripwire::resilience {

/// Counters for one rotation interval.
/// Invariant: successes + failures <= requests. Outcomes are recorded into the
/// bucket that admitted the request, so the invariant holds across rotations.
struct Bucket {
    uint64_t sequence = 0;  // Monotonic across rotations and clears
    std::chrono::steady_clock::time_point started_at;
    uint64_t requests = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    uint64_t timeouts = 0;  // Subset of failures
};

/// Aggregate over every bucket inside the rolling window (derived, never stored)
struct WindowMetrics {
    uint64_t total = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    uint64_t timeouts = 0;

    /// Failure percentage (0-100), 0 when the window saw no traffic
    [[nodiscard]] double error_rate() const noexcept {
        if (total == 0) return 0.0;
        return static_cast<double>(failures) / static_cast<double>(total) * 100.0;
    }
};

}  // namespace tripwire::resilience
