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

// Tripwire Rolling Window - Header
// Time-bucketed outcome statistics for error-rate based tripping

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

#include "bucket.hpp"

namespace tripwire::resilience {

/// One error-rate observation taken at rotation time
struct ErrorRateSample {
    std::chrono::steady_clock::time_point at;
    double rate = 0.0;  // Percentage (0-100)
};

/// Rolling window of fixed-duration buckets.
///
/// Retained buckets are rotated out of the current position by rotate() and
/// pruned once they start before now - window. metrics() sums every retained
/// bucket still inside the window plus the current one.
///
/// Thread-safety: none. The owning CircuitBreaker serializes access.
class RollingWindow {
public:
    using Clock = std::chrono::steady_clock;

    /// Error-rate samples kept for status reporting
    static constexpr size_t MAX_RATE_SAMPLES = 100;

    explicit RollingWindow(std::chrono::milliseconds window,
                           Clock::time_point now = Clock::now());

    /// Count a request in the current bucket. Returns the bucket's sequence,
    /// which the call's outcome must be recorded against.
    [[nodiscard]] uint64_t record_request() noexcept {
        ++current_.requests;
        return current_.sequence;
    }

    /// Outcome of a request admitted into bucket `sequence`. Returns false
    /// (and records nothing) once that bucket was pruned or cleared.
    bool record_success(uint64_t sequence) noexcept;
    bool record_failure(uint64_t sequence) noexcept;

    /// Timed-out call: counted as a failure and as a timeout
    bool record_timeout(uint64_t sequence) noexcept;

    /// Close the current bucket, prune expired ones and start a fresh bucket
    void rotate(Clock::time_point now = Clock::now());

    /// Aggregate of buckets whose start lies in [now - window, now]
    [[nodiscard]] WindowMetrics metrics(Clock::time_point now = Clock::now()) const;

    /// Drop all buckets and history, start a fresh current bucket
    void clear(Clock::time_point now = Clock::now());

    [[nodiscard]] const Bucket& current() const noexcept { return current_; }
    [[nodiscard]] size_t retained_buckets() const noexcept { return buckets_.size(); }
    [[nodiscard]] std::chrono::milliseconds window() const noexcept { return window_; }

    [[nodiscard]] std::vector<ErrorRateSample> error_rate_history() const {
        return {rate_history_.begin(), rate_history_.end()};
    }

private:
    /// Retained or current bucket with the given sequence, nullptr if gone
    [[nodiscard]] Bucket* find_bucket(uint64_t sequence) noexcept;

    std::chrono::milliseconds window_;
    std::deque<Bucket> buckets_;  // Oldest first
    Bucket current_;
    std::deque<ErrorRateSample> rate_history_;
};

}  // namespace tripwire::resilience
