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

// Tripwire Rolling Window - Implementation

#include "rolling_window.hpp"

namespace tripwire::resilience {

RollingWindow::RollingWindow(std::chrono::milliseconds window, Clock::time_point now)
    : window_(window) {
    current_.started_at = now;
}

bool RollingWindow::record_success(uint64_t sequence) noexcept {
    Bucket* bucket = find_bucket(sequence);
    if (bucket == nullptr) {
        return false;
    }
    ++bucket->successes;
    return true;
}

bool RollingWindow::record_failure(uint64_t sequence) noexcept {
    Bucket* bucket = find_bucket(sequence);
    if (bucket == nullptr) {
        return false;
    }
    ++bucket->failures;
    return true;
}

bool RollingWindow::record_timeout(uint64_t sequence) noexcept {
    Bucket* bucket = find_bucket(sequence);
    if (bucket == nullptr) {
        return false;
    }
    ++bucket->failures;
    ++bucket->timeouts;
    return true;
}

Bucket* RollingWindow::find_bucket(uint64_t sequence) noexcept {
    if (sequence == current_.sequence) {
        return &current_;
    }
    if (buckets_.empty() || sequence < buckets_.front().sequence) {
        return nullptr;
    }

    // Retained buckets hold consecutive sequences, oldest first
    auto offset = sequence - buckets_.front().sequence;
    if (offset >= buckets_.size()) {
        return nullptr;
    }
    return &buckets_[offset];
}

void RollingWindow::rotate(Clock::time_point now) {
    uint64_t next_sequence = current_.sequence + 1;
    buckets_.push_back(current_);

    auto cutoff = now - window_;
    while (!buckets_.empty() && buckets_.front().started_at < cutoff) {
        buckets_.pop_front();
    }

    current_ = Bucket{};
    current_.sequence = next_sequence;
    current_.started_at = now;

    auto window_metrics = metrics(now);
    if (window_metrics.total > 0) {
        rate_history_.push_back(ErrorRateSample{now, window_metrics.error_rate()});
        if (rate_history_.size() > MAX_RATE_SAMPLES) {
            rate_history_.pop_front();
        }
    }
}

WindowMetrics RollingWindow::metrics(Clock::time_point now) const {
    WindowMetrics result;
    auto cutoff = now - window_;

    auto add = [&result](const Bucket& bucket) {
        result.total += bucket.requests;
        result.successes += bucket.successes;
        result.failures += bucket.failures;
        result.timeouts += bucket.timeouts;
    };

    // Buckets may have expired since the last rotation
    for (const auto& bucket : buckets_) {
        if (bucket.started_at >= cutoff) {
            add(bucket);
        }
    }
    add(current_);

    return result;
}

void RollingWindow::clear(Clock::time_point now) {
    // Sequence keeps counting so calls admitted before the clear are dropped
    uint64_t next_sequence = current_.sequence + 1;
    buckets_.clear();
    rate_history_.clear();
    current_ = Bucket{};
    current_.sequence = next_sequence;
    current_.started_at = now;
}

}  // namespace tripwire::resilience
