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

// Tripwire Circuit Breaker - Implementation

#include "circuit_breaker.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <numeric>

#include "../core/logging.hpp"

namespace tripwire::resilience {

namespace {

std::chrono::milliseconds elapsed_ms(CircuitBreaker::Clock::time_point since,
                                     CircuitBreaker::Clock::time_point now) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - since);
}

}  // namespace

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, EventSinks sinks)
    : config_(std::move(config))
    , sinks_(std::move(sinks))
    , last_state_change_(std::chrono::system_clock::now())
    , window_(config_.rolling_window)
    , rotation_timer_([this]() -> std::optional<Clock::time_point> {
        rotate_buckets();
        return Clock::now() + config_.bucket_interval;
    })
    , recovery_timer_([this]() { return run_recovery_probe(); }) {}

CircuitBreaker::~CircuitBreaker() {
    stop();
}

void CircuitBreaker::start() {
    rotation_timer_.start();
    rotation_timer_.arm_after(config_.bucket_interval);
    recovery_timer_.start();
}

void CircuitBreaker::stop() {
    // Timer callbacks take mutex_, so never join while holding it
    rotation_timer_.stop();
    recovery_timer_.stop();
}

bool CircuitBreaker::is_running() const {
    return rotation_timer_.is_running();
}

std::optional<uint64_t> CircuitBreaker::admit() {
    EventBatch events;
    uint64_t bucket = 0;
    {
        std::lock_guard lock(mutex_);
        auto now = Clock::now();

        if (state_ == CircuitState::OPEN) {
            if (next_attempt_at_ && now < *next_attempt_at_) {
                rejected_requests_.fetch_add(1, std::memory_order_relaxed);
                return std::nullopt;
            }
            to_half_open(now, "reset timeout elapsed", events);
        }

        total_requests_.fetch_add(1, std::memory_order_relaxed);
        bucket = window_.record_request();
    }
    publish(events);
    return bucket;
}

void CircuitBreaker::on_success(Clock::time_point started, uint64_t bucket) {
    EventBatch events;
    {
        std::lock_guard lock(mutex_);
        auto now = Clock::now();
        auto latency = std::chrono::duration_cast<std::chrono::microseconds>(now - started);

        total_successes_.fetch_add(1, std::memory_order_relaxed);
        // Dropped from the window when the admitting bucket is gone
        (void)window_.record_success(bucket);

        latencies_.push_back(latency);
        if (latencies_.size() > MAX_LATENCY_SAMPLES) {
            latencies_.pop_front();
        }

        switch (state_) {
            case CircuitState::HALF_OPEN:
                ++consecutive_successes_;
                if (consecutive_successes_ >= config_.volume_threshold) {
                    to_closed(now, "recovery successful", events);
                }
                break;

            case CircuitState::CLOSED:
                consecutive_failures_ = 0;
                break;

            case CircuitState::OPEN:
                // Admitted before the circuit re-opened; counted but not a recovery signal
                break;
        }

        BreakerEvent event;
        event.type = BreakerEventType::Success;
        event.breaker = config_.name;
        event.previous_state = state_;
        event.state = state_;
        event.duration = elapsed_ms(started, now);
        events.push_back(std::move(event));
    }
    publish(events);
}

void CircuitBreaker::on_failure(FailureKind kind, std::string reason, Clock::time_point started,
                                uint64_t bucket) {
    EventBatch events;
    {
        std::lock_guard lock(mutex_);
        auto now = Clock::now();

        total_failures_.fetch_add(1, std::memory_order_relaxed);
        if (kind == FailureKind::Timeout) {
            total_timeouts_.fetch_add(1, std::memory_order_relaxed);
            (void)window_.record_timeout(bucket);
        } else {
            (void)window_.record_failure(bucket);
        }
        last_failure_time_ = now;

        switch (state_) {
            case CircuitState::HALF_OPEN:
                // Recovery test failed, reopen immediately
                to_open(now, "failure while half-open", events);
                break;

            case CircuitState::CLOSED:
                ++consecutive_failures_;
                if (should_open(now)) {
                    auto window_metrics = window_.metrics(now);
                    to_open(now,
                            fmt::format("{} consecutive failures, {:.1f}% errors over {} calls",
                                        consecutive_failures_, window_metrics.error_rate(),
                                        window_metrics.total),
                            events);
                }
                break;

            case CircuitState::OPEN:
                break;
        }

        BreakerEvent event;
        event.type = BreakerEventType::Failure;
        event.breaker = config_.name;
        event.previous_state = state_;
        event.state = state_;
        event.duration = elapsed_ms(started, now);
        event.failure_kind = kind;
        event.reason = std::move(reason);
        event.consecutive_failures = consecutive_failures_;
        events.push_back(std::move(event));
    }
    publish(events);
}

bool CircuitBreaker::should_open(Clock::time_point now) const {
    if (consecutive_failures_ >= config_.failure_threshold) {
        return true;
    }

    // Error-rate path only counts once the window has enough volume
    auto window_metrics = window_.metrics(now);
    return window_metrics.total >= config_.volume_threshold &&
           window_metrics.error_rate() >= config_.error_threshold_percentage;
}

std::exception_ptr CircuitBreaker::make_open_error() const {
    return std::make_exception_ptr(BreakerError(
        BreakerErrc::circuit_open, config_.name,
        fmt::format("Circuit breaker is OPEN for {}", config_.name)));
}

std::exception_ptr CircuitBreaker::make_timeout_error() const {
    return std::make_exception_ptr(BreakerError(
        BreakerErrc::timeout, config_.name,
        fmt::format("Circuit breaker timeout after {}ms", config_.timeout.count())));
}

void CircuitBreaker::park_settled(std::function<bool()> settled) {
    size_t parked = 0;
    {
        std::lock_guard lock(abandoned_mutex_);
        abandoned_.push_back(std::move(settled));
        if (abandoned_.size() < ABANDONED_WARNING_THRESHOLD || abandoned_warned_) {
            return;
        }
        abandoned_warned_ = true;
        parked = abandoned_.size();
    }

    // Dependency keeps operations running long past the timeout
    if (auto* logger = logging::get_logger()) {
        LOG_WARNING(logger,
                    "Circuit breaker {} has {} timed-out operations still running "
                    "(timeout={}ms)",
                    config_.name, parked, config_.timeout.count());
    }
}

void CircuitBreaker::release_settled() {
    std::vector<std::function<bool()>> settled;
    {
        std::lock_guard lock(abandoned_mutex_);
        auto it = std::partition(abandoned_.begin(), abandoned_.end(),
                                 [](const auto& is_settled) { return !is_settled(); });
        settled.assign(std::make_move_iterator(it), std::make_move_iterator(abandoned_.end()));
        abandoned_.erase(it, abandoned_.end());
        if (abandoned_.size() < ABANDONED_WARNING_THRESHOLD) {
            abandoned_warned_ = false;
        }
    }
    // Futures are released here, outside the lock
}

void CircuitBreaker::to_open(Clock::time_point now, std::string reason, EventBatch& events) {
    if (state_ == CircuitState::OPEN) {
        return;
    }

    auto previous = state_;
    state_ = CircuitState::OPEN;
    consecutive_successes_ = 0;
    next_attempt_at_ = now + config_.reset_timeout;
    last_state_change_ = std::chrono::system_clock::now();
    ++open_epoch_;
    circuit_opens_.fetch_add(1, std::memory_order_relaxed);

    if (config_.health_check) {
        recovery_timer_.arm(*next_attempt_at_);
    }

    BreakerEvent event;
    event.type = BreakerEventType::Open;
    event.breaker = config_.name;
    event.previous_state = previous;
    event.state = state_;
    event.reason = std::move(reason);
    event.consecutive_failures = consecutive_failures_;
    events.push_back(std::move(event));
}

void CircuitBreaker::to_half_open(Clock::time_point /*now*/, std::string reason,
                                  EventBatch& events) {
    if (state_ == CircuitState::HALF_OPEN) {
        return;
    }

    auto previous = state_;
    state_ = CircuitState::HALF_OPEN;
    consecutive_failures_ = 0;
    consecutive_successes_ = 0;
    next_attempt_at_.reset();
    last_state_change_ = std::chrono::system_clock::now();
    recovery_timer_.disarm();

    BreakerEvent event;
    event.type = BreakerEventType::HalfOpen;
    event.breaker = config_.name;
    event.previous_state = previous;
    event.state = state_;
    event.reason = std::move(reason);
    events.push_back(std::move(event));
}

void CircuitBreaker::to_closed(Clock::time_point now, std::string reason, EventBatch& events) {
    if (state_ == CircuitState::CLOSED) {
        return;
    }

    auto previous = state_;
    state_ = CircuitState::CLOSED;
    consecutive_failures_ = 0;
    consecutive_successes_ = 0;
    next_attempt_at_.reset();
    last_state_change_ = std::chrono::system_clock::now();
    recovery_timer_.disarm();

    BreakerEvent event;
    event.type = BreakerEventType::Close;
    event.breaker = config_.name;
    event.previous_state = previous;
    event.state = state_;
    event.reason = std::move(reason);
    if (last_failure_time_) {
        event.recovery_time = elapsed_ms(*last_failure_time_, now);
    }
    events.push_back(std::move(event));
}

void CircuitBreaker::force_open() {
    EventBatch events;
    {
        std::lock_guard lock(mutex_);
        to_open(Clock::now(), "forced open", events);
    }
    publish(events);
}

void CircuitBreaker::force_close() {
    EventBatch events;
    {
        std::lock_guard lock(mutex_);
        to_closed(Clock::now(), "forced closed", events);
    }
    publish(events);
}

void CircuitBreaker::reset() {
    EventBatch events;
    {
        std::lock_guard lock(mutex_);
        auto now = Clock::now();

        auto previous = state_;
        state_ = CircuitState::CLOSED;
        consecutive_failures_ = 0;
        consecutive_successes_ = 0;
        next_attempt_at_.reset();
        last_failure_time_.reset();
        last_state_change_ = std::chrono::system_clock::now();
        ++open_epoch_;
        window_.clear(now);
        recovery_timer_.disarm();

        BreakerEvent event;
        event.type = BreakerEventType::Reset;
        event.breaker = config_.name;
        event.previous_state = previous;
        event.state = state_;
        events.push_back(std::move(event));
    }
    publish(events);
}

bool CircuitBreaker::health_check() {
    if (config_.health_check) {
        return config_.health_check();
    }
    return get_state() == CircuitState::CLOSED;
}

std::optional<CircuitBreaker::Clock::time_point> CircuitBreaker::run_recovery_probe() {
    uint64_t epoch = 0;
    {
        std::lock_guard lock(mutex_);
        if (state_ != CircuitState::OPEN || !config_.health_check) {
            return std::nullopt;
        }
        epoch = open_epoch_;
    }

    // Probe runs unlocked on its own thread and is bounded by the call
    // timeout; live traffic may move the circuit meanwhile
    bool healthy = false;
    std::string detail = "health check reported unhealthy";
    try {
        auto probe = core::run_detached(config_.health_check);
        if (probe.wait_for(config_.timeout) == std::future_status::timeout) {
            detail = fmt::format("health check timed out after {}ms", config_.timeout.count());
        } else {
            healthy = probe.get();
        }
    } catch (const std::exception& e) {
        detail = fmt::format("health check threw: {}", e.what());
    } catch (...) {
        detail = "health check threw a non-standard exception";
    }

    EventBatch events;
    std::optional<Clock::time_point> next;
    {
        std::lock_guard lock(mutex_);
        if (state_ != CircuitState::OPEN || open_epoch_ != epoch) {
            // Left OPEN through another path; a re-open armed its own probe
            return std::nullopt;
        }

        auto now = Clock::now();
        if (healthy) {
            last_health_check_error_.clear();
            to_half_open(now, "health check passed", events);
        } else {
            next_attempt_at_ = now + config_.reset_timeout;
            next = next_attempt_at_;
            last_health_check_error_ = std::move(detail);
        }
    }
    publish(events);
    return next;
}

void CircuitBreaker::rotate_buckets() {
    {
        std::lock_guard lock(mutex_);
        window_.rotate(Clock::now());
    }
    release_settled();
}

BreakerStatus CircuitBreaker::get_status() const {
    BreakerStatus status;
    status.name = config_.name;
    status.lifetime = lifetime_metrics();

    status.config = config_;
    status.config.fallback = nullptr;
    status.config.health_check = nullptr;
    status.has_fallback = static_cast<bool>(config_.fallback);
    status.has_health_check = static_cast<bool>(config_.health_check);

    {
        std::lock_guard lock(mutex_);
        auto now = Clock::now();

        status.state = state_;
        status.window = window_.metrics(now);
        status.error_rate = status.window.error_rate();
        status.consecutive_failures = consecutive_failures_;
        status.consecutive_successes = consecutive_successes_;
        status.last_state_change = last_state_change_;
        status.error_rate_history = window_.error_rate_history();
        status.last_health_check_error = last_health_check_error_;

        if (next_attempt_at_) {
            status.next_attempt_in =
                std::max(std::chrono::milliseconds(0), elapsed_ms(now, *next_attempt_at_));
        }

        if (!latencies_.empty()) {
            auto total = std::accumulate(latencies_.begin(), latencies_.end(),
                                         std::chrono::microseconds(0));
            status.average_latency_ms = static_cast<double>(total.count()) /
                                        static_cast<double>(latencies_.size()) / 1000.0;
        }
    }

    {
        std::lock_guard lock(abandoned_mutex_);
        status.abandoned_calls = abandoned_.size();
    }

    return status;
}

CircuitState CircuitBreaker::get_state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint32_t CircuitBreaker::consecutive_failures() const {
    std::lock_guard lock(mutex_);
    return consecutive_failures_;
}

uint32_t CircuitBreaker::consecutive_successes() const {
    std::lock_guard lock(mutex_);
    return consecutive_successes_;
}

std::optional<CircuitBreaker::Clock::time_point> CircuitBreaker::next_attempt_at() const {
    std::lock_guard lock(mutex_);
    return next_attempt_at_;
}

WindowMetrics CircuitBreaker::window_metrics() const {
    std::lock_guard lock(mutex_);
    return window_.metrics(Clock::now());
}

LifetimeMetrics CircuitBreaker::lifetime_metrics() const noexcept {
    LifetimeMetrics metrics;
    metrics.requests = total_requests_.load(std::memory_order_relaxed);
    metrics.successes = total_successes_.load(std::memory_order_relaxed);
    metrics.failures = total_failures_.load(std::memory_order_relaxed);
    metrics.timeouts = total_timeouts_.load(std::memory_order_relaxed);
    metrics.circuit_opens = circuit_opens_.load(std::memory_order_relaxed);
    metrics.rejected = rejected_requests_.load(std::memory_order_relaxed);
    return metrics;
}

void CircuitBreaker::publish(const EventBatch& events) const {
    for (const auto& event : events) {
        for (const auto& sink : sinks_) {
            sink(event);
        }
    }
}

}  // namespace tripwire::resilience
