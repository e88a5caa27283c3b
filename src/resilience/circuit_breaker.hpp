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

// Tripwire Circuit Breaker - Header
// Guards asynchronous calls to one downstream dependency

#pragma once

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "../core/deadline_timer.hpp"
#include "../core/detached_task.hpp"
#include "circuit_state.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "rolling_window.hpp"

namespace tripwire::resilience {

/// Substitute outcome for a refused or failed call. Receives the failure
/// (BreakerError for CIRCUIT_OPEN / TIMEOUT, otherwise the operation's own
/// exception). The returned value must hold the call's result type; a
/// throwing fallback makes its exception the call's outcome.
using Fallback = std::function<std::any(const std::exception_ptr&)>;

/// Out-of-band recovery probe. true = dependency healthy; false, a thrown
/// exception or no answer within the call timeout keeps the circuit OPEN.
/// The background probe runs on its own thread, so it must not capture
/// anything that dies before the probe returns.
using HealthCheck = std::function<bool()>;

/// Circuit breaker configuration (immutable once the breaker is built)
struct CircuitBreakerConfig {
    /// Breaker identity (registry key, log and event field)
    std::string name = "circuit-breaker";

    /// Time a call may take before it counts as TIMEOUT
    std::chrono::milliseconds timeout{10000};

    /// Consecutive failures in CLOSED that open the circuit
    uint32_t failure_threshold = 5;

    /// Time spent OPEN before a HALF_OPEN attempt is permitted
    std::chrono::milliseconds reset_timeout{30000};

    /// Span of retained buckets for error-rate statistics
    std::chrono::milliseconds rolling_window{10000};

    /// Minimum window volume before error-rate tripping is considered;
    /// also the consecutive successes needed to close from HALF_OPEN
    uint32_t volume_threshold = 10;

    /// Window error rate (0-100) that opens the circuit
    double error_threshold_percentage = 50.0;

    /// Bucket rotation period
    std::chrono::milliseconds bucket_interval{1000};

    Fallback fallback;
    HealthCheck health_check;
};

/// Monotonic per-breaker totals
struct LifetimeMetrics {
    uint64_t requests = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    uint64_t timeouts = 0;
    uint64_t circuit_opens = 0;
    uint64_t rejected = 0;  // Calls refused while OPEN
};

/// Point-in-time view of a breaker
struct BreakerStatus {
    std::string name;
    CircuitState state = CircuitState::CLOSED;
    LifetimeMetrics lifetime;
    WindowMetrics window;
    double error_rate = 0.0;          // Window error percentage
    double average_latency_ms = 0.0;  // Over the last MAX_LATENCY_SAMPLES successes
    uint32_t consecutive_failures = 0;
    uint32_t consecutive_successes = 0;
    std::optional<std::chrono::milliseconds> next_attempt_in;  // Only while OPEN
    std::chrono::system_clock::time_point last_state_change;
    std::vector<ErrorRateSample> error_rate_history;
    size_t abandoned_calls = 0;  // Timed-out operations still running
    std::string last_health_check_error;  // Empty after a passing probe

    /// Configuration without the hook callables
    CircuitBreakerConfig config;
    bool has_fallback = false;
    bool has_health_check = false;
};

/// Circuit breaker for one downstream dependency
///
/// State machine:
///   CLOSED → OPEN (failure_threshold consecutive failures, or window error
///                  rate >= error_threshold_percentage with volume_threshold calls)
///   OPEN → HALF_OPEN (call attempted after reset_timeout, or health check passes)
///   HALF_OPEN → CLOSED (volume_threshold consecutive successes)
///   HALF_OPEN → OPEN (any failure)
///
/// Thread-safety: execute() and the administrative operations may be called
/// concurrently from any thread. State, buckets and consecutive counters are
/// guarded by a mutex; lifetime counters are atomic for lock-free reads.
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    /// Latency samples kept for the average
    static constexpr size_t MAX_LATENCY_SAMPLES = 100;

    /// Parked (timed-out, still running) operations before a warning is logged
    static constexpr size_t ABANDONED_WARNING_THRESHOLD = 100;

    explicit CircuitBreaker(CircuitBreakerConfig config, EventSinks sinks = {});
    ~CircuitBreaker();

    // Non-copyable, non-movable (owns timer threads)
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    /// Start bucket rotation and health-check recovery threads
    void start();

    /// Stop and join the background threads
    void stop();

    [[nodiscard]] bool is_running() const;

    /// Run `operation(args...)`, which must return a std::future, under
    /// breaker protection. A deferred future is evaluated on its own thread so
    /// the timeout still bounds it. Timed-out futures are kept until they
    /// settle; destroying the breaker waits for parked std::async futures.
    ///
    /// Returns the future's value. Throws BreakerError (CIRCUIT_OPEN, TIMEOUT)
    /// or the operation's own exception, unless a fallback is configured, in
    /// which case the fallback's value or exception is the outcome.
    template <typename Fn, typename... Args>
    auto execute(Fn&& operation, Args&&... args)
        -> decltype(std::declval<std::invoke_result_t<Fn&&, Args&&...>&>().get());

    /// Open the circuit now (no-op when already OPEN)
    void force_open();

    /// Close the circuit now (no-op when already CLOSED)
    void force_close();

    /// Return to CLOSED and clear consecutive counters and the rolling window
    void reset();

    /// Run the configured health check, or report state == CLOSED without one.
    /// Runs on the calling thread; exceptions thrown by the hook propagate.
    [[nodiscard]] bool health_check();

    /// Advance the rolling window by one bucket (called by the rotation thread)
    void rotate_buckets();

    [[nodiscard]] BreakerStatus get_status() const;

    [[nodiscard]] CircuitState get_state() const;
    [[nodiscard]] uint32_t consecutive_failures() const;
    [[nodiscard]] uint32_t consecutive_successes() const;
    [[nodiscard]] std::optional<Clock::time_point> next_attempt_at() const;
    [[nodiscard]] WindowMetrics window_metrics() const;
    [[nodiscard]] LifetimeMetrics lifetime_metrics() const noexcept;

    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }
    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    using EventBatch = std::vector<BreakerEvent>;

    /// Admission: fail fast when OPEN, move to HALF_OPEN when due, count the
    /// request. Returns the admitting bucket's sequence, nullopt when refused.
    [[nodiscard]] std::optional<uint64_t> admit();

    void on_success(Clock::time_point started, uint64_t bucket);
    void on_failure(FailureKind kind, std::string reason, Clock::time_point started,
                    uint64_t bucket);

    [[nodiscard]] std::exception_ptr make_open_error() const;
    [[nodiscard]] std::exception_ptr make_timeout_error() const;

    /// Substitute the fallback's outcome for `error`, or rethrow it
    template <typename T>
    T recover(const std::exception_ptr& error);

    /// Keep a timed-out future alive until it settles
    template <typename Future>
    void park(Future&& pending);
    void park_settled(std::function<bool()> settled);
    void release_settled();

    // Transitions (caller holds mutex_; idempotent in the target state)
    void to_open(Clock::time_point now, std::string reason, EventBatch& events);
    void to_half_open(Clock::time_point now, std::string reason, EventBatch& events);
    void to_closed(Clock::time_point now, std::string reason, EventBatch& events);

    [[nodiscard]] bool should_open(Clock::time_point now) const;

    /// Recovery timer callback: probe the dependency while OPEN
    [[nodiscard]] std::optional<Clock::time_point> run_recovery_probe();

    void publish(const EventBatch& events) const;

    const CircuitBreakerConfig config_;
    const EventSinks sinks_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint32_t consecutive_failures_ = 0;
    uint32_t consecutive_successes_ = 0;
    std::optional<Clock::time_point> next_attempt_at_;
    std::optional<Clock::time_point> last_failure_time_;
    std::chrono::system_clock::time_point last_state_change_;
    uint64_t open_epoch_ = 0;  // Bumped on every entry to OPEN and on reset
    std::string last_health_check_error_;
    RollingWindow window_;
    std::deque<std::chrono::microseconds> latencies_;

    // Metrics (atomic for cross-thread observability)
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> total_successes_{0};
    std::atomic<uint64_t> total_failures_{0};
    std::atomic<uint64_t> total_timeouts_{0};
    std::atomic<uint64_t> circuit_opens_{0};
    std::atomic<uint64_t> rejected_requests_{0};

    mutable std::mutex abandoned_mutex_;
    std::vector<std::function<bool()>> abandoned_;
    bool abandoned_warned_ = false;  // Reset once the parked set shrinks below the threshold

    core::DeadlineTimer rotation_timer_;
    core::DeadlineTimer recovery_timer_;
};

// Template implementation

template <typename Fn, typename... Args>
auto CircuitBreaker::execute(Fn&& operation, Args&&... args)
    -> decltype(std::declval<std::invoke_result_t<Fn&&, Args&&...>&>().get()) {
    using Future = std::invoke_result_t<Fn&&, Args&&...>;
    using T = decltype(std::declval<Future&>().get());
    static_assert(!std::is_reference_v<T>, "execute() requires a value or void future");

    auto bucket = admit();
    if (!bucket) {
        return recover<T>(make_open_error());
    }

    auto started = Clock::now();
    std::exception_ptr error;
    Future pending;

    try {
        pending = std::invoke(std::forward<Fn>(operation), std::forward<Args>(args)...);
    } catch (...) {
        error = std::current_exception();
    }

    if (!error) {
        auto status = pending.wait_for(config_.timeout);
        if (status == std::future_status::deferred) {
            // get() would run the work here with no bound; race it on its own thread
            pending = core::run_detached(
                [deferred = std::move(pending)]() mutable { return deferred.get(); });
            status = pending.wait_for(config_.timeout);
        }

        if (status == std::future_status::timeout) {
            on_failure(FailureKind::Timeout, "timed out", started, *bucket);
            park(std::move(pending));
            return recover<T>(make_timeout_error());
        }

        if constexpr (std::is_void_v<T>) {
            try {
                pending.get();
            } catch (...) {
                error = std::current_exception();
            }
            if (!error) {
                on_success(started, *bucket);
                return;
            }
        } else {
            std::optional<T> result;
            try {
                result.emplace(pending.get());
            } catch (...) {
                error = std::current_exception();
            }
            if (!error) {
                on_success(started, *bucket);
                return std::move(*result);
            }
        }
    }

    std::string reason;
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        reason = e.what();
    } catch (...) {
        reason = "non-standard exception";
    }
    on_failure(FailureKind::Error, std::move(reason), started, *bucket);
    return recover<T>(error);
}

template <typename T>
T CircuitBreaker::recover(const std::exception_ptr& error) {
    if (!config_.fallback) {
        std::rethrow_exception(error);
    }

    std::any value = config_.fallback(error);
    if constexpr (std::is_void_v<T>) {
        return;
    } else {
        return std::any_cast<T>(std::move(value));
    }
}

template <typename Future>
void CircuitBreaker::park(Future&& pending) {
    auto shared = std::make_shared<std::decay_t<Future>>(std::forward<Future>(pending));
    park_settled([shared]() {
        return shared->wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
}

}  // namespace tripwire::resilience
