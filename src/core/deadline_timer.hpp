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

// Tripwire Deadline Timer - Header
// Background thread that fires a callback when an armed deadline expires

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace tripwire::core {

/// Cancelable one-shot/periodic timer backed by a dedicated thread.
///
/// The callback runs on the timer thread without any timer lock held and
/// returns the next deadline (periodic use) or std::nullopt to disarm.
/// A deadline armed while the callback is running wins over the value the
/// callback returns.
///
/// Thread-safety: arm()/disarm()/stop() may be called from any thread,
/// including from inside the callback (except stop()).
class DeadlineTimer {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<std::optional<Clock::time_point>()>;

    explicit DeadlineTimer(Callback callback);
    ~DeadlineTimer();

    // Non-copyable, non-movable (owns thread)
    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;
    DeadlineTimer(DeadlineTimer&&) = delete;
    DeadlineTimer& operator=(DeadlineTimer&&) = delete;

    /// Start the timer thread (no-op if already running)
    void start();

    /// Stop and join the timer thread, dropping any pending deadline
    void stop();

    /// Schedule the callback at `deadline`, replacing any pending one
    void arm(Clock::time_point deadline);

    /// Schedule the callback `delay` from now
    void arm_after(std::chrono::milliseconds delay) { arm(Clock::now() + delay); }

    /// Drop the pending deadline (a callback already running still completes)
    void disarm();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] bool is_armed() const;

    /// Number of times the callback has fired
    [[nodiscard]] uint64_t fire_count() const;

private:
    void run_loop();

    Callback callback_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Clock::time_point> deadline_;
    uint64_t generation_ = 0;  // Bumped by every arm()/disarm()
    uint64_t fires_ = 0;
    bool running_ = false;

    std::unique_ptr<std::thread> thread_;
};

}  // namespace tripwire::core
