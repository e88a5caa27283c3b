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

// Tripwire Deadline Timer - Implementation

#include "deadline_timer.hpp"

#include <utility>

namespace tripwire::core {

DeadlineTimer::DeadlineTimer(Callback callback) : callback_(std::move(callback)) {}

DeadlineTimer::~DeadlineTimer() {
    stop();
}

void DeadlineTimer::start() {
    std::lock_guard lock(mutex_);
    if (running_) {
        return;  // Already running
    }
    running_ = true;
    thread_ = std::make_unique<std::thread>(&DeadlineTimer::run_loop, this);
}

void DeadlineTimer::stop() {
    std::unique_ptr<std::thread> thread;
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;  // Not running
        }
        running_ = false;
        deadline_.reset();
        ++generation_;
        thread = std::move(thread_);
    }
    cv_.notify_all();

    if (thread && thread->joinable()) {
        thread->join();
    }
}

void DeadlineTimer::arm(Clock::time_point deadline) {
    {
        std::lock_guard lock(mutex_);
        deadline_ = deadline;
        ++generation_;
    }
    cv_.notify_all();
}

void DeadlineTimer::disarm() {
    {
        std::lock_guard lock(mutex_);
        deadline_.reset();
        ++generation_;
    }
    cv_.notify_all();
}

bool DeadlineTimer::is_running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

bool DeadlineTimer::is_armed() const {
    std::lock_guard lock(mutex_);
    return deadline_.has_value();
}

uint64_t DeadlineTimer::fire_count() const {
    std::lock_guard lock(mutex_);
    return fires_;
}

void DeadlineTimer::run_loop() {
    std::unique_lock lock(mutex_);

    while (running_) {
        if (!deadline_) {
            cv_.wait(lock, [this] { return !running_ || deadline_.has_value(); });
            continue;
        }

        auto deadline = *deadline_;
        if (Clock::now() < deadline) {
            // Woken early by arm()/disarm()/stop() or spuriously; re-evaluate
            cv_.wait_until(lock, deadline);
            continue;
        }

        deadline_.reset();
        uint64_t generation = generation_;
        ++fires_;

        lock.unlock();
        std::optional<Clock::time_point> next = callback_();
        lock.lock();

        // arm()/disarm() during the callback takes precedence
        if (running_ && generation == generation_ && next) {
            deadline_ = next;
        }
    }
}

}  // namespace tripwire::core
