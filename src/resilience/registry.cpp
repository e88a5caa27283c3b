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

// Tripwire Breaker Registry - Implementation

#include "registry.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace tripwire::resilience {

BreakerRegistry::BreakerRegistry(EventSinks sinks) : sinks_(std::move(sinks)) {}

BreakerRegistry::~BreakerRegistry() {
    // Stop timers even if callers still hold references
    for (const auto& breaker : get_all_breakers()) {
        breaker->stop();
    }
}

std::shared_ptr<CircuitBreaker> BreakerRegistry::get_breaker(const std::string& name,
                                                             CircuitBreakerConfig config) {
    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(mutex_);
        auto it = breakers_.find(name);
        if (it != breakers_.end()) {
            return it->second;
        }
    }

    // Slow path: unique lock, re-check so racing creators agree on one instance
    std::unique_lock lock(mutex_);
    auto it = breakers_.find(name);
    if (it != breakers_.end()) {
        return it->second;
    }

    config.name = name;
    auto breaker = std::make_shared<CircuitBreaker>(std::move(config), sinks_);
    breaker->start();
    breakers_.emplace(name, breaker);
    return breaker;
}

std::shared_ptr<CircuitBreaker> BreakerRegistry::find_breaker(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = breakers_.find(std::string(name));
    if (it == breakers_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<CircuitBreaker>> BreakerRegistry::get_all_breakers() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<CircuitBreaker>> result;
    result.reserve(breakers_.size());
    for (const auto& [name, breaker] : breakers_) {
        result.push_back(breaker);
    }
    return result;
}

std::vector<BreakerStatus> BreakerRegistry::get_all_statuses() const {
    // Snapshot outside the registry lock; breakers lock themselves
    auto breakers = get_all_breakers();

    std::vector<BreakerStatus> statuses;
    statuses.reserve(breakers.size());
    for (const auto& breaker : breakers) {
        statuses.push_back(breaker->get_status());
    }

    std::sort(statuses.begin(), statuses.end(),
              [](const BreakerStatus& a, const BreakerStatus& b) { return a.name < b.name; });
    return statuses;
}

void BreakerRegistry::reset_all() {
    for (const auto& breaker : get_all_breakers()) {
        breaker->reset();
    }
}

bool BreakerRegistry::remove_breaker(std::string_view name) {
    std::shared_ptr<CircuitBreaker> evicted;
    {
        std::unique_lock lock(mutex_);
        auto it = breakers_.find(std::string(name));
        if (it == breakers_.end()) {
            return false;
        }
        evicted = std::move(it->second);
        breakers_.erase(it);
    }
    // Last reference (if ours) is dropped here, joining the breaker's timers
    // outside the registry lock
    return true;
}

size_t BreakerRegistry::size() const {
    std::shared_lock lock(mutex_);
    return breakers_.size();
}

}  // namespace tripwire::resilience
