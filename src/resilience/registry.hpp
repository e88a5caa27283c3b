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

// Tripwire Breaker Registry - Header
// Named get-or-create registry, one breaker per downstream dependency

#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "circuit_breaker.hpp"
#include "events.hpp"

namespace tripwire::resilience {

/// Registry of circuit breakers keyed by dependency name.
///
/// The registry owns breaker lifetime. Callers get a shared_ptr for the
/// duration of a call, so a breaker evicted by remove_breaker() stays valid
/// for calls already holding it. Breakers are started on creation and
/// stopped when the last reference goes away.
///
/// Thread-safety: all operations may be called concurrently. get_breaker()
/// never constructs two breakers for the same name.
class BreakerRegistry {
public:
    /// `sinks` are attached to every breaker the registry creates
    explicit BreakerRegistry(EventSinks sinks = {});
    ~BreakerRegistry();

    // Non-copyable, non-movable
    BreakerRegistry(const BreakerRegistry&) = delete;
    BreakerRegistry& operator=(const BreakerRegistry&) = delete;

    /// Existing breaker for `name`, or a new one built from `config`
    /// (config.name is overridden by `name`)
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get_breaker(const std::string& name,
                                                              CircuitBreakerConfig config = {});

    /// Lookup without creation (nullptr if absent)
    [[nodiscard]] std::shared_ptr<CircuitBreaker> find_breaker(std::string_view name) const;

    [[nodiscard]] std::vector<std::shared_ptr<CircuitBreaker>> get_all_breakers() const;

    [[nodiscard]] std::vector<BreakerStatus> get_all_statuses() const;

    /// Reset every breaker to CLOSED
    void reset_all();

    /// Evict `name`; returns false when no such breaker exists
    bool remove_breaker(std::string_view name);

    [[nodiscard]] size_t size() const;

private:
    EventSinks sinks_;

    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

}  // namespace tripwire::resilience
