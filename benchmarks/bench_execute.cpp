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

// Tripwire Benchmarks - execute() overhead

#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include <future>
#include <stdexcept>

#include "resilience/circuit_breaker.hpp"
#include "resilience/registry.hpp"

using namespace tripwire::resilience;
using namespace std::chrono_literals;

namespace {

std::future<int> ready(int value) {
    std::promise<int> promise;
    promise.set_value(value);
    return promise.get_future();
}

}  // namespace

TEST_CASE("execute overhead", "[!benchmark]") {
    CircuitBreakerConfig config;
    config.name = "bench-api";
    config.failure_threshold = 1000000000;
    config.volume_threshold = 1000000000;

    CircuitBreaker breaker(config);

    BENCHMARK("raw future") {
        return ready(1).get();
    };

    BENCHMARK("execute success") {
        return breaker.execute([] { return ready(1); });
    };

    BENCHMARK("execute failure") {
        try {
            return breaker.execute([] {
                std::promise<int> promise;
                promise.set_exception(std::make_exception_ptr(std::runtime_error("down")));
                return promise.get_future();
            });
        } catch (const std::runtime_error&) {
            return -1;
        }
    };
}

TEST_CASE("fail-fast overhead", "[!benchmark]") {
    CircuitBreakerConfig config;
    config.name = "bench-open-api";
    config.reset_timeout = 3600000ms;
    config.fallback = [](const std::exception_ptr&) { return std::any(0); };

    CircuitBreaker breaker(config);
    breaker.force_open();

    BENCHMARK("execute rejected with fallback") {
        return breaker.execute([] { return ready(1); });
    };
}

TEST_CASE("registry lookup", "[!benchmark]") {
    BreakerRegistry registry;
    (void)registry.get_breaker("admin-api");
    (void)registry.get_breaker("customer-api");

    BENCHMARK("get_breaker existing") {
        return registry.get_breaker("customer-api");
    };

    BENCHMARK("get_all_statuses") {
        return registry.get_all_statuses();
    };
}
