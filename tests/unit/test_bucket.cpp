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

// Unit tests for Bucket and WindowMetrics

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "resilience/bucket.hpp"

using namespace tripwire::resilience;

TEST_CASE("Bucket - Starts empty", "[bucket]") {
    Bucket bucket;

    REQUIRE(bucket.requests == 0);
    REQUIRE(bucket.successes == 0);
    REQUIRE(bucket.failures == 0);
    REQUIRE(bucket.timeouts == 0);
}

TEST_CASE("WindowMetrics - Error rate", "[bucket]") {
    SECTION("Zero when the window saw no traffic") {
        WindowMetrics metrics;
        REQUIRE(metrics.error_rate() == 0.0);
    }

    SECTION("Failures over total as a percentage") {
        WindowMetrics metrics{.total = 10, .successes = 4, .failures = 6, .timeouts = 2};
        REQUIRE(metrics.error_rate() == Catch::Approx(60.0));
    }

    SECTION("All failures is 100 percent") {
        WindowMetrics metrics{.total = 3, .successes = 0, .failures = 3, .timeouts = 0};
        REQUIRE(metrics.error_rate() == Catch::Approx(100.0));
    }

    SECTION("In-flight requests lower the rate") {
        // 2 requests still running: counted in total, not yet in failures
        WindowMetrics metrics{.total = 4, .successes = 1, .failures = 1, .timeouts = 0};
        REQUIRE(metrics.error_rate() == Catch::Approx(25.0));
    }
}
