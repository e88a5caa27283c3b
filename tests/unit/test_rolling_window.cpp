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

// Unit tests for the rolling window aggregator

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "resilience/rolling_window.hpp"

using namespace tripwire::resilience;
using namespace std::chrono_literals;

namespace {

// One admitted call with its outcome, recorded in the current bucket
void record_call(RollingWindow& window, bool success) {
    auto bucket = window.record_request();
    if (success) {
        REQUIRE(window.record_success(bucket));
    } else {
        REQUIRE(window.record_failure(bucket));
    }
}

}  // namespace

TEST_CASE("RollingWindow - Metrics include the current bucket", "[rolling_window]") {
    auto t0 = RollingWindow::Clock::now();
    RollingWindow window(1000ms, t0);

    record_call(window, true);
    record_call(window, true);
    record_call(window, false);

    auto metrics = window.metrics(t0);
    REQUIRE(metrics.total == 3);
    REQUIRE(metrics.successes == 2);
    REQUIRE(metrics.failures == 1);
    REQUIRE(metrics.timeouts == 0);
    REQUIRE(metrics.error_rate() == Catch::Approx(100.0 / 3.0));
    REQUIRE(window.retained_buckets() == 0);
}

TEST_CASE("RollingWindow - Timeouts count as failures", "[rolling_window]") {
    auto t0 = RollingWindow::Clock::now();
    RollingWindow window(1000ms, t0);

    auto bucket = window.record_request();
    REQUIRE(window.record_timeout(bucket));

    auto metrics = window.metrics(t0);
    REQUIRE(metrics.failures == 1);
    REQUIRE(metrics.timeouts == 1);
    REQUIRE(window.current().timeouts == 1);
}

TEST_CASE("RollingWindow - In-flight requests count before their outcome", "[rolling_window]") {
    auto t0 = RollingWindow::Clock::now();
    RollingWindow window(1000ms, t0);

    (void)window.record_request();
    record_call(window, false);

    auto metrics = window.metrics(t0);
    REQUIRE(metrics.total == 2);
    REQUIRE(metrics.failures == 1);
    REQUIRE(metrics.error_rate() == Catch::Approx(50.0));
}

TEST_CASE("RollingWindow - Rotation starts a fresh bucket", "[rolling_window]") {
    auto t0 = RollingWindow::Clock::now();
    RollingWindow window(1000ms, t0);

    auto first = window.current().sequence;
    record_call(window, false);
    window.rotate(t0 + 100ms);

    REQUIRE(window.retained_buckets() == 1);
    REQUIRE(window.current().requests == 0);
    REQUIRE(window.current().started_at == t0 + 100ms);
    REQUIRE(window.current().sequence == first + 1);

    // Rotated bucket still inside the window
    auto metrics = window.metrics(t0 + 100ms);
    REQUIRE(metrics.total == 1);
    REQUIRE(metrics.failures == 1);
}

TEST_CASE("RollingWindow - Outcome lands in the admitting bucket", "[rolling_window]") {
    auto t0 = RollingWindow::Clock::now();
    RollingWindow window(1000ms, t0);

    auto bucket = window.record_request();
    window.rotate(t0 + 100ms);
    window.rotate(t0 + 200ms);

    // Call settles two rotations later
    REQUIRE(window.record_failure(bucket));
    REQUIRE(window.current().failures == 0);

    auto metrics = window.metrics(t0 + 200ms);
    REQUIRE(metrics.total == 1);
    REQUIRE(metrics.failures == 1);
    REQUIRE(metrics.successes + metrics.failures <= metrics.total);
}

TEST_CASE("RollingWindow - Outcome of a pruned bucket is dropped", "[rolling_window]") {
    auto t0 = RollingWindow::Clock::now();
    RollingWindow window(50ms, t0);

    auto bucket = window.record_request();
    window.rotate(t0 + 80ms);
    window.rotate(t0 + 160ms);

    REQUIRE_FALSE(window.record_failure(bucket));

    // Later traffic is unaffected by the stale outcome
    record_call(window, true);
    auto metrics = window.metrics(t0 + 160ms);
    REQUIRE(metrics.total == 1);
    REQUIRE(metrics.successes == 1);
    REQUIRE(metrics.failures == 0);
    REQUIRE(metrics.error_rate() == 0.0);
}

TEST_CASE("RollingWindow - Prunes buckets older than the window", "[rolling_window]") {
    auto t0 = RollingWindow::Clock::now();
    RollingWindow window(1000ms, t0);

    record_call(window, false);
    window.rotate(t0 + 100ms);
    REQUIRE(window.retained_buckets() == 1);

    SECTION("Rotation drops expired buckets") {
        window.rotate(t0 + 1100ms);

        // Bucket from t0 dropped, empty bucket from t0+100ms kept
        REQUIRE(window.retained_buckets() == 1);
        REQUIRE(window.metrics(t0 + 1100ms).total == 0);
    }

    SECTION("Metrics ignore expired buckets between rotations") {
        REQUIRE(window.metrics(t0 + 500ms).total == 1);
        REQUIRE(window.metrics(t0 + 1500ms).total == 0);
    }
}

TEST_CASE("RollingWindow - Error rate history", "[rolling_window]") {
    auto t0 = RollingWindow::Clock::now();
    RollingWindow window(10000ms, t0);

    SECTION("No sample for an idle window") {
        window.rotate(t0 + 1000ms);
        REQUIRE(window.error_rate_history().empty());
    }

    SECTION("Sample taken after rotation") {
        record_call(window, true);
        record_call(window, false);
        window.rotate(t0 + 1000ms);

        auto history = window.error_rate_history();
        REQUIRE(history.size() == 1);
        REQUIRE(history[0].rate == Catch::Approx(50.0));
        REQUIRE(history[0].at == t0 + 1000ms);
    }

    SECTION("Bounded to the most recent samples") {
        for (int i = 1; i <= 150; ++i) {
            record_call(window, true);
            window.rotate(t0 + std::chrono::milliseconds(i));
        }
        REQUIRE(window.error_rate_history().size() == RollingWindow::MAX_RATE_SAMPLES);
    }
}

TEST_CASE("RollingWindow - Clear empties everything", "[rolling_window]") {
    auto t0 = RollingWindow::Clock::now();
    RollingWindow window(1000ms, t0);

    record_call(window, false);
    window.rotate(t0 + 100ms);
    auto in_flight = window.record_request();

    window.clear(t0 + 200ms);

    REQUIRE(window.retained_buckets() == 0);
    REQUIRE(window.metrics(t0 + 200ms).total == 0);
    REQUIRE(window.error_rate_history().empty());
    REQUIRE(window.current().started_at == t0 + 200ms);

    // Calls admitted before the clear no longer count
    REQUIRE_FALSE(window.record_success(in_flight));
    REQUIRE(window.metrics(t0 + 200ms).successes == 0);
}
