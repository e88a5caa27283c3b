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

// Tripwire Breaker Events - Implementation

#include "events.hpp"

#include "../core/logging.hpp"

namespace tripwire::resilience {

EventSink make_logging_sink(quill::Logger* logger) {
    return [logger](const BreakerEvent& event) {
        if (logger == nullptr) {
            return;
        }

        switch (event.type) {
            case BreakerEventType::Success:
                LOG_DEBUG(logger, "Circuit breaker {} call succeeded: duration_ms={}, state={}",
                          event.breaker, event.duration.count(), to_string(event.state));
                break;

            case BreakerEventType::Failure:
                LOG_BREAKER_FAILURE(logger, event.breaker, to_string(event.failure_kind),
                                    event.reason, event.duration.count(),
                                    to_string(event.state));
                break;

            case BreakerEventType::Open:
                LOG_WARNING(logger,
                            "Circuit breaker {} opened: consecutive_failures={}, reason={}",
                            event.breaker, event.consecutive_failures, event.reason);
                break;

            case BreakerEventType::HalfOpen:
                LOG_BREAKER_TRANSITION(logger, event.breaker, to_string(event.previous_state),
                                       to_string(event.state), event.reason);
                break;

            case BreakerEventType::Close:
                LOG_BREAKER_TRANSITION(
                    logger, event.breaker, to_string(event.previous_state),
                    to_string(event.state),
                    event.recovery_time
                        ? "recovered after " + std::to_string(event.recovery_time->count()) + "ms"
                        : event.reason);
                break;

            case BreakerEventType::Reset:
                LOG_INFO(logger, "Circuit breaker {} reset to CLOSED", event.breaker);
                break;
        }
    };
}

}  // namespace tripwire::resilience
