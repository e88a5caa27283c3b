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

// Tripwire Breaker Errors - Implementation

#include "errors.hpp"

#include <utility>

namespace tripwire::resilience {

namespace {

class BreakerCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "tripwire.breaker"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<BreakerErrc>(ev)) {
            case BreakerErrc::circuit_open:
                return "circuit breaker is open";
            case BreakerErrc::timeout:
                return "operation timed out";
        }
        return "unknown circuit breaker error";
    }
};

}  // namespace

const std::error_category& breaker_category() noexcept {
    static const BreakerCategory category;
    return category;
}

BreakerError::BreakerError(BreakerErrc code, std::string breaker, const std::string& what)
    : std::system_error(make_error_code(code), what), breaker_(std::move(breaker)) {}

}  // namespace tripwire::resilience
