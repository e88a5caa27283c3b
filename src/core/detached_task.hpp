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

// Tripwire Detached Task
// Runs work on its own thread and hands back a future that never blocks on destruction

#pragma once

#include <exception>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

namespace tripwire::core {

/// Run `work` on a detached thread.
///
/// Unlike a std::async future, the returned future can be abandoned (after a
/// timeout) without its destructor waiting for `work` to finish. `work` owns
/// everything it touches; it may outlive the caller.
template <typename Work>
[[nodiscard]] std::future<std::invoke_result_t<Work&>> run_detached(Work work) {
    using Result = std::invoke_result_t<Work&>;

    std::promise<Result> promise;
    auto result = promise.get_future();

    std::thread([work = std::move(work), promise = std::move(promise)]() mutable {
        try {
            if constexpr (std::is_void_v<Result>) {
                work();
                promise.set_value();
            } else {
                promise.set_value(work());
            }
        } catch (...) {
            // Delivered to whoever still holds the future
            promise.set_exception(std::current_exception());
        }
    }).detach();

    return result;
}

}  // namespace tripwire::core
