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

// Tripwire Containers
// Hash map aliases backed by ankerl::unordered_dense

#pragma once

#include <ankerl/unordered_dense.h>

namespace tripwire::core {

// Dense open-addressing map: contiguous storage, fast iteration over all
// entries (status snapshots walk every breaker). Iterators invalidate on
// insertion like std::vector, so never hold one across an emplace.
//
// Usage:
//   tripwire::core::fast_map<std::string, std::shared_ptr<CircuitBreaker>> breakers;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

}  // namespace tripwire::core
