/*
 * Copyright 2025 Jinwoo Sung
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

#pragma once

#include <atomic>

namespace serlink {
namespace concurrency {

/**
 * @brief Lock-free state holder for enum state machines
 */
template <typename StateType>
class AtomicState {
 public:
  using State = StateType;

  explicit AtomicState(const State& initial_state = State{}) : state_(initial_state) {}

  State get() const noexcept { return state_.load(std::memory_order_acquire); }

  void set(const State& new_state) noexcept { state_.store(new_state, std::memory_order_release); }

  bool compare_and_set(State expected, const State& desired) noexcept {
    return state_.compare_exchange_strong(expected, desired, std::memory_order_acq_rel);
  }

  State exchange(const State& new_state) noexcept { return state_.exchange(new_state, std::memory_order_acq_rel); }

  bool is_state(const State& expected_state) const noexcept { return get() == expected_state; }

 private:
  std::atomic<State> state_;
};

}  // namespace concurrency
}  // namespace serlink
