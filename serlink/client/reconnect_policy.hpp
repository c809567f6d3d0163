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

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

#include "serlink/base/constants.hpp"
#include "serlink/diagnostics/error_types.hpp"

namespace serlink {
namespace client {

/**
 * @brief Whether to dial again after a failure, and after how long
 */
struct ReconnectDecision {
  bool retry{false};
  std::chrono::milliseconds delay{0};
};

/**
 * @brief Maps the last failure and the 0-based retry index to a decision
 */
using ReconnectPolicy = std::function<ReconnectDecision(const diagnostics::ErrorInfo&, uint32_t)>;

/**
 * @brief Doubling backoff: retry n waits min(base * 2^n, cap)
 *
 * Delays never decrease with n, so consecutive waits are monotonic.
 */
inline ReconnectPolicy ExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds cap) {
  return [base, cap](const diagnostics::ErrorInfo& error_info, uint32_t retry) -> ReconnectDecision {
    if (!error_info.retryable) {
      return {};
    }
    auto delay = base;
    for (uint32_t i = 0; i < retry && delay < cap; ++i) {
      delay *= 2;
    }
    return {true, delay < cap ? delay : cap};
  };
}

namespace detail {

constexpr auto MAX_RECONNECT_DELAY = std::chrono::milliseconds(base::constants::MAX_BACKOFF_MS);

struct ReconnectLogicDecision {
  bool should_retry{false};
  std::optional<std::chrono::milliseconds> delay{std::nullopt};
};

/**
 * @brief Applies the retry limit, then the policy
 *
 * @param max_retries -1 for unlimited, 0 for none, N for N retries.
 * @param retry 0-based index of the retry being considered.
 * @param policy Without one the caller picks the delay.
 */
inline ReconnectLogicDecision decide_reconnect(int max_retries, const diagnostics::ErrorInfo& error_info,
                                               uint32_t retry, const ReconnectPolicy& policy) {
  const bool limited = max_retries >= 0;
  if (!error_info.retryable || (limited && retry >= static_cast<uint32_t>(max_retries))) {
    return {};
  }
  if (!policy) {
    return {true, std::nullopt};
  }

  const auto decision = policy(error_info, retry);
  if (!decision.retry) {
    return {};
  }
  if (decision.delay.count() < 0) {
    return {true, std::chrono::milliseconds(0)};
  }
  return {true, decision.delay > MAX_RECONNECT_DELAY ? MAX_RECONNECT_DELAY : decision.delay};
}

}  // namespace detail
}  // namespace client
}  // namespace serlink
