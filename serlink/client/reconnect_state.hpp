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

#include "serlink/client/reconnect_policy.hpp"
#include "serlink/config/client_config.hpp"
#include "serlink/diagnostics/error_types.hpp"

namespace serlink {
namespace client {

/**
 * @brief Consecutive-failure counter and retry delay of the reconnect loop
 *
 * A lost connection counts as a failure like a refused connect, so the first
 * retry after either waits the base delay. Delays never decrease while
 * failures accumulate and return to the base delay on success.
 * Not thread-safe: owned and mutated by the reconnect loop only.
 */
class ReconnectState {
 public:
  explicit ReconnectState(const config::ClientConfig& cfg);
  ReconnectState(std::chrono::milliseconds base, std::chrono::milliseconds cap, int max_retries);

  /**
   * @brief Record a failed attempt and decide whether and when to retry
   */
  detail::ReconnectLogicDecision on_failure(const diagnostics::ErrorInfo& error);

  /**
   * @brief Record a successful connection; the next delay is the base again
   */
  void on_success();

  uint32_t failures() const noexcept { return failures_; }
  std::chrono::milliseconds next_delay() const noexcept { return next_delay_; }
  std::chrono::milliseconds base_delay() const noexcept { return base_; }
  std::chrono::milliseconds cap() const noexcept { return cap_; }
  int max_retries() const noexcept { return max_retries_; }
  bool exhausted() const noexcept { return exhausted_; }

 private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds cap_;
  int max_retries_;
  ReconnectPolicy policy_;

  uint32_t failures_ = 0;
  std::chrono::milliseconds next_delay_;
  bool exhausted_ = false;
};

}  // namespace client
}  // namespace serlink
