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

#include "serlink/client/reconnect_state.hpp"

#include <algorithm>

namespace serlink {
namespace client {

ReconnectState::ReconnectState(const config::ClientConfig& cfg)
    : ReconnectState(std::chrono::milliseconds(cfg.backoff_base_ms), std::chrono::milliseconds(cfg.backoff_cap_ms),
                     cfg.max_retries) {}

ReconnectState::ReconnectState(std::chrono::milliseconds base, std::chrono::milliseconds cap, int max_retries)
    : base_(base),
      cap_(std::max(base, cap)),
      max_retries_(max_retries),
      policy_(ExponentialBackoff(base_, cap_)),
      next_delay_(base_) {}

detail::ReconnectLogicDecision ReconnectState::on_failure(const diagnostics::ErrorInfo& error) {
  ++failures_;
  auto decision = detail::decide_reconnect(max_retries_, error, failures_ - 1, policy_);
  if (!decision.should_retry) {
    exhausted_ = error.retryable;
    return decision;
  }
  if (!decision.delay) {
    decision.delay = next_delay_;
  }
  next_delay_ = *decision.delay;
  return decision;
}

void ReconnectState::on_success() {
  failures_ = 0;
  next_delay_ = base_;
  exhausted_ = false;
}

}  // namespace client
}  // namespace serlink
