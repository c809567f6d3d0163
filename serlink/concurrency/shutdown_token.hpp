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
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace serlink {
namespace concurrency {

/**
 * @brief Cooperative cancellation shared by every long-running component
 *
 * request_stop() is idempotent. It wakes interruptible sleeps, runs the
 * registered stop callbacks once and makes wakeup_fd() permanently readable,
 * so a poll() that includes that descriptor returns at once.
 */
class ShutdownToken {
 public:
  using StopCallback = std::function<void()>;
  using CallbackId = uint64_t;

  /**
   * @throws boost::system::system_error if the wakeup pipe cannot be created
   */
  ShutdownToken();
  ~ShutdownToken();

  ShutdownToken(const ShutdownToken&) = delete;
  ShutdownToken& operator=(const ShutdownToken&) = delete;

  void request_stop();
  bool stop_requested() const noexcept { return stopped_.load(std::memory_order_acquire); }

  /**
   * @brief Read end of the wakeup pipe, readable once stop was requested
   */
  int wakeup_fd() const noexcept { return pipe_fds_[0]; }

  /**
   * @brief Interruptible sleep
   * @return true if stop was requested before or during the wait
   */
  bool wait_for(std::chrono::milliseconds duration);

  /**
   * @brief Register a callback run on request_stop(); runs immediately if already stopped
   */
  CallbackId add_stop_callback(StopCallback callback);

  /**
   * @brief Unregister a callback. Once this returns the callback is not running.
   */
  void remove_stop_callback(CallbackId id);

 private:
  std::atomic<bool> stopped_{false};
  int pipe_fds_[2] = {-1, -1};

  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  std::recursive_mutex callbacks_mutex_;
  std::map<CallbackId, StopCallback> callbacks_;
  CallbackId next_id_ = 1;
};

}  // namespace concurrency
}  // namespace serlink
