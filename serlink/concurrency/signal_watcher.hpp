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
#include <boost/asio.hpp>
#include <csignal>
#include <initializer_list>
#include <memory>
#include <thread>

#include "serlink/concurrency/shutdown_token.hpp"

namespace serlink {
namespace concurrency {

namespace net = boost::asio;

/**
 * @brief Turns SIGINT/SIGTERM into a stop request on a ShutdownToken
 *
 * The signal_set is serviced by a private io_context on its own thread, so
 * no work happens in async-signal context.
 */
class SignalWatcher {
 public:
  explicit SignalWatcher(std::shared_ptr<ShutdownToken> token, std::initializer_list<int> signals = {SIGINT, SIGTERM});
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

  void start();
  void stop();

  /**
   * @brief Number of the last delivered signal, 0 if none
   */
  int last_signal() const noexcept { return last_signal_.load(); }

 private:
  void do_wait();

  std::shared_ptr<ShutdownToken> token_;
  net::io_context ioc_;
  net::signal_set signals_;
  std::thread thread_;
  std::atomic<int> last_signal_{0};
  std::atomic<bool> running_{false};
};

}  // namespace concurrency
}  // namespace serlink
