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

#include "serlink/concurrency/signal_watcher.hpp"

#include <string>

#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace concurrency {

SignalWatcher::SignalWatcher(std::shared_ptr<ShutdownToken> token, std::initializer_list<int> signals)
    : token_(std::move(token)), signals_(ioc_) {
  for (int sig : signals) {
    signals_.add(sig);
  }
}

SignalWatcher::~SignalWatcher() { stop(); }

void SignalWatcher::start() {
  if (running_.exchange(true)) {
    return;
  }
  do_wait();
  thread_ = std::thread([this] { ioc_.run(); });
}

void SignalWatcher::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  ioc_.stop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void SignalWatcher::do_wait() {
  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;  // operation_aborted on stop()
    }
    last_signal_.store(signal_number);
    SERLINK_LOG_INFO("signal", "receive", "Received signal " + std::to_string(signal_number) + ", shutting down");
    token_->request_stop();
    // A second signal while shutting down is still consumed here
    do_wait();
  });
}

}  // namespace concurrency
}  // namespace serlink
