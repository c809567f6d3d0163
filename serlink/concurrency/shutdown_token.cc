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

#include "serlink/concurrency/shutdown_token.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <boost/system/system_error.hpp>
#include <cerrno>
#include <vector>

#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace concurrency {

ShutdownToken::ShutdownToken() {
  if (::pipe2(pipe_fds_, O_NONBLOCK | O_CLOEXEC) != 0) {
    throw boost::system::system_error(boost::system::error_code(errno, boost::system::system_category()),
                                      "shutdown token pipe");
  }
}

ShutdownToken::~ShutdownToken() {
  for (int& fd : pipe_fds_) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
}

void ShutdownToken::request_stop() {
  if (stopped_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  const char byte = 1;
  // The pipe is never drained, one byte keeps it readable forever
  if (::write(pipe_fds_[1], &byte, 1) < 0 && errno != EAGAIN) {
    SERLINK_LOG_WARNING("shutdown", "request_stop", "Failed to signal wakeup pipe, pollers fall back to timeouts");
  }

  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
  }
  wait_cv_.notify_all();

  std::lock_guard<std::recursive_mutex> lock(callbacks_mutex_);
  auto callbacks = callbacks_;
  for (auto& entry : callbacks) {
    try {
      entry.second();
    } catch (const std::exception& e) {
      SERLINK_LOG_ERROR("shutdown", "callback", "Stop callback failed: " + std::string(e.what()));
    }
  }
}

bool ShutdownToken::wait_for(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  return wait_cv_.wait_for(lock, duration, [this] { return stop_requested(); });
}

ShutdownToken::CallbackId ShutdownToken::add_stop_callback(StopCallback callback) {
  std::lock_guard<std::recursive_mutex> lock(callbacks_mutex_);
  const CallbackId id = next_id_++;
  if (stop_requested()) {
    callback();
    return id;
  }
  callbacks_.emplace(id, std::move(callback));
  return id;
}

void ShutdownToken::remove_stop_callback(CallbackId id) {
  std::lock_guard<std::recursive_mutex> lock(callbacks_mutex_);
  callbacks_.erase(id);
}

}  // namespace concurrency
}  // namespace serlink
