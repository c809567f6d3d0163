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

#include "serlink/concurrency/cleanup_registry.hpp"

#include <algorithm>
#include <cstdlib>

#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace concurrency {

namespace {
void run_cleanup_at_exit() { CleanupRegistry::instance().run_all(); }
}  // namespace

CleanupRegistry& CleanupRegistry::instance() {
  // Logger must outlive the atexit hook that may log through it
  diagnostics::Logger::instance();
  static CleanupRegistry instance;
  static const bool hooked = [] {
    if (std::atexit(run_cleanup_at_exit) != 0) {
      SERLINK_LOG_WARNING("cleanup", "init", "Failed to install atexit cleanup hook");
      return false;
    }
    return true;
  }();
  (void)hooked;
  return instance;
}

CleanupRegistry::Handle CleanupRegistry::add(std::string name, Action action) {
  std::lock_guard<std::mutex> lock(mutex_);
  const Handle handle = next_handle_++;
  entries_.push_back(Entry{handle, std::move(name), std::move(action)});
  return handle;
}

void CleanupRegistry::remove(Handle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [handle](const Entry& entry) { return entry.handle == handle; }),
                 entries_.end());
}

void CleanupRegistry::run_all() {
  std::vector<Entry> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending.swap(entries_);
  }

  for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
    try {
      it->action();
    } catch (const std::exception& e) {
      SERLINK_LOG_ERROR("cleanup", "run", "Cleanup of " + it->name + " failed: " + e.what());
    }
  }
}

size_t CleanupRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace concurrency
}  // namespace serlink
