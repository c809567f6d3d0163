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

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace serlink {
namespace concurrency {

/**
 * @brief Process-wide list of release actions run exactly once at exit
 *
 * Actions run in reverse registration order, either explicitly through
 * run_all() or from the atexit hook installed by instance(), which covers
 * std::exit() and a normal return from main.
 */
class CleanupRegistry {
 public:
  using Action = std::function<void()>;
  using Handle = uint64_t;

  static CleanupRegistry& instance();

  CleanupRegistry() = default;
  CleanupRegistry(const CleanupRegistry&) = delete;
  CleanupRegistry& operator=(const CleanupRegistry&) = delete;

  Handle add(std::string name, Action action);

  /**
   * @brief Drop an action without running it (owner released the resource itself)
   */
  void remove(Handle handle);

  /**
   * @brief Run and clear every pending action
   */
  void run_all();

  size_t size() const;

 private:
  struct Entry {
    Handle handle;
    std::string name;
    Action action;
  };

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
  Handle next_handle_ = 1;
};

}  // namespace concurrency
}  // namespace serlink
