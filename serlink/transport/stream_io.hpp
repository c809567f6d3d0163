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
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include "serlink/concurrency/shutdown_token.hpp"
#include "serlink/interface/stream_endpoint.hpp"

namespace serlink {
namespace transport {

/**
 * @brief What a bounded wait observes besides the descriptor itself
 */
struct WaitContext {
  const concurrency::ShutdownToken* token = nullptr;  // process-wide stop
  const std::atomic<bool>* halt = nullptr;             // stop of one relay
  std::chrono::milliseconds poll_interval{100};

  bool cancelled() const noexcept {
    return (token != nullptr && token->stop_requested()) || (halt != nullptr && halt->load(std::memory_order_acquire));
  }
};

enum class WaitResult { Ready, Timeout, Interrupted, Error };

/**
 * @brief One poll() on @p fd and the shutdown wakeup descriptor
 *
 * Hang-up and error conditions report Ready so the following read or write
 * surfaces the actual error. Error is only returned when poll itself fails
 * or the descriptor is invalid; @p ec then holds the reason.
 */
WaitResult wait_readable(int fd, const WaitContext& ctx, std::chrono::milliseconds timeout,
                         boost::system::error_code& ec);
WaitResult wait_writable(int fd, const WaitContext& ctx, std::chrono::milliseconds timeout,
                         boost::system::error_code& ec);

/**
 * @brief Write the whole buffer, waiting for writability between partial writes
 *
 * @param deadline Longest time without completing the write, zero for none.
 * @return operation_aborted when cancelled, timed_out when the deadline
 *         expired, otherwise the endpoint's error (empty on success)
 */
boost::system::error_code write_all(interface::StreamEndpoint& sink, const uint8_t* data, size_t size,
                                    const WaitContext& ctx,
                                    std::chrono::milliseconds deadline = std::chrono::milliseconds::zero());

}  // namespace transport
}  // namespace serlink
