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
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "serlink/transport/stream_io.hpp"
#include "serlink/transport/tcp/tcp_stream.hpp"

namespace serlink {
namespace server {

/**
 * @brief One accepted TCP peer of the bridge
 */
class ClientConnection {
 public:
  using Id = uint64_t;

  ClientConnection(Id id, std::unique_ptr<transport::TcpStream> stream);

  Id id() const noexcept { return id_; }
  const std::string& remote_address() const noexcept { return remote_; }
  std::chrono::system_clock::time_point joined_at() const noexcept { return joined_at_; }

  /**
   * @brief Stream read by this client's worker thread
   */
  transport::TcpStream& stream() noexcept { return *stream_; }

  /**
   * @brief Write a whole chunk to the peer, serialized with other senders
   * @return timed_out if the peer did not drain the chunk within @p timeout
   */
  boost::system::error_code send(const uint8_t* data, size_t size, const transport::WaitContext& ctx,
                                 std::chrono::milliseconds timeout);

  /**
   * @brief Shut the socket down so the worker sees end of stream. Thread-safe.
   */
  void shutdown();

  /**
   * @brief Close the socket; only for connections that have no worker
   */
  void close();

  bool is_shut_down() const noexcept { return shut_down_.load(); }

 private:
  Id id_;
  std::unique_ptr<transport::TcpStream> stream_;
  std::string remote_;
  std::chrono::system_clock::time_point joined_at_;
  std::mutex send_mutex_;
  std::atomic<bool> shut_down_{false};
};

}  // namespace server
}  // namespace serlink
