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

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "serlink/transport/stream_io.hpp"

namespace serlink {
namespace transport {

namespace net = boost::asio;
using tcp = net::ip::tcp;

struct KeepaliveOptions {
  bool enabled = true;
  int idle_s = 30;
  int interval_s = 5;
  int count = 3;
};

/**
 * @brief Resolves and connects with a deadline that a stop request cuts short
 */
class TcpConnector {
 public:
  explicit TcpConnector(net::io_context& ioc);

  /**
   * @return the connected socket, or nullopt with @p ec set to the failure
   *         (operation_aborted when cancelled, timed_out on deadline)
   */
  std::optional<tcp::socket> connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
                                     const WaitContext& ctx, boost::system::error_code& ec);

 private:
  net::io_context& ioc_;
};

/**
 * @brief Enable SO_KEEPALIVE and tune TCP_KEEPIDLE/KEEPINTVL/KEEPCNT
 */
void apply_keepalive(tcp::socket& socket, const KeepaliveOptions& options, boost::system::error_code& ec);

}  // namespace transport
}  // namespace serlink
