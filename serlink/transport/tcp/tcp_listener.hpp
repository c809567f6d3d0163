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

/**
 * @brief Listening socket with a bounded, interruptible accept
 */
class TcpListener {
 public:
  explicit TcpListener(net::io_context& ioc);
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  /**
   * @brief Open, set SO_REUSEADDR, bind and listen
   * @param port 0 picks an ephemeral port, see local_port()
   * @throws diagnostics::ConnectionException with PortInUse or BindFailed
   */
  void open(const std::string& address, uint16_t port, int backlog);

  /**
   * @brief Wait up to @p timeout for a pending connection
   * @return the accepted socket, or nullopt on timeout, interruption or error (@p ec set on error)
   */
  std::optional<tcp::socket> accept(const WaitContext& ctx, std::chrono::milliseconds timeout,
                                    boost::system::error_code& ec);

  uint16_t local_port() const;
  bool is_open() const;
  void close();

 private:
  net::io_context& ioc_;
  tcp::acceptor acceptor_;
};

}  // namespace transport
}  // namespace serlink
