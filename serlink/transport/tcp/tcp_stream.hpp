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
#include <string>

#include "serlink/interface/stream_endpoint.hpp"

namespace serlink {
namespace transport {

namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief Connected TCP socket in non-blocking mode
 *
 * shutdown() may be called from another thread to wake a reader; every
 * other member is used by one thread at a time.
 */
class TcpStream : public interface::StreamEndpoint {
 public:
  explicit TcpStream(tcp::socket socket);
  ~TcpStream() override;

  TcpStream(const TcpStream&) = delete;
  TcpStream& operator=(const TcpStream&) = delete;

  int native_handle() override;
  std::size_t read_some(const net::mutable_buffer& buffer, boost::system::error_code& ec) override;
  std::size_t write_some(const net::const_buffer& buffer, boost::system::error_code& ec) override;
  bool is_open() const override;
  void close(boost::system::error_code& ec) override;
  std::string name() const override;

  /**
   * @brief Half-close both directions; pending and future reads see EOF
   */
  void shutdown();

  /**
   * @brief "ip:port" of the peer, "unknown" if it could not be determined
   */
  const std::string& remote_address() const noexcept { return remote_; }

 private:
  tcp::socket socket_;
  std::string remote_;
};

/**
 * @brief "ip:port" of an endpoint
 */
std::string to_string(const tcp::endpoint& endpoint);

}  // namespace transport
}  // namespace serlink
