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

#include "serlink/transport/tcp/tcp_stream.hpp"

#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace transport {

std::string to_string(const tcp::endpoint& endpoint) {
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

TcpStream::TcpStream(tcp::socket socket) : socket_(std::move(socket)), remote_("unknown") {
  boost::system::error_code ec;
  auto rep = socket_.remote_endpoint(ec);
  if (!ec) {
    remote_ = to_string(rep);
  }

  socket_.non_blocking(true, ec);
  if (ec) {
    SERLINK_LOG_WARNING("tcp", "configure", "Failed to set non-blocking mode for " + remote_ + ": " + ec.message());
  }
  socket_.set_option(tcp::no_delay(true), ec);
  if (ec) {
    SERLINK_LOG_DEBUG("tcp", "configure", "TCP_NODELAY not applied for " + remote_ + ": " + ec.message());
  }
}

TcpStream::~TcpStream() {
  boost::system::error_code ec;
  close(ec);
}

int TcpStream::native_handle() { return socket_.is_open() ? socket_.native_handle() : -1; }

std::size_t TcpStream::read_some(const net::mutable_buffer& buffer, boost::system::error_code& ec) {
  return socket_.read_some(buffer, ec);
}

std::size_t TcpStream::write_some(const net::const_buffer& buffer, boost::system::error_code& ec) {
  return socket_.write_some(buffer, ec);
}

bool TcpStream::is_open() const { return socket_.is_open(); }

void TcpStream::close(boost::system::error_code& ec) {
  ec.clear();
  if (!socket_.is_open()) {
    return;
  }
  boost::system::error_code ignored;
  socket_.shutdown(tcp::socket::shutdown_both, ignored);  // ENOTCONN after a peer reset is expected
  socket_.close(ec);
}

std::string TcpStream::name() const { return "tcp:" + remote_; }

void TcpStream::shutdown() {
  boost::system::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != net::error::not_connected) {
    SERLINK_LOG_DEBUG("tcp", "shutdown", remote_ + ": " + ec.message());
  }
}

}  // namespace transport
}  // namespace serlink
