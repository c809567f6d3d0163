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

#include "serlink/transport/tcp/tcp_listener.hpp"

#include "serlink/diagnostics/error_handler.hpp"
#include "serlink/diagnostics/exceptions.hpp"
#include "serlink/diagnostics/logger.hpp"

namespace serlink {
namespace transport {

TcpListener::TcpListener(net::io_context& ioc) : ioc_(ioc), acceptor_(ioc) {}

TcpListener::~TcpListener() { close(); }

void TcpListener::open(const std::string& address, uint16_t port, int backlog) {
  boost::system::error_code ec;
  const auto bind_address = net::ip::make_address(address, ec);
  if (ec) {
    throw diagnostics::ConnectionException("invalid bind address " + address + ": " + ec.message(),
                                           ErrorCode::BindFailed, "tcp_listener", "open");
  }
  const tcp::endpoint endpoint(bind_address, port);

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    SERLINK_LOG_ERROR("tcp_listener", "open", "Failed to open acceptor: " + ec.message());
    diagnostics::error_reporting::report_connection_error("tcp_listener", "open", ec, false, ErrorCode::BindFailed);
    throw diagnostics::ConnectionException("failed to open listener: " + ec.message(), ErrorCode::BindFailed,
                                           "tcp_listener", "open");
  }

  acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if (ec) {
    SERLINK_LOG_WARNING("tcp_listener", "open", "SO_REUSEADDR not applied: " + ec.message());
  }

  acceptor_.bind(endpoint, ec);
  if (ec) {
    const ErrorCode code = (ec == net::error::address_in_use) ? ErrorCode::PortInUse : ErrorCode::BindFailed;
    const std::string message = "Failed to bind to " + address + ":" + std::to_string(port) + " - " + ec.message();
    SERLINK_LOG_ERROR("tcp_listener", "bind", message);
    diagnostics::error_reporting::report_connection_error("tcp_listener", "bind", ec, false, code);
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    throw diagnostics::ConnectionException(message, code, "tcp_listener", "bind");
  }

  acceptor_.listen(backlog, ec);
  if (!ec) {
    acceptor_.non_blocking(true, ec);
  }
  if (ec) {
    const std::string message = "Failed to listen on port " + std::to_string(port) + " - " + ec.message();
    SERLINK_LOG_ERROR("tcp_listener", "listen", message);
    diagnostics::error_reporting::report_connection_error("tcp_listener", "listen", ec, false, ErrorCode::BindFailed);
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    throw diagnostics::ConnectionException(message, ErrorCode::BindFailed, "tcp_listener", "listen");
  }

  SERLINK_LOG_INFO("tcp_listener", "bind", "Listening on " + address + ":" + std::to_string(local_port()));
}

std::optional<tcp::socket> TcpListener::accept(const WaitContext& ctx, std::chrono::milliseconds timeout,
                                               boost::system::error_code& ec) {
  ec.clear();
  if (!acceptor_.is_open()) {
    ec = net::error::bad_descriptor;
    return std::nullopt;
  }

  const WaitResult ready = wait_readable(acceptor_.native_handle(), ctx, timeout, ec);
  if (ready != WaitResult::Ready) {
    return std::nullopt;
  }

  tcp::socket socket(ioc_);
  acceptor_.accept(socket, ec);
  if (ec == net::error::would_block || ec == net::error::try_again || ec == net::error::connection_aborted) {
    // Peer went away between readiness and accept
    ec.clear();
    return std::nullopt;
  }
  if (ec) {
    return std::nullopt;
  }
  return std::optional<tcp::socket>(std::move(socket));
}

uint16_t TcpListener::local_port() const {
  boost::system::error_code ec;
  auto endpoint = acceptor_.local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

bool TcpListener::is_open() const { return acceptor_.is_open(); }

void TcpListener::close() {
  if (!acceptor_.is_open()) {
    return;
  }
  boost::system::error_code ec;
  acceptor_.close(ec);
  if (ec) {
    SERLINK_LOG_DEBUG("tcp_listener", "close", "Error closing acceptor: " + ec.message());
  }
}

}  // namespace transport
}  // namespace serlink
