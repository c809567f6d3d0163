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

#include "serlink/transport/tcp/tcp_connector.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <netinet/tcp.h>

#include <algorithm>
#include <cerrno>

namespace serlink {
namespace transport {

TcpConnector::TcpConnector(net::io_context& ioc) : ioc_(ioc) {}

std::optional<tcp::socket> TcpConnector::connect(const std::string& host, uint16_t port,
                                                 std::chrono::milliseconds timeout, const WaitContext& ctx,
                                                 boost::system::error_code& ec) {
  using clock = std::chrono::steady_clock;
  ec.clear();

  tcp::resolver resolver(ioc_);
  auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    return std::nullopt;
  }

  tcp::socket socket(ioc_);
  bool done = false;
  boost::system::error_code result;

  ioc_.restart();
  net::async_connect(socket, endpoints, [&](const boost::system::error_code& connect_ec, const tcp::endpoint&) {
    result = connect_ec;
    done = true;
  });

  const auto give_up_at = clock::now() + timeout;
  bool timed_out = false;
  while (!done) {
    if (ctx.cancelled()) {
      break;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(give_up_at - clock::now());
    if (left.count() <= 0) {
      timed_out = true;
      break;
    }
    ioc_.run_for(std::min(left, ctx.poll_interval));
  }

  if (!done) {
    // Abort the pending operation and let its handler run
    boost::system::error_code ignored;
    socket.close(ignored);
    ioc_.restart();
    ioc_.run();
    ec = timed_out ? net::error::timed_out : net::error::operation_aborted;
    return std::nullopt;
  }

  if (result) {
    ec = result;
    return std::nullopt;
  }
  return std::optional<tcp::socket>(std::move(socket));
}

void apply_keepalive(tcp::socket& socket, const KeepaliveOptions& options, boost::system::error_code& ec) {
  ec.clear();
  socket.set_option(net::socket_base::keep_alive(options.enabled), ec);
  if (ec || !options.enabled) {
    return;
  }

  const int fd = socket.native_handle();
  const struct {
    int name;
    int value;
  } tuning[] = {{TCP_KEEPIDLE, options.idle_s}, {TCP_KEEPINTVL, options.interval_s}, {TCP_KEEPCNT, options.count}};
  for (const auto& opt : tuning) {
    if (::setsockopt(fd, IPPROTO_TCP, opt.name, &opt.value, sizeof(opt.value)) != 0) {
      ec = boost::system::error_code(errno, boost::system::system_category());
      return;
    }
  }
}

}  // namespace transport
}  // namespace serlink
