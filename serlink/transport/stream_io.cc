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

#include "serlink/transport/stream_io.hpp"

#include <poll.h>

#include <algorithm>
#include <boost/asio/error.hpp>
#include <cerrno>

namespace serlink {
namespace transport {

namespace net = boost::asio;

namespace {

WaitResult wait_for_events(int fd, short events, const WaitContext& ctx, std::chrono::milliseconds timeout,
                           boost::system::error_code& ec) {
  ec.clear();
  if (ctx.cancelled()) {
    return WaitResult::Interrupted;
  }
  if (fd < 0) {
    ec = net::error::bad_descriptor;
    return WaitResult::Error;
  }

  pollfd fds[2];
  nfds_t count = 1;
  fds[0].fd = fd;
  fds[0].events = events;
  fds[0].revents = 0;
  if (ctx.token != nullptr && ctx.token->wakeup_fd() >= 0) {
    fds[1].fd = ctx.token->wakeup_fd();
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    count = 2;
  }

  const int rc = ::poll(fds, count, static_cast<int>(std::max<std::chrono::milliseconds::rep>(timeout.count(), 0)));
  if (rc < 0) {
    if (errno == EINTR) {
      return WaitResult::Timeout;
    }
    ec = boost::system::error_code(errno, boost::system::system_category());
    return WaitResult::Error;
  }
  if (count == 2 && (fds[1].revents & POLLIN)) {
    return WaitResult::Interrupted;
  }
  if (ctx.cancelled()) {
    return WaitResult::Interrupted;
  }
  if (rc == 0) {
    return WaitResult::Timeout;
  }
  if (fds[0].revents & POLLNVAL) {
    ec = net::error::bad_descriptor;
    return WaitResult::Error;
  }
  if (fds[0].revents & (events | POLLHUP | POLLERR)) {
    return WaitResult::Ready;
  }
  return WaitResult::Timeout;
}

}  // namespace

WaitResult wait_readable(int fd, const WaitContext& ctx, std::chrono::milliseconds timeout,
                         boost::system::error_code& ec) {
  return wait_for_events(fd, POLLIN, ctx, timeout, ec);
}

WaitResult wait_writable(int fd, const WaitContext& ctx, std::chrono::milliseconds timeout,
                         boost::system::error_code& ec) {
  return wait_for_events(fd, POLLOUT, ctx, timeout, ec);
}

boost::system::error_code write_all(interface::StreamEndpoint& sink, const uint8_t* data, size_t size,
                                    const WaitContext& ctx, std::chrono::milliseconds deadline) {
  using clock = std::chrono::steady_clock;
  const bool bounded = deadline.count() > 0;
  const auto give_up_at = clock::now() + deadline;

  size_t written = 0;
  boost::system::error_code ec;
  while (written < size) {
    auto wait = ctx.poll_interval;
    if (bounded) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(give_up_at - clock::now());
      if (left.count() <= 0) {
        return net::error::timed_out;
      }
      wait = std::min(wait, left);
    }

    const WaitResult ready = wait_writable(sink.native_handle(), ctx, wait, ec);
    if (ready == WaitResult::Interrupted) {
      return net::error::operation_aborted;
    }
    if (ready == WaitResult::Error) {
      return ec;
    }
    if (ready == WaitResult::Timeout) {
      continue;
    }

    const size_t n = sink.write_some(net::buffer(data + written, size - written), ec);
    if (ec == net::error::would_block || ec == net::error::try_again || ec == net::error::interrupted) {
      ec.clear();
      continue;
    }
    if (ec) {
      return ec;
    }
    written += n;
  }
  return {};
}

}  // namespace transport
}  // namespace serlink
